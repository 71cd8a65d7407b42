#pragma once

#include <coderag/core/types.h>

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace coderag::vector {

/**
 * Retrieval tier a record was produced by
 */
enum class BackendCapability { FullSemantic, FeatureHeuristic, KeywordOnly };

std::string_view capabilityToString(BackendCapability capability);
std::optional<BackendCapability> capabilityFromString(std::string_view name);

/**
 * Coarse classification of what a chunk contains
 */
enum class ContentType {
    ClassDefinition,
    FunctionDefinition,
    Imports,
    TestCode,
    Configuration,
    Documentation,
    GeneralCode
};

std::string_view contentTypeToString(ContentType type);
std::optional<ContentType> contentTypeFromString(std::string_view name);

// First matching rule wins: class+def, def/function, imports, tests, config, docs
ContentType classifyContent(std::string_view text);

struct ChunkFlags {
    bool has_functions = false;
    bool has_imports = false;
    bool has_security = false;
};

ChunkFlags detectChunkFlags(std::string_view text);

// Whitespace-separated token count
size_t countTokens(std::string_view text);

/**
 * Denormalized analysis facts attached to a chunk at ingestion.
 * Never used for similarity, only for filtering and display.
 */
struct Metadata {
    std::string chunk_id;
    std::string file_name;
    std::string file_path;
    std::string language = "unknown";
    size_t issue_count = 0;
    std::vector<std::string> issue_categories; // Sorted, unique
    double complexity_score = 0.0;
    size_t chunk_index = 0;
    size_t start_line = 1;
    size_t end_line = 1;
    ContentType content_type = ContentType::GeneralCode;
    bool has_functions = false;
    bool has_imports = false;
    bool has_security = false;
    size_t token_count = 0;
};

struct Embedding {
    std::string chunk_id;
    std::vector<float> vector; // Empty for the keyword tier
    BackendCapability backend_tag = BackendCapability::FeatureHeuristic;
};

/**
 * The unit stored in and returned by an index
 */
struct IndexRecord {
    Embedding embedding;
    Metadata metadata;
    std::string text;

    const std::string& id() const { return metadata.chunk_id; }
};

struct ScoredRecord {
    IndexRecord record;
    float score = 0.0f;
};

// Descending by score, at most k entries
using RetrievalResult = std::vector<ScoredRecord>;

/**
 * Metadata constraints for structured search; unset fields match everything
 */
struct SearchFilter {
    std::optional<std::string> language;
    std::optional<std::string> file_name;
    std::optional<ContentType> content_type;
    std::optional<bool> has_issues;
    std::optional<double> min_complexity;

    bool hasFilters() const {
        return language.has_value() || file_name.has_value() || content_type.has_value() ||
               has_issues.has_value() || min_complexity.has_value();
    }

    bool matches(const Metadata& metadata) const;
};

} // namespace coderag::vector
