#pragma once

#include <coderag/chunking/code_chunker.h>
#include <coderag/core/types.h>
#include <coderag/search/backend_selector.h>
#include <coderag/vector/feature_embedder.h>

#include <filesystem>
#include <string>
#include <string_view>

namespace coderag::config {

/**
 * Settings for one RetrievalEngine.
 *
 * JSON layout (every key optional):
 *   {"chunking": {"max_chunk_chars", "overlap_chars"},
 *    "features": {"dimension", "definition_weight", "import_weight",
 *                 "risk_weight", "structure_weight", "vocabulary_weight"},
 *    "selector": {"embedding_provider"},
 *    "engine":   {"data_dir", "enable_persistence", "default_top_k",
 *                 "min_similarity", "min_chunk_chars", "max_snippet_chars"},
 *    "logging":  {"level"}}
 */
struct EngineConfig {
    chunking::ChunkerConfig chunker;
    vector::FeatureEmbedderConfig features;
    search::SelectorConfig selector;

    std::filesystem::path data_dir; // Empty: resolve_data_dir()
    bool enable_persistence = true;
    size_t default_top_k = 3;
    float min_similarity = 0.01f;
    size_t min_chunk_chars = 30;
    size_t max_snippet_chars = 0; // 0 = unlimited
    std::string log_level = "info";
};

Result<EngineConfig> parseEngineConfig(std::string_view json_text);
std::string dumpEngineConfig(const EngineConfig& config);

Result<EngineConfig> loadEngineConfig(const std::filesystem::path& path);
Result<void> saveEngineConfig(const EngineConfig& config, const std::filesystem::path& path);

// CODERAG_DATA_DIR, CODERAG_EMBEDDING_PROVIDER, CODERAG_LOG_LEVEL
void applyEnvironmentOverrides(EngineConfig& config);

Result<void> validateEngineConfig(const EngineConfig& config);

// Sets the global spdlog level; unknown names leave it unchanged
Result<void> applyLogLevel(const std::string& level);

} // namespace coderag::config
