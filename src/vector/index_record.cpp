#include <coderag/vector/index_record.h>

#include <algorithm>
#include <cctype>
#include <regex>

namespace coderag::vector {

namespace {

std::string toLower(std::string_view text) {
    std::string out(text);
    std::transform(out.begin(), out.end(), out.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return out;
}

std::string_view trimLeft(std::string_view text) {
    size_t pos = 0;
    while (pos < text.size() && std::isspace(static_cast<unsigned char>(text[pos]))) {
        ++pos;
    }
    return text.substr(pos);
}

bool contains(std::string_view haystack, std::string_view needle) {
    return haystack.find(needle) != std::string_view::npos;
}

} // namespace

std::string_view capabilityToString(BackendCapability capability) {
    switch (capability) {
        case BackendCapability::FullSemantic:
            return "full_semantic";
        case BackendCapability::FeatureHeuristic:
            return "feature_heuristic";
        case BackendCapability::KeywordOnly:
            return "keyword_only";
    }
    return "keyword_only";
}

std::optional<BackendCapability> capabilityFromString(std::string_view name) {
    if (name == "full_semantic") {
        return BackendCapability::FullSemantic;
    }
    if (name == "feature_heuristic") {
        return BackendCapability::FeatureHeuristic;
    }
    if (name == "keyword_only") {
        return BackendCapability::KeywordOnly;
    }
    return std::nullopt;
}

std::string_view contentTypeToString(ContentType type) {
    switch (type) {
        case ContentType::ClassDefinition:
            return "class_definition";
        case ContentType::FunctionDefinition:
            return "function_definition";
        case ContentType::Imports:
            return "imports";
        case ContentType::TestCode:
            return "test_code";
        case ContentType::Configuration:
            return "configuration";
        case ContentType::Documentation:
            return "documentation";
        case ContentType::GeneralCode:
            return "general_code";
    }
    return "general_code";
}

std::optional<ContentType> contentTypeFromString(std::string_view name) {
    static constexpr ContentType kAll[] = {
        ContentType::ClassDefinition, ContentType::FunctionDefinition, ContentType::Imports,
        ContentType::TestCode,        ContentType::Configuration,      ContentType::Documentation,
        ContentType::GeneralCode};
    for (auto type : kAll) {
        if (contentTypeToString(type) == name) {
            return type;
        }
    }
    return std::nullopt;
}

ContentType classifyContent(std::string_view text) {
    const std::string lower = toLower(text);

    if (contains(lower, "class ") && contains(lower, "def ")) {
        return ContentType::ClassDefinition;
    }
    if (contains(lower, "def ") || contains(lower, "function ")) {
        return ContentType::FunctionDefinition;
    }
    if (contains(lower, "import ") || contains(lower, "from ")) {
        return ContentType::Imports;
    }
    if (contains(lower, "test") && (contains(lower, "def test") || contains(lower, "class test"))) {
        return ContentType::TestCode;
    }
    if (contains(lower, "config") || contains(lower, "setting") || contains(lower, "constant")) {
        return ContentType::Configuration;
    }
    auto trimmed = trimLeft(lower);
    if (trimmed.substr(0, 1) == "#" || trimmed.substr(0, 3) == "\"\"\"") {
        return ContentType::Documentation;
    }
    return ContentType::GeneralCode;
}

ChunkFlags detectChunkFlags(std::string_view text) {
    static const std::regex functionRegex(R"(\b(def|function|class)\b)");
    static const std::regex importRegex(R"(\b(import|from|include|require)\b)");
    static const std::regex securityRegex(R"(\b(eval|exec|pickle|sql)\b)", std::regex::icase);

    ChunkFlags flags;
    auto begin = text.begin();
    auto end = text.end();
    flags.has_functions = std::regex_search(begin, end, functionRegex);
    flags.has_imports = std::regex_search(begin, end, importRegex);
    flags.has_security = std::regex_search(begin, end, securityRegex);
    return flags;
}

size_t countTokens(std::string_view text) {
    size_t count = 0;
    bool inToken = false;
    for (char c : text) {
        bool space = std::isspace(static_cast<unsigned char>(c)) != 0;
        if (!space && !inToken) {
            ++count;
        }
        inToken = !space;
    }
    return count;
}

bool SearchFilter::matches(const Metadata& metadata) const {
    if (language && toLower(*language) != toLower(metadata.language)) {
        return false;
    }
    if (file_name && *file_name != metadata.file_name) {
        return false;
    }
    if (content_type && *content_type != metadata.content_type) {
        return false;
    }
    if (has_issues && *has_issues != (metadata.issue_count > 0)) {
        return false;
    }
    if (min_complexity && metadata.complexity_score < *min_complexity) {
        return false;
    }
    return true;
}

} // namespace coderag::vector
