#include <coderag/config/config_helpers.h>
#include <coderag/config/engine_config.h>

#include <fmt/format.h>
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include <fstream>
#include <sstream>

namespace coderag::config {

using json = nlohmann::json;

namespace {

template <typename T> void readInto(const json& section, const char* key, T& target) {
    if (auto it = section.find(key); it != section.end() && !it->is_null()) {
        target = it->get<T>();
    }
}

const json& sectionOf(const json& root, const char* name) {
    static const json empty = json::object();
    auto it = root.find(name);
    return it != root.end() && it->is_object() ? *it : empty;
}

} // namespace

Result<EngineConfig> parseEngineConfig(std::string_view json_text) {
    EngineConfig config;
    try {
        auto root = json::parse(json_text);
        if (!root.is_object()) {
            return Error{ErrorCode::InvalidData, "Config root must be a JSON object"};
        }

        const auto& chunkingJson = sectionOf(root, "chunking");
        readInto(chunkingJson, "max_chunk_chars", config.chunker.max_chunk_chars);
        readInto(chunkingJson, "overlap_chars", config.chunker.overlap_chars);

        const auto& featuresJson = sectionOf(root, "features");
        readInto(featuresJson, "dimension", config.features.dimension);
        readInto(featuresJson, "definition_weight", config.features.definition_weight);
        readInto(featuresJson, "import_weight", config.features.import_weight);
        readInto(featuresJson, "risk_weight", config.features.risk_weight);
        readInto(featuresJson, "structure_weight", config.features.structure_weight);
        readInto(featuresJson, "vocabulary_weight", config.features.vocabulary_weight);

        readInto(sectionOf(root, "selector"), "embedding_provider",
                 config.selector.embedding_provider);

        const auto& engineJson = sectionOf(root, "engine");
        std::string dataDir;
        readInto(engineJson, "data_dir", dataDir);
        if (!dataDir.empty()) {
            config.data_dir = expand_tilde(dataDir);
        }
        readInto(engineJson, "enable_persistence", config.enable_persistence);
        readInto(engineJson, "default_top_k", config.default_top_k);
        readInto(engineJson, "min_similarity", config.min_similarity);
        readInto(engineJson, "min_chunk_chars", config.min_chunk_chars);
        readInto(engineJson, "max_snippet_chars", config.max_snippet_chars);

        readInto(sectionOf(root, "logging"), "level", config.log_level);
    } catch (const json::exception& e) {
        return Error{ErrorCode::InvalidData, std::string("Invalid config: ") + e.what()};
    }

    if (auto valid = validateEngineConfig(config); !valid) {
        return valid.error();
    }
    return config;
}

std::string dumpEngineConfig(const EngineConfig& config) {
    json root;
    root["chunking"] = {{"max_chunk_chars", config.chunker.max_chunk_chars},
                        {"overlap_chars", config.chunker.overlap_chars}};
    root["features"] = {{"dimension", config.features.dimension},
                        {"definition_weight", config.features.definition_weight},
                        {"import_weight", config.features.import_weight},
                        {"risk_weight", config.features.risk_weight},
                        {"structure_weight", config.features.structure_weight},
                        {"vocabulary_weight", config.features.vocabulary_weight}};
    root["selector"] = {{"embedding_provider", config.selector.embedding_provider}};
    root["engine"] = {{"data_dir", config.data_dir.string()},
                      {"enable_persistence", config.enable_persistence},
                      {"default_top_k", config.default_top_k},
                      {"min_similarity", config.min_similarity},
                      {"min_chunk_chars", config.min_chunk_chars},
                      {"max_snippet_chars", config.max_snippet_chars}};
    root["logging"] = {{"level", config.log_level}};
    return root.dump(2);
}

Result<EngineConfig> loadEngineConfig(const std::filesystem::path& path) {
    std::ifstream file(path);
    if (!file) {
        return Error{ErrorCode::FileNotFound, "Cannot open config file: " + path.string()};
    }
    std::stringstream buffer;
    buffer << file.rdbuf();
    auto config = parseEngineConfig(buffer.str());
    if (config) {
        spdlog::debug("Loaded configuration from {}", path.string());
    }
    return config;
}

Result<void> saveEngineConfig(const EngineConfig& config, const std::filesystem::path& path) {
    std::error_code ec;
    if (path.has_parent_path()) {
        std::filesystem::create_directories(path.parent_path(), ec);
        if (ec) {
            return Error{ErrorCode::WriteError, "Cannot create " + path.parent_path().string()};
        }
    }
    auto tempPath = path;
    tempPath += ".tmp";
    {
        std::ofstream out(tempPath, std::ios::trunc);
        if (!out) {
            return Error{ErrorCode::WriteError, "Cannot write " + tempPath.string()};
        }
        out << dumpEngineConfig(config) << '\n';
        out.close();
        if (!out) {
            return Error{ErrorCode::WriteError, "Failed writing " + tempPath.string()};
        }
    }
    std::filesystem::rename(tempPath, path, ec);
    if (ec) {
        return Error{ErrorCode::WriteError, "Cannot rename into " + path.string()};
    }
    return Result<void>();
}

void applyEnvironmentOverrides(EngineConfig& config) {
    if (auto dataDir = env_value("CODERAG_DATA_DIR")) {
        config.data_dir = expand_tilde(*dataDir);
    }
    if (auto provider = env_value("CODERAG_EMBEDDING_PROVIDER")) {
        trim(*provider);
        config.selector.embedding_provider = *provider;
    }
    if (auto level = env_value("CODERAG_LOG_LEVEL")) {
        trim(*level);
        config.log_level = *level;
    }
}

Result<void> validateEngineConfig(const EngineConfig& config) {
    if (config.chunker.max_chunk_chars == 0) {
        return Error{ErrorCode::InvalidArgument, "chunking.max_chunk_chars must be positive"};
    }
    if (config.chunker.overlap_chars >= config.chunker.max_chunk_chars) {
        return Error{ErrorCode::InvalidArgument,
                     "chunking.overlap_chars must be smaller than max_chunk_chars"};
    }
    if (config.features.dimension > vector::CodeFeatureEmbedder::kMaxDimension) {
        return Error{ErrorCode::InvalidArgument,
                     fmt::format("features.dimension must be at most {}",
                                 vector::CodeFeatureEmbedder::kMaxDimension)};
    }
    if (config.default_top_k == 0) {
        return Error{ErrorCode::InvalidArgument, "engine.default_top_k must be positive"};
    }
    if (config.min_similarity < 0.0f || config.min_similarity >= 1.0f) {
        return Error{ErrorCode::InvalidArgument, "engine.min_similarity must be in [0, 1)"};
    }
    return Result<void>();
}

Result<void> applyLogLevel(const std::string& level) {
    auto parsed = spdlog::level::from_str(level);
    // from_str maps unknown names to off
    if (parsed == spdlog::level::off && level != "off") {
        return Error{ErrorCode::InvalidArgument, "Unknown log level: " + level};
    }
    spdlog::set_level(parsed);
    return Result<void>();
}

} // namespace coderag::config
