#include <coderag/analysis/analysis_results.h>
#include <coderag/config/config_helpers.h>
#include <coderag/config/engine_config.h>
#include <coderag/detection/language_detector.h>
#include <coderag/search/retrieval_engine.h>
#include <coderag/version.hpp>

#include <CLI/CLI.hpp>
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>
#include <fmt/format.h>

#include <algorithm>
#include <cctype>
#include <cstdint>
#include <filesystem>
#include <iostream>
#include <string>
#include <vector>

namespace fs = std::filesystem;
using json = nlohmann::json;

namespace {

constexpr std::uintmax_t kMaxFileBytes = 1024 * 1024;

bool isSupported(const fs::path& path) {
    auto ext = path.extension().string();
    std::transform(ext.begin(), ext.end(), ext.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    const auto& supported = coderag::detection::supportedExtensions();
    return std::find(supported.begin(), supported.end(), ext) != supported.end();
}

bool acceptFile(const fs::path& path) {
    if (!isSupported(path)) {
        return false;
    }
    std::error_code ec;
    auto size = fs::file_size(path, ec);
    if (ec) {
        spdlog::warn("Cannot stat {}: {}", path.string(), ec.message());
        return false;
    }
    if (size > kMaxFileBytes) {
        spdlog::info("Skipping {} ({} bytes, limit {})", path.string(), size, kMaxFileBytes);
        return false;
    }
    return true;
}

std::vector<coderag::search::SourceFile> collectSources(const std::vector<std::string>& roots) {
    std::vector<coderag::search::SourceFile> files;
    for (const auto& root : roots) {
        std::error_code ec;
        if (fs::is_regular_file(root, ec)) {
            if (acceptFile(root)) {
                files.push_back({fs::path(root), std::nullopt, std::nullopt, std::nullopt});
            }
            continue;
        }
        if (!fs::is_directory(root, ec)) {
            spdlog::warn("Not a file or directory: {}", root);
            continue;
        }
        for (fs::recursive_directory_iterator it(root, fs::directory_options::skip_permission_denied,
                                                 ec),
             end;
             it != end; it.increment(ec)) {
            if (ec) {
                spdlog::warn("Error walking {}: {}", root, ec.message());
                break;
            }
            const auto name = it->path().filename().string();
            if (it->is_directory(ec) && !name.empty() && name.front() == '.') {
                it.disable_recursion_pending();
                continue;
            }
            if (it->is_regular_file(ec) && acceptFile(it->path())) {
                files.push_back({it->path(), std::nullopt, std::nullopt, std::nullopt});
            }
        }
    }
    std::sort(files.begin(), files.end(),
              [](const auto& a, const auto& b) { return a.path < b.path; });
    return files;
}

} // namespace

int main(int argc, char* argv[]) {
    try {
        spdlog::set_pattern("[%H:%M:%S] [%l] %v");

        CLI::App app{"Semantic code retrieval", "coderag"};
        app.set_version_flag("--version", CODERAG_VERSION_STRING);
        app.require_subcommand(1);

        std::string configPath;
        std::string dataDir;
        std::string provider;
        bool verbose = false;
        app.add_option("--config", configPath, "Configuration file (JSON)");
        app.add_option("--data-dir", dataDir, "Directory for index snapshots");
        app.add_option("--provider", provider, "Embedding provider name (e.g. Mock)");
        app.add_flag("-v,--verbose", verbose, "Enable debug logging");

        auto* indexCmd = app.add_subcommand("index", "Index source files or directories");
        std::vector<std::string> indexPaths;
        std::string analysisPath;
        indexCmd->add_option("paths", indexPaths, "Files or directories to index")->required();
        indexCmd->add_option("--analysis", analysisPath, "Static analysis results (JSON)")
            ->check(CLI::ExistingFile);

        auto* queryCmd = app.add_subcommand("query", "Retrieve context for a question");
        std::string question;
        std::vector<std::string> queryPaths;
        size_t topK = 0;
        queryCmd->add_option("text", question, "Question to answer")->required();
        queryCmd->add_option("-k,--top-k", topK, "Number of blocks to return")
            ->check(CLI::Range(1, 100));
        queryCmd->add_option("-p,--paths", queryPaths, "Corpus to load the snapshot for");

        auto* statsCmd = app.add_subcommand("stats", "Show index statistics");
        std::vector<std::string> statsPaths;
        statsCmd->add_option("paths", statsPaths, "Corpus to load the snapshot for");

        CLI11_PARSE(app, argc, argv);

        coderag::config::EngineConfig config;
        auto resolvedConfig = coderag::config::get_config_path(configPath);
        std::error_code ec;
        if (fs::exists(resolvedConfig, ec)) {
            auto loaded = coderag::config::loadEngineConfig(resolvedConfig);
            if (!loaded) {
                spdlog::error("{}", loaded.error().message);
                return 1;
            }
            config = std::move(loaded).value();
        } else if (!configPath.empty()) {
            spdlog::error("Config file not found: {}", configPath);
            return 1;
        }
        coderag::config::applyEnvironmentOverrides(config);
        if (!dataDir.empty()) {
            config.data_dir = coderag::config::expand_tilde(dataDir);
        }
        if (!provider.empty()) {
            config.selector.embedding_provider = provider;
        }
        if (verbose) {
            config.log_level = "debug";
        }
        if (auto level = coderag::config::applyLogLevel(config.log_level); !level) {
            spdlog::warn("{}", level.error().message);
        }
        if (auto valid = coderag::config::validateEngineConfig(config); !valid) {
            spdlog::error("Invalid configuration: {}", valid.error().message);
            return 1;
        }

        coderag::search::RetrievalEngine engine(config);

        if (*indexCmd) {
            coderag::analysis::AnalysisResults analysis;
            if (!analysisPath.empty()) {
                auto loaded = coderag::analysis::AnalysisResults::loadFromFile(analysisPath);
                if (!loaded) {
                    spdlog::error("{}", loaded.error().message);
                    return 1;
                }
                analysis = std::move(loaded).value();
            }
            auto files = collectSources(indexPaths);
            if (files.empty()) {
                spdlog::warn("No supported source files found");
                return 0;
            }
            auto count = engine.ingest(files, analysis);
            fmt::print("Indexed {} chunks from {} files ({})\n", count, files.size(),
                       coderag::search::backendStateToString(engine.backendState()));
            return 0;
        }

        if (*queryCmd) {
            if (!queryPaths.empty()) {
                auto files = collectSources(queryPaths);
                if (!engine.load(files)) {
                    engine.ingest(files);
                }
            }
            auto context = engine.query(question, topK);
            if (context.empty()) {
                std::cout << "No relevant code found." << std::endl;
                return 0;
            }
            std::cout << context << std::endl;
            return 0;
        }

        if (*statsCmd) {
            if (!statsPaths.empty()) {
                engine.load(collectSources(statsPaths));
            }
            auto stats = engine.stats();
            json out;
            out["backend"] = stats.backend;
            out["indexed_chunks"] = stats.indexed_chunks;
            out["persisted"] = stats.persisted;
            out["files"] = stats.files;
            out["vocabulary_size"] = stats.vocabulary_size;
            out["languages"] = stats.languages;
            out["avg_chunk_size"] = stats.avg_chunk_size;
            out["fingerprint"] = stats.fingerprint;
            std::cout << out.dump(2) << std::endl;
            return 0;
        }
    } catch (const std::exception& e) {
        spdlog::error("Fatal error: {}", e.what());
        return 1;
    }
    return 0;
}
