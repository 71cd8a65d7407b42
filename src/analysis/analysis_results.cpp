#include <coderag/analysis/analysis_results.h>

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include <fstream>
#include <sstream>

namespace coderag::analysis {

using json = nlohmann::json;

namespace {

std::string normalizePath(std::string_view path) {
    return std::filesystem::path(path).lexically_normal().generic_string();
}

double readComplexity(const json& entry) {
    if (auto it = entry.find("complexity"); it != entry.end()) {
        if (it->is_number()) {
            return it->get<double>();
        }
        if (it->is_object()) {
            auto score = it->find("complexity_score");
            if (score != it->end() && score->is_number()) {
                return score->get<double>();
            }
        }
    }
    if (auto metrics = entry.find("metrics"); metrics != entry.end() && metrics->is_object()) {
        auto score = metrics->find("complexity_score");
        if (score != metrics->end() && score->is_number()) {
            return score->get<double>();
        }
    }
    return 0.0;
}

Issue readIssue(const json& j) {
    Issue issue;
    if (j.is_string()) {
        issue.category = j.get<std::string>();
        return issue;
    }
    if (!j.is_object()) {
        return issue;
    }
    issue.category = j.value("category", std::string("unknown"));
    issue.severity = j.value("severity", std::string());
    issue.message = j.value("message", j.value("description", std::string()));
    if (auto line = j.find("line"); line != j.end() && line->is_number_integer()) {
        issue.line = line->get<int>();
    }
    return issue;
}

} // namespace

void AnalysisResults::set(const std::string& path, FileAnalysis analysis) {
    files_[normalizePath(path)] = std::move(analysis);
}

const FileAnalysis* AnalysisResults::find(std::string_view path) const {
    if (auto it = files_.find(std::string(path)); it != files_.end()) {
        return &it->second;
    }
    if (auto it = files_.find(normalizePath(path)); it != files_.end()) {
        return &it->second;
    }
    return nullptr;
}

Result<AnalysisResults> AnalysisResults::parse(std::string_view json_text) {
    AnalysisResults results;
    try {
        auto root = json::parse(json_text);
        if (!root.is_object()) {
            return Error{ErrorCode::InvalidData, "Analysis results must be a JSON object"};
        }
        auto files = root.find("file_analyses");
        if (files == root.end()) {
            return results;
        }
        if (!files->is_object()) {
            return Error{ErrorCode::InvalidData, "file_analyses must be an object"};
        }
        for (const auto& [path, entry] : files->items()) {
            if (!entry.is_object()) {
                spdlog::warn("Skipping malformed analysis entry for {}", path);
                continue;
            }
            FileAnalysis analysis;
            analysis.language = entry.value("language", std::string());
            if (auto issues = entry.find("issues"); issues != entry.end() && issues->is_array()) {
                for (const auto& issue : *issues) {
                    analysis.issues.push_back(readIssue(issue));
                }
            }
            analysis.complexity_score = readComplexity(entry);
            results.set(path, std::move(analysis));
        }
    } catch (const json::exception& e) {
        return Error{ErrorCode::InvalidData,
                     std::string("Failed to parse analysis results: ") + e.what()};
    }
    return results;
}

Result<AnalysisResults> AnalysisResults::loadFromFile(const std::filesystem::path& path) {
    std::ifstream file(path);
    if (!file) {
        return Error{ErrorCode::FileNotFound, "Cannot open analysis results: " + path.string()};
    }
    std::stringstream buffer;
    buffer << file.rdbuf();
    return parse(buffer.str());
}

} // namespace coderag::analysis
