#pragma once

#include <coderag/core/types.h>

#include <filesystem>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace coderag::analysis {

struct Issue {
    std::string category = "unknown";
    std::string severity;
    std::string message;
    int line = 0;
};

// Static-analysis facts for one file, attached to its chunks at ingestion
struct FileAnalysis {
    std::string language;
    std::vector<Issue> issues;
    double complexity_score = 0.0;
};

/**
 * Path-keyed analysis facts produced by an external analyzer.
 *
 * Accepted JSON shape:
 *   {"file_analyses": {"<path>": {"language": "...", "issues": [...],
 *                                 "complexity": N | {"complexity_score": N},
 *                                 "metrics": {"complexity_score": N}}}}
 * Issues are objects ({"category", "severity", "message", "line"}) or bare
 * category strings.
 */
class AnalysisResults {
public:
    void set(const std::string& path, FileAnalysis analysis);

    // Exact path first, then the lexically normalized form
    const FileAnalysis* find(std::string_view path) const;

    size_t size() const { return files_.size(); }
    bool empty() const { return files_.empty(); }

    static Result<AnalysisResults> parse(std::string_view json_text);
    static Result<AnalysisResults> loadFromFile(const std::filesystem::path& path);

private:
    std::unordered_map<std::string, FileAnalysis> files_;
};

} // namespace coderag::analysis
