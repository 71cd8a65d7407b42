#include <coderag/vector/semantic_embedder.h>

#include <regex>

namespace coderag::vector {

SemanticEmbedder::SemanticEmbedder(std::shared_ptr<ml::IEmbeddingProvider> provider)
    : provider_(std::move(provider)), providerMutex_(std::make_shared<std::mutex>()),
      providerName_(provider_ ? provider_->getProviderName() : std::string()),
      dimension_(provider_ ? provider_->getEmbeddingDimension() : 0) {}

std::string SemanticEmbedder::contextHeader(const std::string& text, const Metadata& metadata) {
    static const std::regex classRegex(R"(\bclass\s+\w+)");
    static const std::regex defRegex(R"(\bdef\s+\w+)");

    std::string header = "File: " + metadata.file_name + " | Language: " + metadata.language;
    if (!metadata.issue_categories.empty()) {
        header += " | Issues: ";
        for (size_t i = 0; i < metadata.issue_categories.size(); ++i) {
            if (i > 0) {
                header += ", ";
            }
            header += metadata.issue_categories[i];
        }
    }
    if (std::regex_search(text, classRegex)) {
        header += " | Contains: class definition";
    }
    if (std::regex_search(text, defRegex)) {
        header += " | Contains: function definition";
    }
    return header;
}

Result<std::vector<float>> SemanticEmbedder::embed(const std::string& text) const {
    if (!provider_) {
        return Error{ErrorCode::NotInitialized, "No embedding provider"};
    }
    Result<std::vector<float>> result = [&]() {
        std::lock_guard<std::mutex> lock(*providerMutex_);
        return provider_->generateEmbedding(text);
    }();
    if (!result) {
        return result.error();
    }
    if (result.value().size() != dimension_) {
        return Error{ErrorCode::InvalidData,
                     fmt::format("Provider '{}' returned {} dimensions, expected {}",
                                 providerName_, result.value().size(), dimension_)};
    }
    return result;
}

Result<std::vector<float>> SemanticEmbedder::embedChunk(const std::string& text,
                                                        const Metadata& metadata) const {
    return embed(contextHeader(text, metadata) + "\n\n" + text);
}

Result<std::vector<float>> SemanticEmbedder::embedQuery(const std::string& text) const {
    return embed("Code question: " + text);
}

std::unique_ptr<IFeatureEmbedder> SemanticEmbedder::clone() const {
    return std::make_unique<SemanticEmbedder>(*this);
}

} // namespace coderag::vector
