#pragma once

#include <coderag/ml/provider.h>
#include <coderag/vector/feature_embedder.h>

#include <memory>
#include <mutex>
#include <string>

namespace coderag::vector {

/**
 * FULL_SEMANTIC embedder backed by an external embedding provider.
 *
 * Chunks are embedded with a one-line context header
 *   "File: a.py | Language: python | Issues: security | Contains: class definition"
 * followed by a blank line and the chunk text. Queries are embedded as
 * "Code question: <query>". Clones share the provider; calls into it are
 * serialized.
 */
class SemanticEmbedder : public IFeatureEmbedder {
public:
    // The provider must already be initialized and report a dimension
    explicit SemanticEmbedder(std::shared_ptr<ml::IEmbeddingProvider> provider);

    Result<std::vector<float>> embed(const std::string& text) const override;
    Result<std::vector<float>> embedChunk(const std::string& text,
                                          const Metadata& metadata) const override;
    Result<std::vector<float>> embedQuery(const std::string& text) const override;

    size_t dimension() const override { return dimension_; }
    BackendCapability capability() const override { return BackendCapability::FullSemantic; }

    std::unique_ptr<IFeatureEmbedder> clone() const override;

    const std::string& providerName() const { return providerName_; }

    static std::string contextHeader(const std::string& text, const Metadata& metadata);

private:
    std::shared_ptr<ml::IEmbeddingProvider> provider_;
    std::shared_ptr<std::mutex> providerMutex_;
    std::string providerName_;
    size_t dimension_;
};

} // namespace coderag::vector
