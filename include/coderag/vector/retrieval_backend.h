#pragma once

#include <coderag/core/types.h>
#include <coderag/vector/feature_embedder.h>
#include <coderag/vector/index_record.h>
#include <coderag/vector/keyword_index.h>
#include <coderag/vector/vector_index.h>

#include <memory>
#include <stop_token>
#include <string>
#include <vector>

namespace coderag::vector {

/**
 * Uniform retrieval contract over every tier. The engine talks to this
 * interface only, whichever backend is live.
 */
class IRetrievalBackend {
public:
    virtual ~IRetrievalBackend() = default;

    virtual BackendCapability capability() const = 0;

    // Vector length, 0 for the keyword tier
    virtual size_t dimension() const = 0;

    // Grow corpus-local state from texts about to be added
    virtual void learn(const std::vector<std::string>& texts) { (void)texts; }

    // Embed and insert; records carry metadata and text, vectors are filled here
    virtual Result<size_t> add(std::vector<IndexRecord> records) = 0;

    // Insert records whose vectors were produced earlier by the same tier
    virtual Result<void> restore(std::vector<IndexRecord> records) = 0;

    virtual size_t remove(const std::vector<std::string>& ids) = 0;

    virtual Result<RetrievalResult> search(const std::string& query, size_t k,
                                           const SearchFilter* filter,
                                           std::stop_token stop = {}) const = 0;

    virtual const std::vector<IndexRecord>& records() const = 0;
    virtual size_t size() const = 0;
    virtual void clear() = 0;

    virtual std::vector<std::string> vocabulary() const { return {}; }
    virtual Result<void> restoreVocabulary(const std::vector<std::string>& words) {
        (void)words;
        return Result<void>();
    }

    virtual std::unique_ptr<IRetrievalBackend> clone() const = 0;
};

/**
 * FULL_SEMANTIC and FEATURE_HEURISTIC tiers: an embedder paired with a
 * flat cosine index
 */
class VectorRetrievalBackend : public IRetrievalBackend {
public:
    explicit VectorRetrievalBackend(std::unique_ptr<IFeatureEmbedder> embedder);

    BackendCapability capability() const override { return embedder_->capability(); }
    size_t dimension() const override { return embedder_->dimension(); }

    void learn(const std::vector<std::string>& texts) override { embedder_->learn(texts); }

    Result<size_t> add(std::vector<IndexRecord> records) override;
    Result<void> restore(std::vector<IndexRecord> records) override;
    size_t remove(const std::vector<std::string>& ids) override { return index_.remove(ids); }

    Result<RetrievalResult> search(const std::string& query, size_t k, const SearchFilter* filter,
                                   std::stop_token stop = {}) const override;

    const std::vector<IndexRecord>& records() const override { return index_.records(); }
    size_t size() const override { return index_.size(); }
    void clear() override { index_.clear(); }

    std::vector<std::string> vocabulary() const override { return embedder_->vocabulary(); }
    Result<void> restoreVocabulary(const std::vector<std::string>& words) override {
        return embedder_->restoreVocabulary(words);
    }

    std::unique_ptr<IRetrievalBackend> clone() const override;

    const IFeatureEmbedder& embedder() const { return *embedder_; }

private:
    std::unique_ptr<IFeatureEmbedder> embedder_;
    VectorIndex index_;
};

/**
 * KEYWORD_ONLY tier: no vectors, token overlap and substring scoring
 */
class KeywordRetrievalBackend : public IRetrievalBackend {
public:
    BackendCapability capability() const override { return BackendCapability::KeywordOnly; }
    size_t dimension() const override { return 0; }

    Result<size_t> add(std::vector<IndexRecord> records) override;
    Result<void> restore(std::vector<IndexRecord> records) override;
    size_t remove(const std::vector<std::string>& ids) override { return index_.remove(ids); }

    Result<RetrievalResult> search(const std::string& query, size_t k, const SearchFilter* filter,
                                   std::stop_token stop = {}) const override;

    const std::vector<IndexRecord>& records() const override { return index_.records(); }
    size_t size() const override { return index_.size(); }
    void clear() override { index_.clear(); }

    std::unique_ptr<IRetrievalBackend> clone() const override;

private:
    KeywordIndex index_;
};

} // namespace coderag::vector
