#include <coderag/vector/retrieval_backend.h>

#include <spdlog/spdlog.h>

namespace coderag::vector {

VectorRetrievalBackend::VectorRetrievalBackend(std::unique_ptr<IFeatureEmbedder> embedder)
    : embedder_(std::move(embedder)), index_(embedder_->dimension(), embedder_->capability()) {}

Result<size_t> VectorRetrievalBackend::add(std::vector<IndexRecord> records) {
    const size_t count = records.size();
    for (auto& record : records) {
        auto embedding = embedder_->embedChunk(record.text, record.metadata);
        if (!embedding) {
            spdlog::warn("Embedding failed for chunk {} of {}: {}", record.metadata.chunk_index,
                         record.metadata.file_path, embedding.error().message);
            return embedding.error();
        }
        record.embedding.chunk_id = record.metadata.chunk_id;
        record.embedding.vector = std::move(embedding).value();
        record.embedding.backend_tag = embedder_->capability();
    }
    auto result = index_.add(std::move(records));
    if (!result) {
        return result.error();
    }
    return count;
}

Result<void> VectorRetrievalBackend::restore(std::vector<IndexRecord> records) {
    return index_.add(std::move(records));
}

Result<RetrievalResult> VectorRetrievalBackend::search(const std::string& query, size_t k,
                                                       const SearchFilter* filter,
                                                       std::stop_token stop) const {
    if (stop.stop_requested() || index_.empty()) {
        return RetrievalResult{};
    }
    auto queryVector = embedder_->embedQuery(query);
    if (!queryVector) {
        return queryVector.error();
    }
    if (stop.stop_requested()) {
        return RetrievalResult{};
    }
    return index_.search(queryVector.value(), k, filter);
}

std::unique_ptr<IRetrievalBackend> VectorRetrievalBackend::clone() const {
    auto copy = std::make_unique<VectorRetrievalBackend>(embedder_->clone());
    copy->index_ = index_;
    return copy;
}

Result<size_t> KeywordRetrievalBackend::add(std::vector<IndexRecord> records) {
    const size_t count = records.size();
    for (auto& record : records) {
        record.embedding.backend_tag = BackendCapability::KeywordOnly;
    }
    auto result = index_.add(std::move(records));
    if (!result) {
        return result.error();
    }
    return count;
}

Result<void> KeywordRetrievalBackend::restore(std::vector<IndexRecord> records) {
    return index_.add(std::move(records));
}

Result<RetrievalResult> KeywordRetrievalBackend::search(const std::string& query, size_t k,
                                                        const SearchFilter* filter,
                                                        std::stop_token stop) const {
    if (stop.stop_requested()) {
        return RetrievalResult{};
    }
    return index_.search(query, k, filter);
}

std::unique_ptr<IRetrievalBackend> KeywordRetrievalBackend::clone() const {
    return std::make_unique<KeywordRetrievalBackend>(*this);
}

} // namespace coderag::vector
