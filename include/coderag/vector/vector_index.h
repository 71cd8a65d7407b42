#pragma once

#include <coderag/core/types.h>
#include <coderag/vector/index_record.h>

#include <string>
#include <unordered_map>
#include <vector>

namespace coderag::vector {

namespace vector_utils {

float norm(const std::vector<float>& v);

// Unit-length copy; zero vectors stay zero
std::vector<float> normalize(const std::vector<float>& v);

float dot(const std::vector<float>& a, const std::vector<float>& b);

} // namespace vector_utils

/**
 * Flat (exhaustive) cosine index.
 *
 * Vectors are L2-normalized on insertion and queries are normalized before
 * scoring, so the score is the inner product. Results are ordered by
 * descending score; equal scores keep insertion order. Adding a record
 * whose chunk id already exists replaces it in its original slot.
 */
class VectorIndex {
public:
    VectorIndex(size_t dimension, BackendCapability backend);

    // Validates the whole batch before inserting any of it
    Result<void> add(std::vector<IndexRecord> records);

    Result<RetrievalResult> search(const std::vector<float>& query, size_t k,
                                   const SearchFilter* filter = nullptr) const;

    // Returns the number of records removed
    size_t remove(const std::vector<std::string>& ids);

    bool contains(const std::string& id) const { return idToSlot_.count(id) > 0; }
    const IndexRecord* get(const std::string& id) const;

    // Records in insertion order
    const std::vector<IndexRecord>& records() const { return records_; }

    size_t size() const { return records_.size(); }
    bool empty() const { return records_.empty(); }
    size_t dimension() const { return dimension_; }
    BackendCapability backend() const { return backend_; }

    void clear();

private:
    void reindex();

    size_t dimension_;
    BackendCapability backend_;
    std::vector<IndexRecord> records_;
    std::unordered_map<std::string, size_t> idToSlot_;
};

} // namespace coderag::vector
