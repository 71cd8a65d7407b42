#include <coderag/vector/vector_index.h>

#include <algorithm>
#include <cmath>
#include <unordered_set>

namespace coderag::vector {

namespace vector_utils {

float norm(const std::vector<float>& v) {
    double sum = 0.0;
    for (float x : v) {
        sum += static_cast<double>(x) * x;
    }
    return static_cast<float>(std::sqrt(sum));
}

std::vector<float> normalize(const std::vector<float>& v) {
    const float n = norm(v);
    // Unit-length input is returned unchanged
    if (n == 0.0f || std::fabs(n - 1.0f) < 1e-6f) {
        return v;
    }
    std::vector<float> out(v.size());
    for (size_t i = 0; i < v.size(); ++i) {
        out[i] = v[i] / n;
    }
    return out;
}

float dot(const std::vector<float>& a, const std::vector<float>& b) {
    float sum = 0.0f;
    const size_t n = std::min(a.size(), b.size());
    for (size_t i = 0; i < n; ++i) {
        sum += a[i] * b[i];
    }
    return sum;
}

} // namespace vector_utils

VectorIndex::VectorIndex(size_t dimension, BackendCapability backend)
    : dimension_(dimension), backend_(backend) {}

Result<void> VectorIndex::add(std::vector<IndexRecord> records) {
    for (const auto& record : records) {
        if (record.embedding.backend_tag != backend_) {
            return Error{ErrorCode::InvalidArgument,
                         fmt::format("Record {} was embedded by {}, index holds {}", record.id(),
                                     capabilityToString(record.embedding.backend_tag),
                                     capabilityToString(backend_))};
        }
        if (record.embedding.vector.size() != dimension_) {
            return Error{ErrorCode::InvalidArgument,
                         fmt::format("Vector dimension mismatch for {}: {} != {}", record.id(),
                                     record.embedding.vector.size(), dimension_)};
        }
        if (record.id().empty()) {
            return Error{ErrorCode::InvalidArgument, "Record without chunk id"};
        }
    }

    for (auto& record : records) {
        record.embedding.vector = vector_utils::normalize(record.embedding.vector);
        record.embedding.chunk_id = record.metadata.chunk_id;
        auto it = idToSlot_.find(record.id());
        if (it != idToSlot_.end()) {
            records_[it->second] = std::move(record);
        } else {
            idToSlot_.emplace(record.id(), records_.size());
            records_.push_back(std::move(record));
        }
    }
    return Result<void>();
}

Result<RetrievalResult> VectorIndex::search(const std::vector<float>& query, size_t k,
                                            const SearchFilter* filter) const {
    if (query.size() != dimension_) {
        return Error{ErrorCode::InvalidArgument,
                     fmt::format("Query dimension mismatch: {} != {}", query.size(), dimension_)};
    }
    RetrievalResult results;
    if (k == 0 || records_.empty()) {
        return results;
    }

    const auto normalizedQuery = vector_utils::normalize(query);

    std::vector<std::pair<float, size_t>> scored;
    scored.reserve(records_.size());
    for (size_t slot = 0; slot < records_.size(); ++slot) {
        const auto& record = records_[slot];
        if (filter && filter->hasFilters() && !filter->matches(record.metadata)) {
            continue;
        }
        float score = vector_utils::dot(normalizedQuery, record.embedding.vector);
        if (std::isnan(score)) {
            continue;
        }
        scored.emplace_back(score, slot);
    }

    const size_t resultSize = std::min(k, scored.size());
    std::partial_sort(scored.begin(), scored.begin() + resultSize, scored.end(),
                      [](const auto& a, const auto& b) {
                          if (a.first != b.first) {
                              return a.first > b.first;
                          }
                          return a.second < b.second;
                      });

    results.reserve(resultSize);
    for (size_t i = 0; i < resultSize; ++i) {
        results.push_back(ScoredRecord{records_[scored[i].second], scored[i].first});
    }
    return results;
}

size_t VectorIndex::remove(const std::vector<std::string>& ids) {
    std::unordered_set<std::string> doomed(ids.begin(), ids.end());
    const size_t before = records_.size();
    records_.erase(std::remove_if(records_.begin(), records_.end(),
                                  [&](const IndexRecord& r) { return doomed.count(r.id()) > 0; }),
                   records_.end());
    const size_t removed = before - records_.size();
    if (removed > 0) {
        reindex();
    }
    return removed;
}

const IndexRecord* VectorIndex::get(const std::string& id) const {
    auto it = idToSlot_.find(id);
    return it == idToSlot_.end() ? nullptr : &records_[it->second];
}

void VectorIndex::clear() {
    records_.clear();
    idToSlot_.clear();
}

void VectorIndex::reindex() {
    idToSlot_.clear();
    for (size_t slot = 0; slot < records_.size(); ++slot) {
        idToSlot_.emplace(records_[slot].id(), slot);
    }
}

} // namespace coderag::vector
