#include <coderag/vector/feature_embedder.h>
#include <coderag/vector/keyword_index.h>

#include <algorithm>
#include <cctype>
#include <regex>

namespace coderag::vector {

namespace {

std::string toLower(std::string_view text) {
    std::string out(text);
    std::transform(out.begin(), out.end(), out.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return out;
}

} // namespace

std::unordered_set<std::string> KeywordIndex::extractKeywords(const std::string& text) {
    static const std::regex patterns[] = {
        std::regex(R"(def\s+(\w+))"),
        std::regex(R"(function\s+(\w+))"),
        std::regex(R"(class\s+(\w+))"),
        std::regex(R"((\w+)\s*=)"),
        std::regex(R"(import\s+(\w+))"),
    };

    std::unordered_set<std::string> keywords;
    for (const auto& pattern : patterns) {
        for (std::sregex_iterator it(text.begin(), text.end(), pattern), end; it != end; ++it) {
            auto keyword = (*it)[1].str();
            if (keyword.size() > 2) {
                keywords.insert(toLower(keyword));
            }
        }
    }
    return keywords;
}

std::vector<std::string> KeywordIndex::queryTerms(std::string_view query) {
    std::vector<std::string> terms;
    std::unordered_set<std::string> seen;
    for (auto& word : tokenizeWords(query)) {
        if (word.size() > 2 && seen.insert(word).second) {
            terms.push_back(std::move(word));
        }
    }
    return terms;
}

Result<void> KeywordIndex::add(std::vector<IndexRecord> records) {
    for (const auto& record : records) {
        if (record.embedding.backend_tag != BackendCapability::KeywordOnly) {
            return Error{ErrorCode::InvalidArgument,
                         fmt::format("Record {} was embedded by {}, keyword index expected",
                                     record.id(), capabilityToString(record.embedding.backend_tag))};
        }
        if (record.id().empty()) {
            return Error{ErrorCode::InvalidArgument, "Record without chunk id"};
        }
    }

    bool replaced = false;
    for (auto& record : records) {
        record.embedding.vector.clear();
        record.embedding.chunk_id = record.metadata.chunk_id;
        auto it = idToSlot_.find(record.id());
        if (it != idToSlot_.end()) {
            records_[it->second] = std::move(record);
            loweredText_[it->second] = toLower(records_[it->second].text);
            replaced = true;
        } else {
            const size_t slot = records_.size();
            idToSlot_.emplace(record.id(), slot);
            loweredText_.push_back(toLower(record.text));
            records_.push_back(std::move(record));
            indexSlot(slot);
        }
    }
    if (replaced) {
        rebuild();
    }
    return Result<void>();
}

RetrievalResult KeywordIndex::search(const std::string& query, size_t k,
                                     const SearchFilter* filter) const {
    RetrievalResult results;
    const auto terms = queryTerms(query);
    if (terms.empty() || k == 0 || records_.empty()) {
        return results;
    }

    std::vector<size_t> hits(records_.size(), 0);
    for (const auto& term : terms) {
        if (auto it = postings_.find(term); it != postings_.end()) {
            for (size_t slot : it->second) {
                ++hits[slot];
            }
        }
        for (size_t slot = 0; slot < loweredText_.size(); ++slot) {
            if (loweredText_[slot].find(term) != std::string::npos) {
                ++hits[slot];
            }
        }
    }

    std::vector<std::pair<float, size_t>> scored;
    const float maxHits = static_cast<float>(2 * terms.size());
    for (size_t slot = 0; slot < records_.size(); ++slot) {
        if (hits[slot] == 0) {
            continue;
        }
        if (filter && filter->hasFilters() && !filter->matches(records_[slot].metadata)) {
            continue;
        }
        scored.emplace_back(static_cast<float>(hits[slot]) / maxHits, slot);
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

size_t KeywordIndex::remove(const std::vector<std::string>& ids) {
    std::unordered_set<std::string> doomed(ids.begin(), ids.end());
    std::vector<IndexRecord> kept;
    std::vector<std::string> keptText;
    kept.reserve(records_.size());
    keptText.reserve(records_.size());
    for (size_t slot = 0; slot < records_.size(); ++slot) {
        if (!doomed.count(records_[slot].id())) {
            kept.push_back(std::move(records_[slot]));
            keptText.push_back(std::move(loweredText_[slot]));
        }
    }
    const size_t removed = records_.size() - kept.size();
    records_ = std::move(kept);
    loweredText_ = std::move(keptText);
    rebuild();
    return removed;
}

void KeywordIndex::clear() {
    records_.clear();
    loweredText_.clear();
    idToSlot_.clear();
    postings_.clear();
}

void KeywordIndex::indexSlot(size_t slot) {
    for (const auto& keyword : extractKeywords(records_[slot].text)) {
        postings_[keyword].insert(slot);
    }
}

void KeywordIndex::rebuild() {
    idToSlot_.clear();
    postings_.clear();
    for (size_t slot = 0; slot < records_.size(); ++slot) {
        idToSlot_.emplace(records_[slot].id(), slot);
        indexSlot(slot);
    }
}

} // namespace coderag::vector
