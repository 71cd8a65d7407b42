#pragma once

#include <coderag/core/types.h>
#include <coderag/vector/index_record.h>

#include <string>
#include <string_view>
#include <unordered_map>
#include <unordered_set>
#include <vector>

namespace coderag::vector {

/**
 * Inverted keyword index for the KEYWORD_ONLY tier.
 *
 * Keywords are definition, class, assignment and import names longer than
 * two characters. A query term scores one hit for a keyword match and one
 * for a substring match in the chunk text; the score is hits divided by
 * twice the number of query terms, so it lies in (0, 1] for any match.
 */
class KeywordIndex {
public:
    Result<void> add(std::vector<IndexRecord> records);

    RetrievalResult search(const std::string& query, size_t k,
                           const SearchFilter* filter = nullptr) const;

    size_t remove(const std::vector<std::string>& ids);

    const std::vector<IndexRecord>& records() const { return records_; }
    size_t size() const { return records_.size(); }
    size_t keywordCount() const { return postings_.size(); }

    void clear();

    static std::unordered_set<std::string> extractKeywords(const std::string& text);

    // Unique lowercase query words longer than two characters, in order
    static std::vector<std::string> queryTerms(std::string_view query);

private:
    void indexSlot(size_t slot);
    void rebuild();

    std::vector<IndexRecord> records_;
    std::vector<std::string> loweredText_; // Slot-aligned
    std::unordered_map<std::string, size_t> idToSlot_;
    std::unordered_map<std::string, std::unordered_set<size_t>> postings_;
};

} // namespace coderag::vector
