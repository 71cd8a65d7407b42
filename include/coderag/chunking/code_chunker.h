#pragma once

#include <coderag/detection/language_detector.h>

#include <cstddef>
#include <iterator>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace coderag::chunking {

/**
 * Configuration for source chunking
 */
struct ChunkerConfig {
    size_t max_chunk_chars = 800; // Hard upper bound per chunk (bytes)
    size_t overlap_chars = 100;   // Bytes shared with the previous chunk
    size_t id_prefix_chars = 100; // Leading characters folded into the chunk id
};

/**
 * A contiguous slice of one source file
 */
struct CodeChunk {
    std::string id;          // SHA-256 of (file path, ordinal, leading text)
    std::string source_file; // Path as given to split()
    detection::Language language = detection::Language::Unknown;
    size_t ordinal = 0;      // Position in file (0-based)
    size_t start_line = 1;   // 1-based, inclusive
    size_t end_line = 1;     // 1-based, inclusive
    size_t start_offset = 0; // Byte offset in file
    size_t end_offset = 0;   // Exclusive end offset
    size_t overlap_length = 0;
    std::string text;
    bool overlap_with_prev = false;

    size_t size() const { return text.size(); }
};

class CodeChunker;

/**
 * Lazy, finite, restartable sequence of chunks for one file.
 *
 * Chunks are produced on iteration; every call to begin() restarts at the
 * first chunk. The sequence owns a copy of the content, so it stays valid
 * after the chunker that produced it is gone.
 */
class ChunkSequence {
    struct State;

public:
    class iterator {
    public:
        using iterator_category = std::input_iterator_tag;
        using value_type = CodeChunk;
        using difference_type = std::ptrdiff_t;
        using pointer = const CodeChunk*;
        using reference = const CodeChunk&;

        iterator() = default;

        reference operator*() const { return *current_; }
        pointer operator->() const { return &*current_; }

        iterator& operator++();
        iterator operator++(int) {
            auto copy = *this;
            ++(*this);
            return copy;
        }

        friend bool operator==(const iterator& a, const iterator& b) {
            return a.current_.has_value() == b.current_.has_value() &&
                   (!a.current_ || a.current_->ordinal == b.current_->ordinal);
        }
        friend bool operator!=(const iterator& a, const iterator& b) { return !(a == b); }

    private:
        friend class ChunkSequence;
        explicit iterator(std::shared_ptr<const State> state);

        void produce(size_t start, size_t overlap, size_t ordinal);

        std::shared_ptr<const State> state_;
        std::optional<CodeChunk> current_;
    };

    iterator begin() const;
    iterator end() const { return iterator{}; }

    bool empty() const;

    // Materialize the whole sequence
    std::vector<CodeChunk> collect() const;

private:
    friend class CodeChunker;
    explicit ChunkSequence(std::shared_ptr<const State> state) : state_(std::move(state)) {}

    std::shared_ptr<const State> state_;
};

/**
 * Structure-aware splitter for source files.
 *
 * Each chunk is cut at the last structural boundary (function/class/block
 * opener for the language) that fits in max_chunk_chars, else at the last
 * blank line, else at the last newline, else at a fixed size on a UTF-8
 * character boundary. Adjacent chunks share overlap_chars bytes.
 */
class CodeChunker {
public:
    explicit CodeChunker(const ChunkerConfig& config = {});

    ChunkSequence split(const std::string& file_path, std::string content,
                        detection::Language language) const;

    const ChunkerConfig& getConfig() const { return config_; }

    // Line-start offsets that open a structural unit for the language
    static std::vector<size_t> findStructuralBoundaries(std::string_view content,
                                                        detection::Language language);

private:
    ChunkerConfig config_;
};

std::string generateChunkId(std::string_view file_path, size_t ordinal, std::string_view text,
                            size_t prefix_chars);

} // namespace coderag::chunking
