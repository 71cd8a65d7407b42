#include <coderag/chunking/code_chunker.h>
#include <coderag/crypto/hasher.h>

#include <spdlog/spdlog.h>

#include <algorithm>
#include <initializer_list>
#include <iterator>

namespace coderag::chunking {

using detection::Language;

struct ChunkSequence::State {
    std::string file_path;
    std::string content;
    Language language = Language::Unknown;
    ChunkerConfig config;
    std::vector<size_t> boundaries; // Sorted structural line starts
    std::vector<size_t> newlines;   // Sorted offsets of '\n'

    size_t lineOf(size_t offset) const {
        return 1 + static_cast<size_t>(std::lower_bound(newlines.begin(), newlines.end(), offset) -
                                       newlines.begin());
    }

    // End offset (exclusive) of the chunk starting at `start`; always past `floor`
    size_t findCut(size_t start, size_t floor) const;
};

namespace {

constexpr size_t kMaxStructuralIndent = 4;

bool isContinuationByte(char c) {
    return (static_cast<unsigned char>(c) & 0xC0) == 0x80;
}

bool startsWithAny(std::string_view text, std::initializer_list<std::string_view> prefixes) {
    for (auto prefix : prefixes) {
        if (text.substr(0, prefix.size()) == prefix) {
            return true;
        }
    }
    return false;
}

bool opensUnit(std::string_view trimmed, Language language) {
    switch (language) {
        case Language::Python:
            return startsWithAny(trimmed, {"def ", "async def ", "class ", "@"});
        case Language::Ruby:
            return startsWithAny(trimmed, {"def ", "class ", "module "});
        case Language::JavaScript:
        case Language::TypeScript:
            return startsWithAny(trimmed, {"function ", "async function ", "class ", "export ",
                                           "interface ", "type ", "module.exports"});
        case Language::Go:
            return startsWithAny(trimmed, {"func ", "type "});
        case Language::Rust:
            return startsWithAny(trimmed, {"fn ", "pub fn ", "pub(crate) fn ", "async fn ",
                                           "pub async fn ", "impl", "struct ", "pub struct ",
                                           "enum ", "pub enum ", "trait ", "pub trait ", "mod ",
                                           "#["});
        case Language::Php:
            return startsWithAny(trimmed, {"function ", "class ", "public function ",
                                           "private function ", "protected function ",
                                           "interface ", "trait "});
        case Language::Unknown:
            return false;
        default:
            // Remaining brace languages (C, C++, Java, C#, Swift, Kotlin, Scala)
            return startsWithAny(trimmed, {"class ", "struct ", "enum ", "interface ",
                                           "namespace ", "template", "public ", "private ",
                                           "protected ", "internal ", "static ", "func ", "fun ",
                                           "def ", "object ", "trait ", "@"});
    }
}

bool isAttributeLine(std::string_view trimmed, Language language) {
    if (trimmed.empty()) {
        return false;
    }
    if (language == Language::Rust) {
        return trimmed.substr(0, 2) == "#[";
    }
    return trimmed.front() == '@';
}

} // namespace

std::vector<size_t> CodeChunker::findStructuralBoundaries(std::string_view content,
                                                          Language language) {
    std::vector<size_t> boundaries;
    if (language == Language::Unknown) {
        return boundaries;
    }

    const bool braces = detection::usesBraces(language);
    bool prevClosedBlock = false;
    bool prevAttribute = false;

    size_t lineStart = 0;
    while (lineStart < content.size()) {
        size_t lineEnd = content.find('\n', lineStart);
        if (lineEnd == std::string_view::npos) {
            lineEnd = content.size();
        }
        std::string_view line = content.substr(lineStart, lineEnd - lineStart);
        if (!line.empty() && line.back() == '\r') {
            line.remove_suffix(1);
        }

        size_t indent = 0;
        size_t pos = 0;
        while (pos < line.size() && (line[pos] == ' ' || line[pos] == '\t')) {
            indent += line[pos] == '\t' ? 4 : 1;
            ++pos;
        }
        std::string_view trimmed = line.substr(pos);

        if (lineStart > 0) {
            bool boundary = false;
            if (!trimmed.empty() && indent <= kMaxStructuralIndent &&
                opensUnit(trimmed, language)) {
                // Keep decorators/annotations attached to what they decorate
                boundary = !prevAttribute;
            }
            if (braces && prevClosedBlock) {
                boundary = true;
            }
            if (boundary) {
                boundaries.push_back(lineStart);
            }
        }

        if (!trimmed.empty()) {
            prevAttribute = indent <= kMaxStructuralIndent && isAttributeLine(trimmed, language);
        }
        prevClosedBlock = braces && indent == 0 && (trimmed == "}" || trimmed == "};");

        lineStart = lineEnd + 1;
    }
    return boundaries;
}

size_t ChunkSequence::State::findCut(size_t start, size_t floor) const {
    const size_t n = content.size();
    const size_t maxChars = std::max<size_t>(config.max_chunk_chars, 1);
    if (n - start <= maxChars) {
        return n;
    }

    const size_t windowEnd = start + maxChars;
    const size_t minCut = std::max(start + std::max<size_t>(maxChars / 4, 1), floor);

    // 1. Structural boundary
    auto it = std::upper_bound(boundaries.begin(), boundaries.end(), windowEnd);
    if (it != boundaries.begin()) {
        size_t candidate = *std::prev(it);
        if (candidate > minCut) {
            return candidate;
        }
    }

    // 2. Blank line, 3. any newline
    size_t lastNewlineCut = 0;
    for (size_t p = windowEnd; p > minCut; --p) {
        if (content[p - 1] != '\n') {
            continue;
        }
        if (p >= 2 && content[p - 2] == '\n') {
            return p;
        }
        if (lastNewlineCut == 0) {
            lastNewlineCut = p;
        }
    }
    if (lastNewlineCut != 0) {
        return lastNewlineCut;
    }

    // 4. Fixed size, never inside a multi-byte sequence
    size_t cut = windowEnd;
    while (cut > start + 1 && isContinuationByte(content[cut])) {
        --cut;
    }
    return cut;
}

ChunkSequence::iterator::iterator(std::shared_ptr<const State> state) : state_(std::move(state)) {
    if (state_ && !state_->content.empty()) {
        produce(0, 0, 0);
    }
}

void ChunkSequence::iterator::produce(size_t start, size_t overlap, size_t ordinal) {
    const auto& s = *state_;
    size_t end = s.findCut(start, start + overlap);

    CodeChunk chunk;
    chunk.source_file = s.file_path;
    chunk.language = s.language;
    chunk.ordinal = ordinal;
    chunk.start_offset = start;
    chunk.end_offset = end;
    chunk.overlap_length = overlap;
    chunk.overlap_with_prev = overlap > 0;
    chunk.text = s.content.substr(start, end - start);
    chunk.start_line = s.lineOf(start);
    chunk.end_line = s.lineOf(end - 1);
    chunk.id = generateChunkId(s.file_path, ordinal, chunk.text, s.config.id_prefix_chars);
    current_ = std::move(chunk);
}

ChunkSequence::iterator& ChunkSequence::iterator::operator++() {
    if (!current_) {
        return *this;
    }
    const auto& s = *state_;
    const size_t start = current_->start_offset;
    const size_t cut = current_->end_offset;
    if (cut >= s.content.size()) {
        current_.reset();
        return *this;
    }

    // Overlap is capped at half the chunk so every step makes progress
    size_t overlap = std::min(s.config.overlap_chars, (cut - start) / 2);
    size_t next = cut - overlap;
    while (next < cut && isContinuationByte(s.content[next])) {
        ++next;
    }
    produce(next, cut - next, current_->ordinal + 1);
    return *this;
}

ChunkSequence::iterator ChunkSequence::begin() const {
    return iterator{state_};
}

bool ChunkSequence::empty() const {
    return !state_ || state_->content.empty();
}

std::vector<CodeChunk> ChunkSequence::collect() const {
    std::vector<CodeChunk> chunks;
    for (const auto& chunk : *this) {
        chunks.push_back(chunk);
    }
    return chunks;
}

CodeChunker::CodeChunker(const ChunkerConfig& config) : config_(config) {
    if (config_.max_chunk_chars == 0) {
        spdlog::warn("max_chunk_chars of 0 is not usable, falling back to 800");
        config_.max_chunk_chars = 800;
    }
    if (config_.overlap_chars >= config_.max_chunk_chars) {
        spdlog::warn("overlap_chars ({}) must be smaller than max_chunk_chars ({}), clamping",
                     config_.overlap_chars, config_.max_chunk_chars);
        config_.overlap_chars = config_.max_chunk_chars / 2;
    }
}

ChunkSequence CodeChunker::split(const std::string& file_path, std::string content,
                                 Language language) const {
    auto state = std::make_shared<ChunkSequence::State>();
    state->file_path = file_path;
    state->language = language;
    state->config = config_;
    state->boundaries = findStructuralBoundaries(content, language);
    for (size_t i = 0; i < content.size(); ++i) {
        if (content[i] == '\n') {
            state->newlines.push_back(i);
        }
    }
    state->content = std::move(content);

    spdlog::debug("Prepared {} for chunking: {} bytes, {} structural boundaries", file_path,
                  state->content.size(), state->boundaries.size());
    return ChunkSequence{std::move(state)};
}

std::string generateChunkId(std::string_view file_path, size_t ordinal, std::string_view text,
                            size_t prefix_chars) {
    crypto::SHA256Hasher hasher;
    hasher.update(file_path);
    hasher.update(std::string_view("\0", 1));
    hasher.update(std::to_string(ordinal));
    hasher.update(std::string_view("\0", 1));
    hasher.update(text.substr(0, prefix_chars));
    return hasher.finalize();
}

} // namespace coderag::chunking
