#include <coderag/vector/feature_embedder.h>

#include <spdlog/spdlog.h>

#include <algorithm>
#include <cctype>
#include <cmath>
#include <initializer_list>

namespace coderag::vector {

namespace {

using WordCounts = std::unordered_map<std::string, size_t>;

constexpr size_t kModuleBuckets = 11;
constexpr size_t kModuleBucketOffset = 21;

uint64_t fnv1a(std::string_view text) {
    uint64_t hash = 1469598103934665603ULL;
    for (char c : text) {
        hash ^= static_cast<unsigned char>(c);
        hash *= 1099511628211ULL;
    }
    return hash;
}

bool isWordChar(char c) {
    return std::isalnum(static_cast<unsigned char>(c)) || c == '_';
}

size_t countWords(const WordCounts& counts, std::initializer_list<std::string_view> words) {
    size_t total = 0;
    for (auto word : words) {
        auto it = counts.find(std::string(word));
        if (it != counts.end()) {
            total += it->second;
        }
    }
    return total;
}

size_t countSubstr(std::string_view haystack, std::string_view needle) {
    size_t total = 0;
    for (size_t pos = haystack.find(needle); pos != std::string_view::npos;
         pos = haystack.find(needle, pos + needle.size())) {
        ++total;
    }
    return total;
}

size_t countSubstrs(std::string_view haystack, std::initializer_list<std::string_view> needles) {
    size_t total = 0;
    for (auto needle : needles) {
        total += countSubstr(haystack, needle);
    }
    return total;
}

bool containsAny(std::string_view haystack, std::initializer_list<std::string_view> needles) {
    for (auto needle : needles) {
        if (haystack.find(needle) != std::string_view::npos) {
            return true;
        }
    }
    return false;
}

bool startsWithAny(std::string_view word, std::initializer_list<std::string_view> prefixes) {
    for (auto prefix : prefixes) {
        if (word.substr(0, prefix.size()) == prefix) {
            return true;
        }
    }
    return false;
}

float damp(size_t count) {
    return std::log1p(static_cast<float>(count));
}

void normalizeSlice(std::vector<float>& v, size_t begin, size_t end, float weight) {
    double sum = 0.0;
    for (size_t i = begin; i < end; ++i) {
        sum += static_cast<double>(v[i]) * v[i];
    }
    if (sum <= 0.0) {
        return;
    }
    const float scale = weight / static_cast<float>(std::sqrt(sum));
    for (size_t i = begin; i < end; ++i) {
        v[i] *= scale;
    }
}

std::vector<std::string_view> splitLines(std::string_view text) {
    std::vector<std::string_view> lines;
    size_t start = 0;
    while (start <= text.size()) {
        size_t end = text.find('\n', start);
        if (end == std::string_view::npos) {
            lines.push_back(text.substr(start));
            break;
        }
        lines.push_back(text.substr(start, end - start));
        start = end + 1;
    }
    return lines;
}

std::string_view trimLeft(std::string_view line) {
    size_t pos = 0;
    while (pos < line.size() && (line[pos] == ' ' || line[pos] == '\t')) {
        ++pos;
    }
    return line.substr(pos);
}

// First identifier-like token after `pos`, allowing dots and slashes in module paths
std::string_view moduleNameAfter(std::string_view line, size_t pos) {
    while (pos < line.size() && !isWordChar(line[pos])) {
        ++pos;
    }
    size_t end = pos;
    while (end < line.size() && (isWordChar(line[end]) || line[end] == '.' || line[end] == '/')) {
        ++end;
    }
    return line.substr(pos, end - pos);
}

bool buildsSqlFromStrings(std::string_view line) {
    if (!containsAny(line, {"select ", "insert into", "update ", "delete from"})) {
        return false;
    }
    return containsAny(line, {"\" +", "' +", "+ \"", "+ '", "%s", "% (", "f\"", "f'",
                              ".format(", "${"});
}

} // namespace

std::vector<std::string> tokenizeWords(std::string_view text) {
    std::vector<std::string> words;
    std::string current;
    for (char c : text) {
        if (isWordChar(c)) {
            current.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
        } else if (!current.empty()) {
            words.push_back(std::move(current));
            current.clear();
        }
    }
    if (!current.empty()) {
        words.push_back(std::move(current));
    }
    return words;
}

Result<std::unique_ptr<CodeFeatureEmbedder>>
CodeFeatureEmbedder::create(const FeatureEmbedderConfig& config) {
    if (config.dimension < kMinDimension) {
        return Error{ErrorCode::NotSupported,
                     fmt::format("Feature embedding needs at least {} dimensions, got {}",
                                 kMinDimension, config.dimension)};
    }
    if (config.dimension > kMaxDimension) {
        return Error{ErrorCode::NotSupported,
                     fmt::format("Feature embedding supports at most {} dimensions, got {}",
                                 kMaxDimension, config.dimension)};
    }
    return std::unique_ptr<CodeFeatureEmbedder>(new CodeFeatureEmbedder(config));
}

std::unique_ptr<IFeatureEmbedder> CodeFeatureEmbedder::clone() const {
    return std::unique_ptr<IFeatureEmbedder>(new CodeFeatureEmbedder(*this));
}

void CodeFeatureEmbedder::learn(const std::vector<std::string>& texts) {
    const size_t before = words_.size();
    for (const auto& text : texts) {
        for (auto& word : tokenizeWords(text)) {
            if (word.size() <= 2 || vocab_.count(word)) {
                continue;
            }
            vocab_.emplace(word, static_cast<uint32_t>(words_.size()));
            words_.push_back(std::move(word));
        }
    }
    spdlog::debug("Vocabulary grew from {} to {} terms", before, words_.size());
}

Result<void> CodeFeatureEmbedder::restoreVocabulary(const std::vector<std::string>& words) {
    std::unordered_map<std::string, uint32_t> vocab;
    vocab.reserve(words.size());
    for (size_t i = 0; i < words.size(); ++i) {
        if (!vocab.emplace(words[i], static_cast<uint32_t>(i)).second) {
            return Error{ErrorCode::InvalidData, "Duplicate vocabulary term: " + words[i]};
        }
    }
    vocab_ = std::move(vocab);
    words_ = words;
    return Result<void>();
}

Result<std::vector<float>> CodeFeatureEmbedder::embed(const std::string& text) const {
    return extract(text, false);
}

Result<std::vector<float>> CodeFeatureEmbedder::embedQuery(const std::string& text) const {
    return extract(text, true);
}

std::vector<float> CodeFeatureEmbedder::extract(const std::string& text, bool query) const {
    std::vector<float> v(config_.dimension, 0.0f);

    std::string lower(text);
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    const auto words = tokenizeWords(lower);
    WordCounts counts;
    for (const auto& word : words) {
        ++counts[word];
    }
    const auto lines = splitLines(lower);

    // Definitions
    const size_t d = kDefinitionOffset;
    size_t decorators = 0;
    for (auto line : lines) {
        auto trimmed = trimLeft(line);
        if (!trimmed.empty() && trimmed.front() == '@') {
            ++decorators;
        }
    }
    v[d + 0] = damp(countWords(counts, {"def"}));
    v[d + 1] = damp(countWords(counts, {"class"}));
    v[d + 2] = damp(countWords(counts, {"function"}));
    v[d + 3] = damp(countWords(counts, {"func", "fn", "fun"}));
    v[d + 4] = damp(countWords(counts, {"struct", "interface", "trait", "enum"}));
    v[d + 5] = damp(countWords(counts, {"lambda"}) + countSubstr(lower, "=>"));
    v[d + 6] = damp(countWords(counts, {"return"}));
    v[d + 7] = damp(countSubstrs(lower, {"async def", "async function", "async fn"}));
    v[d + 8] = damp(decorators);
    v[d + 9] = damp(countWords(counts, {"public", "private", "protected", "static"}));
    v[d + 10] = damp(countWords(counts, {"const", "let", "var"}));
    v[d + 11] = damp(countWords(counts, {"impl", "namespace", "module", "package"}));
    v[d + 12] = damp(countWords(counts, {"__init__", "constructor"}));
    v[d + 13] = damp(countWords(counts, {"self", "this"}));
    v[d + 14] = damp(countWords(counts, {"yield"}));
    v[d + 15] = damp(countWords(counts, {"template", "typename"}));

    // Imports
    const size_t im = kImportOffset;
    v[im + 0] = damp(countWords(counts, {"import"}));
    v[im + 1] = damp(countWords(counts, {"from"}));
    v[im + 2] = damp(countWords(counts, {"include"}));
    v[im + 3] = damp(countWords(counts, {"require"}));
    v[im + 4] = damp(countWords(counts, {"using", "use"}));
    for (auto line : lines) {
        auto trimmed = trimLeft(line);
        std::string_view module;
        if (trimmed.substr(0, 7) == "import ") {
            module = moduleNameAfter(trimmed, 7);
        } else if (trimmed.substr(0, 5) == "from ") {
            module = moduleNameAfter(trimmed, 5);
        } else if (trimmed.substr(0, 8) == "#include") {
            module = moduleNameAfter(trimmed, 8);
        } else if (auto pos = trimmed.find("require("); pos != std::string_view::npos) {
            module = moduleNameAfter(trimmed, pos + 8);
        }
        if (!module.empty()) {
            v[kModuleBucketOffset + fnv1a(module) % kModuleBuckets] += 1.0f;
        }
    }

    // Risk patterns
    const size_t r = kRiskOffset;
    size_t sqlLines = 0;
    size_t executeConcat = 0;
    size_t secrets = 0;
    for (auto line : lines) {
        if (buildsSqlFromStrings(line)) {
            ++sqlLines;
        }
        if (line.find("execute(") != std::string_view::npos &&
            containsAny(line, {"+", "%", "f\"", "f'", ".format("})) {
            ++executeConcat;
        }
        if (containsAny(line, {"password", "secret", "api_key", "apikey"}) &&
            line.find('=') != std::string_view::npos &&
            containsAny(line, {"\"", "'"})) {
            ++secrets;
        }
    }
    v[r + 0] = damp(countWords(counts, {"eval"}));
    v[r + 1] = damp(countWords(counts, {"exec", "execfile"}));
    v[r + 2] = damp(countSubstrs(lower, {"__import__(", "importlib.import_module(", "new function("}));
    v[r + 3] = damp(countSubstrs(lower, {"pickle.load", "cpickle"}));
    v[r + 4] = damp(countSubstrs(lower, {"yaml.load(", "yaml.unsafe_load("}));
    v[r + 5] = damp(countSubstrs(lower, {"marshal.load", "shelve.open(", "dill.load"}));
    v[r + 6] = damp(countSubstrs(lower, {"readobject(", "unserialize(", "objectinputstream"}));
    v[r + 7] = damp(sqlLines);
    v[r + 8] = damp(executeConcat);
    v[r + 9] = damp(countSubstrs(lower, {"os.system(", "os.popen("}));
    v[r + 10] = damp(countSubstrs(lower, {"shell=true", "shell = true"}));
    v[r + 11] = damp(countSubstrs(
        lower, {"subprocess.", "shell_exec(", "runtime.getruntime().exec", "child_process"}));
    v[r + 12] = damp(countSubstrs(lower, {"innerhtml", "document.write("}));
    v[r + 13] = damp(secrets);
    v[r + 14] = damp(countSubstrs(lower, {"md5", "sha1"}));
    bool anyRisk = false;
    for (size_t i = r; i < kAnyRiskSlot; ++i) {
        anyRisk = anyRisk || v[i] > 0.0f;
    }
    v[kAnyRiskSlot] = anyRisk ? 1.0f : 0.0f;

    // Structure
    const size_t s = kStructureOffset;
    size_t maxIndent = 0;
    size_t braceDepth = 0;
    size_t maxBraceDepth = 0;
    size_t comments = 0;
    size_t blankLines = 0;
    size_t lineChars = 0;
    for (auto line : lines) {
        auto trimmed = trimLeft(line);
        if (trimmed.empty()) {
            ++blankLines;
            continue;
        }
        size_t indent = 0;
        for (char c : line.substr(0, line.size() - trimmed.size())) {
            indent += c == '\t' ? 4 : 1;
        }
        maxIndent = std::max(maxIndent, indent / 4);
        lineChars += line.size();
        if (trimmed.front() == '#' || trimmed.substr(0, 2) == "//" || trimmed.front() == '*' ||
            trimmed.substr(0, 2) == "/*") {
            ++comments;
        }
        for (char c : line) {
            if (c == '{') {
                maxBraceDepth = std::max(maxBraceDepth, ++braceDepth);
            } else if (c == '}' && braceDepth > 0) {
                --braceDepth;
            }
        }
    }
    v[s + 0] = damp(countWords(counts, {"for", "while", "foreach"}));
    v[s + 1] = damp(countWords(counts, {"if", "elif", "else", "switch", "case"}));
    v[s + 2] = damp(std::max(maxIndent, maxBraceDepth));
    v[s + 3] = damp(countWords(counts, {"try", "catch", "except", "finally", "throw", "raise"}));
    v[s + 4] = damp(countWords(counts, {"async", "await", "promise", "future"}));
    v[s + 5] = damp(countWords(counts, {"nested", "deep", "complex", "recursive"}));
    v[s + 6] = damp(countSubstrs(lower, {"&&", "||"}) + countWords(counts, {"and", "or", "not"}));
    v[s + 7] = damp(comments);

    if (!query) {
        const size_t nonBlank = lines.size() - blankLines;
        const size_t z = kStructureSizeOffset;
        v[z + 0] = std::min(static_cast<float>(text.size()) / 1000.0f, 1.0f);
        v[z + 1] = std::min(static_cast<float>(words.size()) / 100.0f, 1.0f);
        v[z + 2] = std::min(static_cast<float>(countSubstr(text, "\n")) / 50.0f, 1.0f);
        v[z + 3] = std::min(static_cast<float>(countSubstr(text, "    ")) / 20.0f, 1.0f);
        v[z + 4] = std::min(static_cast<float>(countSubstr(text, "{")) / 10.0f, 1.0f);
        v[z + 5] = std::min(static_cast<float>(countSubstr(text, "(")) / 20.0f, 1.0f);
        v[z + 6] = nonBlank ? std::min(static_cast<float>(lineChars) / nonBlank / 80.0f, 1.0f)
                            : 0.0f;
        v[z + 7] = lines.empty() ? 0.0f
                                 : static_cast<float>(blankLines) / static_cast<float>(lines.size());
    } else {
        // Intent words steer the query toward risk and complexity signals
        for (const auto& word : words) {
            if (startsWithAny(word, {"secur", "risk", "unsafe", "inject", "exploit", "danger",
                                     "insecure", "attack", "malicious"}) ||
                word.find("vulnerab") != std::string::npos) {
                v[kAnyRiskSlot] += 1.0f;
            }
            if (startsWithAny(word, {"deserializ", "serializ", "pickle"})) {
                v[r + 3] += 1.0f;
                v[r + 4] += 1.0f;
                v[r + 5] += 1.0f;
            }
            if (word == "sql") {
                v[r + 7] += 1.0f;
                v[r + 8] += 1.0f;
            }
            if (startsWithAny(word, {"shell", "command"})) {
                v[r + 9] += 1.0f;
                v[r + 10] += 1.0f;
                v[r + 11] += 1.0f;
            }
            if (startsWithAny(word, {"password", "secret", "credential"})) {
                v[r + 13] += 1.0f;
            }
            if (startsWithAny(word, {"loop", "iterat"})) {
                v[s + 0] += 1.0f;
            }
            if (startsWithAny(word, {"condition", "branch"})) {
                v[s + 1] += 1.0f;
            }
            if (startsWithAny(word, {"nested", "nesting", "deep", "depth", "indent"})) {
                v[s + 2] += 1.0f;
            }
            if (startsWithAny(word, {"complex"})) {
                v[s + 0] += 1.0f;
                v[s + 1] += 1.0f;
                v[s + 2] += 1.0f;
            }
            if (startsWithAny(word, {"exception", "error"})) {
                v[s + 3] += 1.0f;
            }
            if (startsWithAny(word, {"concurren", "parallel"})) {
                v[s + 4] += 1.0f;
            }
            if (startsWithAny(word, {"recurs"})) {
                v[s + 5] += 1.0f;
            }
        }
    }

    // Vocabulary term frequencies; lookups only, the vocabulary is frozen here
    const size_t slots = config_.dimension - kVocabularyOffset;
    if (!words.empty()) {
        const float total = static_cast<float>(words.size());
        for (const auto& [word, count] : counts) {
            if (word.size() <= 2) {
                continue;
            }
            auto it = vocab_.find(word);
            if (it != vocab_.end()) {
                v[kVocabularyOffset + it->second % slots] += static_cast<float>(count) / total;
            }
        }
    }

    normalizeSlice(v, kDefinitionOffset, kImportOffset, config_.definition_weight);
    normalizeSlice(v, kImportOffset, kRiskOffset, config_.import_weight);
    normalizeSlice(v, kRiskOffset, kStructureOffset, config_.risk_weight);
    normalizeSlice(v, kStructureOffset, kVocabularyOffset, config_.structure_weight);
    normalizeSlice(v, kVocabularyOffset, config_.dimension, config_.vocabulary_weight);
    return v;
}

} // namespace coderag::vector
