#include <coderag/config/config_helpers.h>
#include <coderag/crypto/hasher.h>
#include <coderag/search/retrieval_engine.h>

#include <spdlog/spdlog.h>
#include <fmt/format.h>

#include <algorithm>
#include <cctype>
#include <fstream>
#include <set>
#include <sstream>
#include <unordered_map>
#include <utility>

namespace coderag::search {

namespace {

constexpr std::string_view kBlockSeparator = "\n---\n";
constexpr std::string_view kTruncationMarker = "\n... (truncated)";

size_t trimmedSize(std::string_view text) {
    auto first = std::find_if(text.begin(), text.end(),
                              [](unsigned char ch) { return !std::isspace(ch); });
    auto last = std::find_if(text.rbegin(), text.rend(),
                             [](unsigned char ch) { return !std::isspace(ch); })
                    .base();
    return first < last ? static_cast<size_t>(last - first) : 0;
}

// Longest prefix of at most `limit` bytes that does not split a UTF-8 sequence
std::string_view utf8Prefix(std::string_view text, size_t limit) {
    if (text.size() <= limit) {
        return text;
    }
    size_t cut = limit;
    while (cut > 0 && (static_cast<unsigned char>(text[cut]) & 0xC0) == 0x80) {
        --cut;
    }
    return text.substr(0, cut);
}

std::vector<storage::TrackedFile> trackedFiles(const std::map<std::string, storage::TrackedFile>& files) {
    std::vector<storage::TrackedFile> out;
    out.reserve(files.size());
    for (const auto& [path, file] : files) {
        out.push_back(file);
    }
    return out;
}

} // namespace

RetrievalEngine::RetrievalEngine(config::EngineConfig config)
    : config_(std::move(config)),
      chunker_(config_.chunker),
      selector_(config_.selector, config_.features) {
    if (config_.enable_persistence) {
        auto dataDir = config_.data_dir.empty() ? config::resolve_data_dir() : config_.data_dir;
        store_ = std::make_unique<storage::SnapshotStore>(dataDir / "snapshots");
    }

    selector_.initialize();

    auto state = std::make_shared<IndexState>();
    if (auto backend = migrate({}); backend) {
        state->backend = std::move(backend).value();
    } else {
        spdlog::error("Failed to create retrieval backend: {}", backend.error().message);
        state->backend = std::make_unique<vector::KeywordRetrievalBackend>();
    }
    state_ = std::move(state);
}

RetrievalEngine::~RetrievalEngine() = default;

std::shared_ptr<const RetrievalEngine::IndexState> RetrievalEngine::currentState() const {
    std::lock_guard<std::mutex> lock(stateMutex_);
    return state_;
}

void RetrievalEngine::publish(std::shared_ptr<const IndexState> state) {
    std::lock_guard<std::mutex> lock(stateMutex_);
    state_ = std::move(state);
}

std::optional<RetrievalEngine::PreparedFile>
RetrievalEngine::prepare(const SourceFile& file, const analysis::AnalysisResults& analysis) const {
    PreparedFile prepared;
    prepared.path = file.path;
    prepared.tracked.path = file.path.lexically_normal().generic_string();

    if (file.content) {
        prepared.content = *file.content;
    } else {
        std::ifstream in(file.path, std::ios::binary);
        if (!in) {
            spdlog::warn("Skipping {}: {}", prepared.tracked.path,
                         errorToString(ErrorCode::FileNotFound));
            return std::nullopt;
        }
        std::ostringstream buffer;
        buffer << in.rdbuf();
        if (in.bad()) {
            spdlog::warn("Skipping {}: read failed", prepared.tracked.path);
            return std::nullopt;
        }
        prepared.content = buffer.str();
    }

    if (prepared.content.find('\0') != std::string::npos) {
        spdlog::warn("Skipping {}: {} (binary content)", prepared.tracked.path,
                     errorToString(ErrorCode::InvalidData));
        return std::nullopt;
    }

    if (file.mtime) {
        prepared.tracked.mtime = *file.mtime;
    } else if (!file.content) {
        std::error_code ec;
        auto written = std::filesystem::last_write_time(file.path, ec);
        if (!ec) {
            prepared.tracked.mtime = static_cast<int64_t>(written.time_since_epoch().count());
        }
    }

    const auto* facts = analysis.find(prepared.tracked.path);
    if (!facts) {
        facts = analysis.find(file.path.string());
    }
    if (file.language && !file.language->empty()) {
        prepared.language = detection::languageFromString(*file.language);
    } else if (facts && !facts->language.empty()) {
        prepared.language = detection::languageFromString(facts->language);
    }
    if (prepared.language == detection::Language::Unknown) {
        prepared.language = detection::detectLanguage(file.path);
    }
    prepared.language_name = std::string(detection::languageToString(prepared.language));

    prepared.tracked.content_hash = crypto::SHA256Hasher::hash(prepared.content);
    return prepared;
}

std::vector<vector::IndexRecord>
RetrievalEngine::buildRecords(const PreparedFile& file,
                              const analysis::AnalysisResults& analysis) const {
    const auto* facts = analysis.find(file.tracked.path);
    if (!facts) {
        facts = analysis.find(file.path.string());
    }

    std::vector<std::string> categories;
    if (facts) {
        std::set<std::string> unique;
        for (const auto& issue : facts->issues) {
            unique.insert(issue.category);
        }
        categories.assign(unique.begin(), unique.end());
    }

    const auto fileName = file.path.filename().string();
    std::vector<vector::IndexRecord> records;
    size_t skipped = 0;
    for (const auto& chunk : chunker_.split(file.tracked.path, file.content, file.language)) {
        if (trimmedSize(chunk.text) < config_.min_chunk_chars) {
            ++skipped;
            continue;
        }

        vector::IndexRecord record;
        auto& meta = record.metadata;
        meta.chunk_id = chunk.id;
        meta.file_name = fileName;
        meta.file_path = file.tracked.path;
        meta.language = file.language_name;
        meta.issue_count = facts ? facts->issues.size() : 0;
        meta.issue_categories = categories;
        meta.complexity_score = facts ? facts->complexity_score : 0.0;
        meta.chunk_index = chunk.ordinal;
        meta.start_line = chunk.start_line;
        meta.end_line = chunk.end_line;
        meta.content_type = vector::classifyContent(chunk.text);
        auto flags = vector::detectChunkFlags(chunk.text);
        meta.has_functions = flags.has_functions;
        meta.has_imports = flags.has_imports;
        meta.has_security = flags.has_security;
        meta.token_count = vector::countTokens(chunk.text);

        record.embedding.chunk_id = chunk.id;
        record.text = chunk.text;
        records.push_back(std::move(record));
    }

    if (skipped > 0) {
        spdlog::debug("{}: skipped {} chunk(s) shorter than {} chars", file.tracked.path, skipped,
                      config_.min_chunk_chars);
    }
    return records;
}

size_t RetrievalEngine::ingest(const std::vector<SourceFile>& files,
                               const analysis::AnalysisResults& analysis, std::stop_token stop) {
    std::lock_guard<std::mutex> lock(ingestMutex_);
    selector_.initialize();

    // Later duplicates of a path replace earlier ones
    std::vector<PreparedFile> prepared;
    std::unordered_map<std::string, size_t> positions;
    for (const auto& file : files) {
        auto entry = prepare(file, analysis);
        if (!entry) {
            continue;
        }
        if (auto it = positions.find(entry->tracked.path); it != positions.end()) {
            prepared[it->second] = std::move(*entry);
        } else {
            positions.emplace(entry->tracked.path, prepared.size());
            prepared.push_back(std::move(*entry));
        }
    }
    if (prepared.empty()) {
        return 0;
    }

    auto current = currentState();
    if (store_ && current->files.empty() && current->backend->size() == 0) {
        std::vector<storage::TrackedFile> tracked;
        tracked.reserve(prepared.size());
        for (const auto& file : prepared) {
            tracked.push_back(file.tracked);
        }
        if (auto restored = restoreSnapshot(tracked)) {
            const size_t count = restored->backend->size();
            publish(std::move(restored));
            return count;
        }
    }

    auto next = std::make_shared<IndexState>();
    next->backend = current->backend->clone();
    next->files = current->files;
    next->fingerprint = current->fingerprint;
    next->persisted = current->persisted;
    next->stored_fingerprint = current->stored_fingerprint;

    struct Pending {
        const PreparedFile* file;
        std::vector<vector::IndexRecord> records;
    };

    size_t count = 0;
    std::vector<Pending> pending;
    for (const auto& file : prepared) {
        auto it = next->files.find(file.tracked.path);
        if (it != next->files.end() && it->second.sameVersion(file.tracked)) {
            count += it->second.chunk_ids.size();
            continue;
        }
        pending.push_back({&file, buildRecords(file, analysis)});
    }
    if (pending.empty()) {
        spdlog::debug("All {} file(s) unchanged, index not modified", prepared.size());
        return count;
    }

    // Vocabulary is fixed before any of the new chunks is embedded
    std::vector<std::string> texts;
    for (const auto& entry : pending) {
        for (const auto& record : entry.records) {
            texts.push_back(record.text);
        }
    }
    next->backend->learn(texts);

    bool cancelled = false;
    size_t done = 0;
    for (const auto& entry : pending) {
        if (stop.stop_requested()) {
            cancelled = true;
            break;
        }
        const auto& key = entry.file->tracked.path;
        if (auto it = next->files.find(key); it != next->files.end()) {
            next->backend->remove(it->second.chunk_ids);
            next->files.erase(it);
        }
        ++done;

        std::vector<std::string> ids;
        ids.reserve(entry.records.size());
        for (const auto& record : entry.records) {
            ids.push_back(record.id());
        }

        Result<size_t> added = size_t{0};
        if (!entry.records.empty()) {
            added = next->backend->add(entry.records);
            if (!added && next->backend->capability() == vector::BackendCapability::FullSemantic) {
                selector_.demote();
                auto migrated = migrate(next->backend->records(), texts);
                if (migrated) {
                    next->backend = std::move(migrated).value();
                    added = next->backend->add(entry.records);
                } else {
                    spdlog::error("Failed to migrate index after provider failure: {}",
                                  migrated.error().message);
                }
            }
        }
        if (!added) {
            spdlog::warn("Skipping {}: {}", key, added.error().message);
            continue;
        }

        auto tracked = entry.file->tracked;
        tracked.chunk_ids = std::move(ids);
        next->files[key] = std::move(tracked);
        count += added.value();
    }

    next->fingerprint = storage::computeCorpusFingerprint(trackedFiles(next->files));
    next->persisted = false;
    if (cancelled) {
        spdlog::warn("Ingestion stopped after {} of {} changed file(s); snapshot not written", done,
                     pending.size());
    } else {
        persist(*next);
    }

    const size_t total = next->backend->size();
    publish(std::move(next));
    spdlog::info("Indexed {} chunk(s) from {} file(s); {} chunk(s) total on {}", count,
                 prepared.size(), total, backendStateToString(selector_.state()));
    return count;
}

bool RetrievalEngine::load(const std::vector<SourceFile>& files) {
    std::lock_guard<std::mutex> lock(ingestMutex_);
    selector_.initialize();

    const analysis::AnalysisResults none;
    std::map<std::string, storage::TrackedFile> unique;
    for (const auto& file : files) {
        if (auto entry = prepare(file, none)) {
            unique[entry->tracked.path] = std::move(entry->tracked);
        }
    }
    if (unique.empty()) {
        return false;
    }

    auto restored = restoreSnapshot(trackedFiles(unique));
    if (!restored) {
        return false;
    }
    publish(std::move(restored));
    return true;
}

Result<std::unique_ptr<vector::IRetrievalBackend>>
RetrievalEngine::migrate(const std::vector<vector::IndexRecord>& records,
                         const std::vector<std::string>& learn_texts) {
    for (;;) {
        auto created = selector_.createBackend();
        if (!created) {
            return created.error();
        }
        auto backend = std::move(created).value();

        std::vector<std::string> texts = learn_texts;
        for (const auto& record : records) {
            texts.push_back(record.text);
        }
        backend->learn(texts);

        if (!records.empty()) {
            auto added = backend->add(records);
            if (!added) {
                if (selector_.state() == BackendState::KeywordOnly) {
                    return added.error();
                }
                selector_.demote();
                continue;
            }
            spdlog::info("Moved {} record(s) to {}", added.value(),
                         backendStateToString(selector_.state()));
        }
        return backend;
    }
}

std::shared_ptr<RetrievalEngine::IndexState>
RetrievalEngine::restoreSnapshot(const std::vector<storage::TrackedFile>& files) {
    if (!store_ || files.empty()) {
        return nullptr;
    }
    auto capability = capabilityOf(selector_.state());
    if (!capability) {
        return nullptr;
    }

    auto fingerprint = storage::computeCorpusFingerprint(files);
    auto snapshot = store_->load(fingerprint, *capability);
    if (!snapshot) {
        spdlog::debug("No usable snapshot for corpus {}", fingerprint.substr(0, 12));
        return nullptr;
    }

    auto created = selector_.createBackend();
    if (!created) {
        return nullptr;
    }
    auto state = std::make_shared<IndexState>();
    state->backend = std::move(created).value();

    auto& data = snapshot.value();
    if (data.dimension != state->backend->dimension()) {
        spdlog::warn("Snapshot {} has {} dims, backend expects {}", fingerprint.substr(0, 12),
                     data.dimension, state->backend->dimension());
        return nullptr;
    }
    if (auto restored = state->backend->restoreVocabulary(data.vocabulary); !restored) {
        spdlog::warn("Snapshot vocabulary rejected: {}", restored.error().message);
        return nullptr;
    }
    if (auto restored = state->backend->restore(std::move(data.records)); !restored) {
        spdlog::warn("Snapshot records rejected: {}", restored.error().message);
        return nullptr;
    }
    for (auto& file : data.files) {
        auto key = file.path;
        state->files.emplace(std::move(key), std::move(file));
    }
    state->fingerprint = std::move(fingerprint);
    state->persisted = true;
    state->stored_fingerprint = state->fingerprint;

    spdlog::info("Loaded snapshot {} ({} chunks, {} files)", state->fingerprint.substr(0, 12),
                 state->backend->size(), state->files.size());
    return state;
}

void RetrievalEngine::persist(IndexState& state) {
    if (!store_ || state.fingerprint.empty()) {
        return;
    }
    storage::Snapshot snapshot;
    snapshot.backend = state.backend->capability();
    snapshot.dimension = state.backend->dimension();
    snapshot.records = state.backend->records();
    snapshot.vocabulary = state.backend->vocabulary();
    snapshot.files = trackedFiles(state.files);

    if (auto saved = store_->save(snapshot, state.fingerprint); !saved) {
        spdlog::warn("Failed to persist index snapshot: {}", saved.error().message);
        state.persisted = false;
        return;
    }
    state.persisted = true;

    const auto superseded = std::exchange(state.stored_fingerprint, state.fingerprint);
    if (!superseded.empty() && superseded != state.fingerprint) {
        if (auto removed = store_->remove(superseded); !removed) {
            spdlog::warn("Failed to remove superseded snapshot {}: {}", superseded.substr(0, 12),
                         removed.error().message);
        } else {
            spdlog::debug("Removed superseded snapshot {}", superseded.substr(0, 12));
        }
    }
}

bool RetrievalEngine::recoverFromProviderFailure(const IndexState& failed) {
    std::lock_guard<std::mutex> lock(ingestMutex_);
    auto current = currentState();
    if (current.get() != &failed) {
        // Someone already replaced the failed state
        return true;
    }
    if (selector_.state() == BackendState::FullSemantic) {
        selector_.demote();
    }

    auto migrated = migrate(failed.backend->records());
    if (!migrated) {
        spdlog::error("Failed to migrate index after provider failure: {}",
                      migrated.error().message);
        return false;
    }

    auto next = std::make_shared<IndexState>();
    next->backend = std::move(migrated).value();
    next->files = failed.files;
    next->fingerprint = failed.fingerprint;
    next->stored_fingerprint = failed.stored_fingerprint;
    if (!next->files.empty()) {
        persist(*next);
    }
    publish(std::move(next));
    return true;
}

std::string RetrievalEngine::query(const std::string& question, size_t top_k,
                                   std::stop_token stop) {
    const size_t k = top_k == 0 ? config_.default_top_k : top_k;
    auto hits = search(question, k, {}, stop);
    if (!hits) {
        spdlog::warn("Query failed: {}", hits.error().message);
        return {};
    }
    if (hits.value().empty() || stop.stop_requested()) {
        return {};
    }

    std::string context;
    for (const auto& hit : hits.value()) {
        if (!context.empty()) {
            context += kBlockSeparator;
        }
        context += formatRecord(hit, config_.max_snippet_chars);
    }
    return context;
}

Result<vector::RetrievalResult> RetrievalEngine::search(const std::string& question, size_t top_k,
                                                        const vector::SearchFilter& filter,
                                                        std::stop_token stop) {
    if (question.empty() || top_k == 0) {
        return vector::RetrievalResult{};
    }
    const auto* constraints = filter.hasFilters() ? &filter : nullptr;

    // At most one retry per tier below FULL_SEMANTIC
    for (int attempt = 0; attempt < 3; ++attempt) {
        auto state = currentState();
        if (stop.stop_requested() || state->backend->size() == 0) {
            return vector::RetrievalResult{};
        }

        auto hits = state->backend->search(question, top_k, constraints, stop);
        if (hits) {
            const bool keyword =
                state->backend->capability() == vector::BackendCapability::KeywordOnly;
            const float threshold = keyword ? 0.0f : config_.min_similarity;
            auto& results = hits.value();
            results.erase(std::remove_if(results.begin(), results.end(),
                                         [threshold](const vector::ScoredRecord& hit) {
                                             return hit.score <= threshold;
                                         }),
                          results.end());
            return hits;
        }

        if (state->backend->capability() != vector::BackendCapability::FullSemantic ||
            !recoverFromProviderFailure(*state)) {
            return hits.error();
        }
        spdlog::info("Retrying query on {}", backendStateToString(selector_.state()));
    }
    return Error{ErrorCode::InternalError, "Query failed on every retrieval tier"};
}

bool RetrievalEngine::isAvailable() const {
    return selector_.state() != BackendState::Uninitialized;
}

EngineStats RetrievalEngine::stats() const {
    auto state = currentState();
    EngineStats stats;
    stats.backend = std::string(backendStateToString(selector_.state()));
    stats.indexed_chunks = state->backend->size();
    stats.persisted = state->persisted;
    stats.files = state->files.size();
    stats.vocabulary_size = state->backend->vocabulary().size();
    stats.fingerprint = state->fingerprint;

    size_t totalChars = 0;
    for (const auto& record : state->backend->records()) {
        ++stats.languages[record.metadata.language];
        totalChars += record.text.size();
    }
    if (stats.indexed_chunks > 0) {
        stats.avg_chunk_size =
            static_cast<double>(totalChars) / static_cast<double>(stats.indexed_chunks);
    }
    return stats;
}

void RetrievalEngine::clear() {
    std::lock_guard<std::mutex> lock(ingestMutex_);
    auto state = std::make_shared<IndexState>();
    if (auto backend = selector_.createBackend(); backend) {
        state->backend = std::move(backend).value();
    } else {
        state->backend = std::make_unique<vector::KeywordRetrievalBackend>();
    }
    publish(std::move(state));
    spdlog::info("Index cleared");
}

BackendState RetrievalEngine::reinitialize() {
    std::lock_guard<std::mutex> lock(ingestMutex_);
    auto current = currentState();
    selector_.reinitialize();

    auto migrated = migrate(current->backend->records());
    if (!migrated) {
        spdlog::error("Failed to rebuild index on {}: {}", backendStateToString(selector_.state()),
                      migrated.error().message);
        return selector_.state();
    }

    auto next = std::make_shared<IndexState>();
    next->backend = std::move(migrated).value();
    next->files = current->files;
    next->fingerprint = current->fingerprint;
    next->stored_fingerprint = current->stored_fingerprint;
    if (!next->files.empty()) {
        persist(*next);
    }
    publish(std::move(next));
    return selector_.state();
}

std::string RetrievalEngine::formatRecord(const vector::ScoredRecord& hit,
                                          size_t max_snippet_chars) {
    const auto& meta = hit.record.metadata;

    std::string_view code = hit.record.text;
    if (!code.empty() && code.back() == '\n') {
        code.remove_suffix(1);
    }
    std::string snippet;
    if (max_snippet_chars > 0 && code.size() > max_snippet_chars) {
        snippet = std::string(utf8Prefix(code, max_snippet_chars));
        snippet += kTruncationMarker;
    } else {
        snippet = std::string(code);
    }

    return fmt::format("File: {} ({})\n"
                       "Issues: {} | Complexity: {:g}\n"
                       "Content Type: {}\n"
                       "Similarity: {:.3f} | Lines: {}-{}\n"
                       "\n"
                       "Code:\n"
                       "```{}\n"
                       "{}\n"
                       "```",
                       meta.file_name, meta.language, meta.issue_count, meta.complexity_score,
                       vector::contentTypeToString(meta.content_type), hit.score, meta.start_line,
                       meta.end_line, meta.language, snippet);
}

} // namespace coderag::search
