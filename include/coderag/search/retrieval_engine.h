#pragma once

#include <coderag/analysis/analysis_results.h>
#include <coderag/chunking/code_chunker.h>
#include <coderag/config/engine_config.h>
#include <coderag/core/types.h>
#include <coderag/search/backend_selector.h>
#include <coderag/storage/corpus_fingerprint.h>
#include <coderag/storage/snapshot_store.h>
#include <coderag/vector/index_record.h>
#include <coderag/vector/retrieval_backend.h>

#include <cstdint>
#include <filesystem>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <stop_token>
#include <string>
#include <vector>

namespace coderag::search {

/**
 * One corpus file handed to ingest(). Missing fields are derived: content
 * is read from disk, language is detected from the extension (or taken
 * from the analysis results), mtime comes from the filesystem.
 */
struct SourceFile {
    std::filesystem::path path;
    std::optional<std::string> language;
    std::optional<std::string> content;
    std::optional<int64_t> mtime;
};

struct EngineStats {
    std::string backend; // BackendState name
    size_t indexed_chunks = 0;
    bool persisted = false;
    size_t files = 0;
    size_t vocabulary_size = 0;
    std::map<std::string, size_t> languages; // Chunks per language
    double avg_chunk_size = 0.0;
    std::string fingerprint;
};

/**
 * Retrieval facade: chunk -> embed -> index on the write path, embed
 * query -> search -> formatted context on the read path.
 *
 * Ingestion calls are serialized. Readers work on an immutable published
 * index state: ingestion builds a copy and swaps it in when done, so
 * queries never wait for ingestion and see either the old or the new
 * state, never a mix.
 */
class RetrievalEngine {
public:
    explicit RetrievalEngine(config::EngineConfig config = {});
    ~RetrievalEngine();

    RetrievalEngine(const RetrievalEngine&) = delete;
    RetrievalEngine& operator=(const RetrievalEngine&) = delete;

    /**
     * Add or refresh files. Unchanged files (same content hash and mtime)
     * keep their chunks; changed files are re-chunked. Unreadable files are
     * logged and skipped. A stop request publishes the files finished so
     * far and skips persistence.
     * @return Number of chunks indexed for the given files
     */
    size_t ingest(const std::vector<SourceFile>& files,
                  const analysis::AnalysisResults& analysis = {}, std::stop_token stop = {});

    // Load the snapshot matching these files' fingerprint, if one exists
    bool load(const std::vector<SourceFile>& files);

    /**
     * Labeled context blocks for the best matches, joined by "\n---\n".
     * top_k of 0 uses the configured default. Empty when nothing relevant
     * is indexed or the stop token fires.
     */
    std::string query(const std::string& question, size_t top_k = 0, std::stop_token stop = {});

    Result<vector::RetrievalResult> search(const std::string& question, size_t top_k,
                                           const vector::SearchFilter& filter = {},
                                           std::stop_token stop = {});

    bool isAvailable() const;
    EngineStats stats() const;
    BackendState backendState() const { return selector_.state(); }

    // Drops the in-memory index; snapshots on disk are kept
    void clear();

    // Re-run backend selection from the top and move existing records over
    BackendState reinitialize();

    const config::EngineConfig& getConfig() const { return config_; }

    static std::string formatRecord(const vector::ScoredRecord& hit, size_t max_snippet_chars);

private:
    struct IndexState {
        std::unique_ptr<vector::IRetrievalBackend> backend;
        std::map<std::string, storage::TrackedFile> files; // Keyed by normalized path
        std::string fingerprint;
        bool persisted = false;
        std::string stored_fingerprint; // Snapshot on disk backing this state, if any
    };

    // A readable input file with its identity resolved
    struct PreparedFile {
        storage::TrackedFile tracked; // path is the normalized key
        std::filesystem::path path;
        std::string content;
        detection::Language language = detection::Language::Unknown;
        std::string language_name;
    };

    std::shared_ptr<const IndexState> currentState() const;
    void publish(std::shared_ptr<const IndexState> state);

    std::optional<PreparedFile> prepare(const SourceFile& file,
                                        const analysis::AnalysisResults& analysis) const;
    std::vector<vector::IndexRecord> buildRecords(const PreparedFile& file,
                                                  const analysis::AnalysisResults& analysis) const;

    // Fresh backend for the selector's tier holding `records`, demoting on failure.
    // `learn_texts` are folded into the vocabulary along with the records.
    Result<std::unique_ptr<vector::IRetrievalBackend>>
    migrate(const std::vector<vector::IndexRecord>& records,
            const std::vector<std::string>& learn_texts = {});

    std::shared_ptr<IndexState> restoreSnapshot(const std::vector<storage::TrackedFile>& files);

    // Saves under state.fingerprint and drops the snapshot it supersedes
    void persist(IndexState& state);

    // Called with a failed FULL_SEMANTIC state; true when a retry makes sense
    bool recoverFromProviderFailure(const IndexState& failed);

    config::EngineConfig config_;
    chunking::CodeChunker chunker_;
    BackendSelector selector_;
    std::unique_ptr<storage::SnapshotStore> store_;

    std::mutex ingestMutex_;
    mutable std::mutex stateMutex_;
    std::shared_ptr<const IndexState> state_;
};

} // namespace coderag::search
