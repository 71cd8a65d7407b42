#pragma once

#include <coderag/core/types.h>
#include <coderag/storage/corpus_fingerprint.h>
#include <coderag/vector/index_record.h>

#include <cstdint>
#include <filesystem>
#include <string>
#include <vector>

namespace coderag::storage {

/**
 * Everything needed to rebuild an index without re-embedding
 */
struct Snapshot {
    vector::BackendCapability backend = vector::BackendCapability::FeatureHeuristic;
    size_t dimension = 0;
    std::vector<vector::IndexRecord> records;
    std::vector<std::string> vocabulary;
    std::vector<TrackedFile> files;
};

/**
 * Sidecar describing a payload file
 */
struct SnapshotManifest {
    uint32_t format_version = 0;
    std::string fingerprint;
    vector::BackendCapability backend = vector::BackendCapability::FeatureHeuristic;
    size_t dimension = 0;
    size_t record_count = 0;
    std::string payload_sha256;
    std::string created_at; // ISO-8601 UTC
};

/**
 * Fingerprint-keyed snapshot persistence.
 *
 * Layout per fingerprint inside the store directory:
 *   <fp>.snap   binary payload (records, vocabulary, tracked files)
 *   <fp>.json   manifest (format version, backend, dimension, record
 *               count, payload SHA-256, created_at)
 * Both files are written to a temporary name and renamed into place.
 *
 * load() reports every unusable snapshot (missing, corrupt, checksum or
 * version mismatch, other backend) as NotFound; the reason is logged.
 */
class SnapshotStore {
public:
    static constexpr uint32_t kFormatVersion = 1;

    explicit SnapshotStore(std::filesystem::path directory);

    Result<void> save(const Snapshot& snapshot, const std::string& fingerprint);

    Result<Snapshot> load(const std::string& fingerprint, vector::BackendCapability backend) const;

    Result<SnapshotManifest> readManifest(const std::string& fingerprint) const;

    bool exists(const std::string& fingerprint) const;

    Result<void> remove(const std::string& fingerprint);

    const std::filesystem::path& directory() const { return directory_; }
    std::filesystem::path manifestPath(const std::string& fingerprint) const;
    std::filesystem::path payloadPath(const std::string& fingerprint) const;

private:
    Result<Snapshot> readSnapshot(const std::string& fingerprint,
                                  vector::BackendCapability backend) const;

    std::filesystem::path directory_;
};

} // namespace coderag::storage
