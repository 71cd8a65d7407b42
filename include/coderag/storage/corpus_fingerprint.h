#pragma once

#include <cstdint>
#include <string>
#include <vector>

namespace coderag::storage {

/**
 * A source file the index holds chunks for
 */
struct TrackedFile {
    std::string path;
    std::string content_hash; // SHA-256 hex
    int64_t mtime = 0;        // file_clock ticks, 0 when unknown
    std::vector<std::string> chunk_ids;

    bool sameVersion(const TrackedFile& other) const {
        return content_hash == other.content_hash && mtime == other.mtime;
    }
};

/**
 * SHA-256 over the (path, content hash, mtime) tuples sorted by path.
 * Any change to a single file's hash or mtime changes the fingerprint.
 */
std::string computeCorpusFingerprint(const std::vector<TrackedFile>& files);

} // namespace coderag::storage
