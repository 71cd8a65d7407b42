#include <coderag/crypto/hasher.h>
#include <coderag/storage/corpus_fingerprint.h>

#include <algorithm>

namespace coderag::storage {

std::string computeCorpusFingerprint(const std::vector<TrackedFile>& files) {
    std::vector<const TrackedFile*> sorted;
    sorted.reserve(files.size());
    for (const auto& file : files) {
        sorted.push_back(&file);
    }
    std::sort(sorted.begin(), sorted.end(),
              [](const TrackedFile* a, const TrackedFile* b) { return a->path < b->path; });

    crypto::SHA256Hasher hasher;
    const std::string_view separator("\0", 1);
    for (const auto* file : sorted) {
        hasher.update(file->path);
        hasher.update(separator);
        hasher.update(file->content_hash);
        hasher.update(separator);
        hasher.update(std::to_string(file->mtime));
        hasher.update(std::string_view("\n"));
    }
    return hasher.finalize();
}

} // namespace coderag::storage
