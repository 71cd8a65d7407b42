#include <coderag/crypto/hasher.h>
#include <coderag/storage/snapshot_store.h>

#include <fmt/chrono.h>
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include <chrono>
#include <cstring>
#include <fstream>
#include <sstream>
#include <stdexcept>

namespace coderag::storage {

using json = nlohmann::json;
using vector::BackendCapability;
using vector::IndexRecord;

namespace {

constexpr char kMagic[8] = {'C', 'R', 'A', 'G', 'S', 'N', 'A', 'P'};

enum : uint8_t {
    kFlagFunctions = 1 << 0,
    kFlagImports = 1 << 1,
    kFlagSecurity = 1 << 2,
};

class PayloadWriter {
public:
    template <typename T> void pod(T value) {
        out_.write(reinterpret_cast<const char*>(&value), sizeof(value));
    }

    void str(const std::string& s) {
        pod<uint64_t>(s.size());
        out_.write(s.data(), static_cast<std::streamsize>(s.size()));
    }

    void floats(const std::vector<float>& v) {
        pod<uint64_t>(v.size());
        out_.write(reinterpret_cast<const char*>(v.data()),
                   static_cast<std::streamsize>(v.size() * sizeof(float)));
    }

    void strings(const std::vector<std::string>& v) {
        pod<uint64_t>(v.size());
        for (const auto& s : v) {
            str(s);
        }
    }

    std::string take() const { return out_.str(); }

private:
    std::ostringstream out_{std::ios::binary};
};

// Bounds-checked reader over an in-memory payload; throws on truncation
class PayloadReader {
public:
    explicit PayloadReader(std::string_view data) : data_(data) {}

    template <typename T> T pod() {
        need(sizeof(T));
        T value;
        std::memcpy(&value, data_.data() + pos_, sizeof(T));
        pos_ += sizeof(T);
        return value;
    }

    std::string str() {
        auto len = pod<uint64_t>();
        need(len);
        std::string s(data_.substr(pos_, len));
        pos_ += len;
        return s;
    }

    std::vector<float> floats() {
        auto count = pod<uint64_t>();
        if (count > (data_.size() - pos_) / sizeof(float)) {
            throw std::runtime_error("vector length exceeds payload");
        }
        std::vector<float> v(count);
        std::memcpy(v.data(), data_.data() + pos_, count * sizeof(float));
        pos_ += count * sizeof(float);
        return v;
    }

    std::vector<std::string> strings() {
        auto count = pod<uint64_t>();
        if (count > data_.size() - pos_) {
            throw std::runtime_error("string count exceeds payload");
        }
        std::vector<std::string> v;
        v.reserve(count);
        for (uint64_t i = 0; i < count; ++i) {
            v.push_back(str());
        }
        return v;
    }

    bool atEnd() const { return pos_ == data_.size(); }

private:
    void need(uint64_t bytes) const {
        if (bytes > data_.size() - pos_) {
            throw std::runtime_error("truncated payload");
        }
    }

    std::string_view data_;
    size_t pos_ = 0;
};

std::string encodePayload(const Snapshot& snapshot) {
    PayloadWriter w;
    for (char c : kMagic) {
        w.pod(c);
    }
    w.pod<uint32_t>(SnapshotStore::kFormatVersion);
    w.pod<uint8_t>(static_cast<uint8_t>(snapshot.backend));
    w.pod<uint64_t>(snapshot.dimension);

    w.strings(snapshot.vocabulary);

    w.pod<uint64_t>(snapshot.files.size());
    for (const auto& file : snapshot.files) {
        w.str(file.path);
        w.str(file.content_hash);
        w.pod<int64_t>(file.mtime);
        w.strings(file.chunk_ids);
    }

    w.pod<uint64_t>(snapshot.records.size());
    for (const auto& record : snapshot.records) {
        const auto& m = record.metadata;
        w.str(m.chunk_id);
        w.str(record.text);
        w.floats(record.embedding.vector);
        w.str(m.file_name);
        w.str(m.file_path);
        w.str(m.language);
        w.pod<uint64_t>(m.issue_count);
        w.strings(m.issue_categories);
        w.pod<double>(m.complexity_score);
        w.pod<uint64_t>(m.chunk_index);
        w.pod<uint64_t>(m.start_line);
        w.pod<uint64_t>(m.end_line);
        w.pod<uint8_t>(static_cast<uint8_t>(m.content_type));
        uint8_t flags = 0;
        flags |= m.has_functions ? kFlagFunctions : 0;
        flags |= m.has_imports ? kFlagImports : 0;
        flags |= m.has_security ? kFlagSecurity : 0;
        w.pod<uint8_t>(flags);
        w.pod<uint64_t>(m.token_count);
    }
    return w.take();
}

Result<Snapshot> decodePayload(std::string_view data) {
    try {
        PayloadReader r(data);
        for (char c : kMagic) {
            if (r.pod<char>() != c) {
                return Error{ErrorCode::CorruptedData, "Bad snapshot magic"};
            }
        }
        auto version = r.pod<uint32_t>();
        if (version != SnapshotStore::kFormatVersion) {
            return Error{ErrorCode::InvalidData,
                         fmt::format("Unsupported snapshot format version {}", version)};
        }
        auto backendByte = r.pod<uint8_t>();
        if (backendByte > static_cast<uint8_t>(BackendCapability::KeywordOnly)) {
            return Error{ErrorCode::CorruptedData, "Unknown backend in snapshot payload"};
        }

        Snapshot snapshot;
        snapshot.backend = static_cast<BackendCapability>(backendByte);
        snapshot.dimension = r.pod<uint64_t>();
        snapshot.vocabulary = r.strings();

        auto fileCount = r.pod<uint64_t>();
        for (uint64_t i = 0; i < fileCount; ++i) {
            TrackedFile file;
            file.path = r.str();
            file.content_hash = r.str();
            file.mtime = r.pod<int64_t>();
            file.chunk_ids = r.strings();
            snapshot.files.push_back(std::move(file));
        }

        auto recordCount = r.pod<uint64_t>();
        for (uint64_t i = 0; i < recordCount; ++i) {
            IndexRecord record;
            auto& m = record.metadata;
            m.chunk_id = r.str();
            record.text = r.str();
            record.embedding.vector = r.floats();
            record.embedding.chunk_id = m.chunk_id;
            record.embedding.backend_tag = snapshot.backend;
            m.file_name = r.str();
            m.file_path = r.str();
            m.language = r.str();
            m.issue_count = r.pod<uint64_t>();
            m.issue_categories = r.strings();
            m.complexity_score = r.pod<double>();
            m.chunk_index = r.pod<uint64_t>();
            m.start_line = r.pod<uint64_t>();
            m.end_line = r.pod<uint64_t>();
            auto contentType = r.pod<uint8_t>();
            if (contentType > static_cast<uint8_t>(vector::ContentType::GeneralCode)) {
                return Error{ErrorCode::CorruptedData, "Unknown content type in snapshot"};
            }
            m.content_type = static_cast<vector::ContentType>(contentType);
            auto flags = r.pod<uint8_t>();
            m.has_functions = (flags & kFlagFunctions) != 0;
            m.has_imports = (flags & kFlagImports) != 0;
            m.has_security = (flags & kFlagSecurity) != 0;
            m.token_count = r.pod<uint64_t>();
            if (record.embedding.vector.size() != snapshot.dimension) {
                return Error{ErrorCode::CorruptedData,
                             fmt::format("Record {} has {} dimensions, snapshot declares {}",
                                         m.chunk_id, record.embedding.vector.size(),
                                         snapshot.dimension)};
            }
            snapshot.records.push_back(std::move(record));
        }
        if (!r.atEnd()) {
            return Error{ErrorCode::CorruptedData, "Trailing bytes after snapshot payload"};
        }
        return snapshot;
    } catch (const std::exception& e) {
        return Error{ErrorCode::CorruptedData, std::string("Snapshot payload: ") + e.what()};
    }
}

Result<void> writeAtomically(const std::filesystem::path& path, const std::string& contents) {
    auto tempPath = path;
    tempPath += ".tmp";
    {
        std::ofstream out(tempPath, std::ios::binary | std::ios::trunc);
        if (!out) {
            return Error{ErrorCode::WriteError, "Cannot open " + tempPath.string()};
        }
        out.write(contents.data(), static_cast<std::streamsize>(contents.size()));
        out.close();
        if (!out) {
            return Error{ErrorCode::WriteError, "Failed writing " + tempPath.string()};
        }
    }
    std::error_code ec;
    std::filesystem::rename(tempPath, path, ec);
    if (ec) {
        std::filesystem::remove(tempPath, ec);
        return Error{ErrorCode::WriteError, "Cannot rename into " + path.string()};
    }
    return Result<void>();
}

Result<std::string> readWhole(const std::filesystem::path& path) {
    std::ifstream in(path, std::ios::binary);
    if (!in) {
        return Error{ErrorCode::NotFound, "Missing " + path.string()};
    }
    std::ostringstream buffer;
    buffer << in.rdbuf();
    return buffer.str();
}

std::string nowIso8601() {
    auto now = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
    return fmt::format("{:%Y-%m-%dT%H:%M:%SZ}", fmt::gmtime(now));
}

} // namespace

SnapshotStore::SnapshotStore(std::filesystem::path directory) : directory_(std::move(directory)) {}

std::filesystem::path SnapshotStore::manifestPath(const std::string& fingerprint) const {
    return directory_ / (fingerprint + ".json");
}

std::filesystem::path SnapshotStore::payloadPath(const std::string& fingerprint) const {
    return directory_ / (fingerprint + ".snap");
}

bool SnapshotStore::exists(const std::string& fingerprint) const {
    std::error_code ec;
    return std::filesystem::exists(manifestPath(fingerprint), ec) &&
           std::filesystem::exists(payloadPath(fingerprint), ec);
}

Result<void> SnapshotStore::save(const Snapshot& snapshot, const std::string& fingerprint) {
    if (fingerprint.empty()) {
        return Error{ErrorCode::InvalidArgument, "Empty corpus fingerprint"};
    }
    std::error_code ec;
    std::filesystem::create_directories(directory_, ec);
    if (ec) {
        return Error{ErrorCode::WriteError,
                     fmt::format("Cannot create {}: {}", directory_.string(), ec.message())};
    }

    const std::string payload = encodePayload(snapshot);

    json manifest;
    manifest["format_version"] = kFormatVersion;
    manifest["fingerprint"] = fingerprint;
    manifest["backend"] = std::string(vector::capabilityToString(snapshot.backend));
    manifest["dimension"] = snapshot.dimension;
    manifest["record_count"] = snapshot.records.size();
    manifest["payload_sha256"] = crypto::SHA256Hasher::hash(payload);
    manifest["created_at"] = nowIso8601();

    // Payload first: a manifest never points at a missing payload
    if (auto result = writeAtomically(payloadPath(fingerprint), payload); !result) {
        return result;
    }
    if (auto result = writeAtomically(manifestPath(fingerprint), manifest.dump(2)); !result) {
        return result;
    }
    spdlog::debug("Saved snapshot {} ({} records, {} bytes)", fingerprint,
                  snapshot.records.size(), payload.size());
    return Result<void>();
}

Result<SnapshotManifest> SnapshotStore::readManifest(const std::string& fingerprint) const {
    auto text = readWhole(manifestPath(fingerprint));
    if (!text) {
        return text.error();
    }
    try {
        auto j = json::parse(text.value());
        SnapshotManifest manifest;
        manifest.format_version = j.at("format_version").get<uint32_t>();
        manifest.fingerprint = j.value("fingerprint", fingerprint);
        auto backend = vector::capabilityFromString(j.at("backend").get<std::string>());
        if (!backend) {
            return Error{ErrorCode::CorruptedData, "Unknown backend in manifest"};
        }
        manifest.backend = *backend;
        manifest.dimension = j.at("dimension").get<size_t>();
        manifest.record_count = j.at("record_count").get<size_t>();
        manifest.payload_sha256 = j.at("payload_sha256").get<std::string>();
        manifest.created_at = j.value("created_at", std::string());
        return manifest;
    } catch (const json::exception& e) {
        return Error{ErrorCode::CorruptedData, std::string("Bad snapshot manifest: ") + e.what()};
    }
}

Result<Snapshot> SnapshotStore::readSnapshot(const std::string& fingerprint,
                                             BackendCapability backend) const {
    auto manifest = readManifest(fingerprint);
    if (!manifest) {
        return manifest.error();
    }
    const auto& m = manifest.value();
    if (m.format_version != kFormatVersion) {
        return Error{ErrorCode::InvalidData,
                     fmt::format("Snapshot format version {} (expected {})", m.format_version,
                                 kFormatVersion)};
    }
    if (m.backend != backend) {
        return Error{ErrorCode::InvalidState,
                     fmt::format("Snapshot was built by {}, active backend is {}",
                                 vector::capabilityToString(m.backend),
                                 vector::capabilityToString(backend))};
    }

    auto payload = readWhole(payloadPath(fingerprint));
    if (!payload) {
        return Error{ErrorCode::CorruptedData, "Manifest present but payload missing"};
    }
    if (crypto::SHA256Hasher::hash(payload.value()) != m.payload_sha256) {
        return Error{ErrorCode::HashMismatch, "Snapshot payload checksum mismatch"};
    }

    auto snapshot = decodePayload(payload.value());
    if (!snapshot) {
        return snapshot.error();
    }
    if (snapshot.value().backend != m.backend || snapshot.value().dimension != m.dimension ||
        snapshot.value().records.size() != m.record_count) {
        return Error{ErrorCode::CorruptedData, "Snapshot payload disagrees with its manifest"};
    }
    return snapshot;
}

Result<Snapshot> SnapshotStore::load(const std::string& fingerprint,
                                     BackendCapability backend) const {
    auto snapshot = readSnapshot(fingerprint, backend);
    if (snapshot) {
        spdlog::debug("Loaded snapshot {} ({} records)", fingerprint,
                      snapshot.value().records.size());
        return snapshot;
    }
    const auto& error = snapshot.error();
    if (error.code == ErrorCode::NotFound) {
        spdlog::debug("No snapshot for fingerprint {}", fingerprint);
    } else if (error.code == ErrorCode::InvalidState) {
        spdlog::info("Ignoring snapshot {}: {}", fingerprint, error.message);
    } else {
        spdlog::warn("Unusable snapshot {} ({}): {}", fingerprint, error.code, error.message);
    }
    return Error{ErrorCode::NotFound, error.message};
}

Result<void> SnapshotStore::remove(const std::string& fingerprint) {
    std::error_code ec;
    std::filesystem::remove(manifestPath(fingerprint), ec);
    if (ec) {
        return Error{ErrorCode::WriteError, ec.message()};
    }
    std::filesystem::remove(payloadPath(fingerprint), ec);
    if (ec) {
        return Error{ErrorCode::WriteError, ec.message()};
    }
    return Result<void>();
}

} // namespace coderag::storage
