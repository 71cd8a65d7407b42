/**
 * @file snapshot_store_catch2_test.cpp
 * @brief Fingerprint-keyed index snapshots
 */

#include <catch2/catch_test_macros.hpp>
#include <coderag/storage/snapshot_store.h>

#include "common/test_helpers_catch2.h"

#include <nlohmann/json.hpp>

#include <fstream>

using namespace coderag;
using namespace coderag::storage;
using vector::BackendCapability;

namespace {

Snapshot makeSnapshot() {
    Snapshot snapshot;
    snapshot.backend = BackendCapability::FeatureHeuristic;
    snapshot.dimension = 3;
    snapshot.vocabulary = {"config", "parse"};

    vector::IndexRecord record;
    record.text = "def parse(config):\n    return config\n";
    record.embedding.vector = {0.5f, 0.25f, -1.0f};
    record.metadata.chunk_id = "chunk-0";
    record.metadata.file_name = "parse.py";
    record.metadata.file_path = "src/parse.py";
    record.metadata.language = "python";
    record.metadata.issue_count = 2;
    record.metadata.issue_categories = {"security", "style"};
    record.metadata.complexity_score = 4.5;
    record.metadata.start_line = 1;
    record.metadata.end_line = 2;
    record.metadata.content_type = vector::ContentType::FunctionDefinition;
    record.metadata.has_functions = true;
    record.metadata.has_security = true;
    record.metadata.token_count = 5;
    snapshot.records.push_back(record);

    snapshot.files.push_back({"src/parse.py", std::string(64, 'f'), 42, {"chunk-0"}});
    return snapshot;
}

} // namespace

TEST_CASE("SnapshotStore - round trip", "[storage][snapshot][catch2]") {
    test::TempDir dir("coderag_snapshot_");
    SnapshotStore store(dir.path());
    const auto snapshot = makeSnapshot();

    REQUIRE(store.save(snapshot, "fp1"));
    CHECK(store.exists("fp1"));

    auto loaded = store.load("fp1", BackendCapability::FeatureHeuristic);
    REQUIRE(loaded);
    const auto& s = loaded.value();
    CHECK(s.backend == BackendCapability::FeatureHeuristic);
    CHECK(s.dimension == 3);
    CHECK(s.vocabulary == snapshot.vocabulary);

    REQUIRE(s.files.size() == 1);
    CHECK(s.files[0].path == "src/parse.py");
    CHECK(s.files[0].mtime == 42);
    CHECK(s.files[0].chunk_ids == std::vector<std::string>{"chunk-0"});

    REQUIRE(s.records.size() == 1);
    const auto& r = s.records[0];
    CHECK(r.text == snapshot.records[0].text);
    CHECK(r.embedding.vector == snapshot.records[0].embedding.vector);
    CHECK(r.embedding.chunk_id == "chunk-0");
    CHECK(r.metadata.issue_categories == snapshot.records[0].metadata.issue_categories);
    CHECK(r.metadata.complexity_score == 4.5);
    CHECK(r.metadata.content_type == vector::ContentType::FunctionDefinition);
    CHECK(r.metadata.has_functions);
    CHECK_FALSE(r.metadata.has_imports);
    CHECK(r.metadata.has_security);
    CHECK(r.metadata.token_count == 5);
}

TEST_CASE("SnapshotStore - manifest", "[storage][snapshot][catch2]") {
    test::TempDir dir("coderag_snapshot_");
    SnapshotStore store(dir.path());
    REQUIRE(store.save(makeSnapshot(), "fp2"));

    auto manifest = store.readManifest("fp2");
    REQUIRE(manifest);
    CHECK(manifest.value().format_version == SnapshotStore::kFormatVersion);
    CHECK(manifest.value().fingerprint == "fp2");
    CHECK(manifest.value().backend == BackendCapability::FeatureHeuristic);
    CHECK(manifest.value().dimension == 3);
    CHECK(manifest.value().record_count == 1);
    CHECK(manifest.value().payload_sha256.size() == 64);
    CHECK_FALSE(manifest.value().created_at.empty());

    std::ifstream in(store.manifestPath("fp2"));
    auto j = nlohmann::json::parse(in);
    CHECK(j.at("backend").get<std::string>() == "feature_heuristic");
}

TEST_CASE("SnapshotStore - unusable snapshots read as NotFound", "[storage][snapshot][catch2]") {
    test::TempDir dir("coderag_snapshot_");
    SnapshotStore store(dir.path());

    SECTION("Unknown fingerprint") {
        CHECK_FALSE(store.exists("missing"));
        auto result = store.load("missing", BackendCapability::FeatureHeuristic);
        REQUIRE_FALSE(result);
        CHECK(result.error().code == ErrorCode::NotFound);
    }

    SECTION("Built by another backend") {
        REQUIRE(store.save(makeSnapshot(), "fp3"));
        auto result = store.load("fp3", BackendCapability::KeywordOnly);
        REQUIRE_FALSE(result);
        CHECK(result.error().code == ErrorCode::NotFound);
    }

    SECTION("Corrupted payload fails the checksum") {
        REQUIRE(store.save(makeSnapshot(), "fp4"));
        {
            std::ofstream out(store.payloadPath("fp4"), std::ios::binary | std::ios::app);
            out << "garbage";
        }
        auto result = store.load("fp4", BackendCapability::FeatureHeuristic);
        REQUIRE_FALSE(result);
        CHECK(result.error().code == ErrorCode::NotFound);
        CHECK(result.error().message.find("checksum") != std::string::npos);
    }

    SECTION("Unparseable manifest") {
        REQUIRE(store.save(makeSnapshot(), "fp5"));
        test::write_file(store.manifestPath("fp5"), "{not json");
        auto result = store.load("fp5", BackendCapability::FeatureHeuristic);
        REQUIRE_FALSE(result);
        CHECK(result.error().code == ErrorCode::NotFound);
    }
}

TEST_CASE("SnapshotStore - remove and validation", "[storage][snapshot][catch2]") {
    test::TempDir dir("coderag_snapshot_");
    SnapshotStore store(dir.path() / "nested" / "store");

    auto empty = store.save(makeSnapshot(), "");
    REQUIRE_FALSE(empty);
    CHECK(empty.error().code == ErrorCode::InvalidArgument);

    REQUIRE(store.save(makeSnapshot(), "fp6"));
    CHECK(store.exists("fp6"));
    REQUIRE(store.remove("fp6"));
    CHECK_FALSE(store.exists("fp6"));
    CHECK(store.remove("fp6"));
}
