#include <catch2/catch_approx.hpp>
#include <catch2/catch_test_macros.hpp>
#include <coderag/vector/vector_index.h>

using namespace coderag;
using namespace coderag::vector;
using Catch::Approx;

namespace {

struct VectorIndexFixture {
    static constexpr size_t kDim = 4;

    IndexRecord makeRecord(const std::string& id, std::vector<float> v,
                           const std::string& language = "python") {
        IndexRecord record;
        record.metadata.chunk_id = id;
        record.metadata.file_name = id + ".py";
        record.metadata.language = language;
        record.embedding.chunk_id = id;
        record.embedding.vector = std::move(v);
        record.embedding.backend_tag = BackendCapability::FeatureHeuristic;
        record.text = "text of " + id;
        return record;
    }

    VectorIndex index{kDim, BackendCapability::FeatureHeuristic};
};

} // namespace

TEST_CASE("vector_utils", "[vector][index][catch2]") {
    CHECK(vector_utils::norm({3.0f, 4.0f}) == Approx(5.0f));
    auto unit = vector_utils::normalize({3.0f, 4.0f});
    CHECK(unit[0] == Approx(0.6f));
    CHECK(unit[1] == Approx(0.8f));
    CHECK(vector_utils::normalize({0.0f, 0.0f}) == std::vector<float>{0.0f, 0.0f});
    CHECK(vector_utils::dot({1.0f, 2.0f}, {3.0f, 4.0f}) == Approx(11.0f));
}

TEST_CASE_METHOD(VectorIndexFixture, "VectorIndex - insertion validation",
                 "[vector][index][catch2]") {
    SECTION("Wrong dimension rejects the whole batch") {
        auto result = index.add({makeRecord("a", {1, 0, 0, 0}), makeRecord("b", {1, 0, 0})});
        REQUIRE_FALSE(result);
        CHECK(result.error().code == ErrorCode::InvalidArgument);
        CHECK(index.empty());
    }

    SECTION("Foreign backend tag is rejected") {
        auto record = makeRecord("a", {1, 0, 0, 0});
        record.embedding.backend_tag = BackendCapability::FullSemantic;
        auto result = index.add({record});
        REQUIRE_FALSE(result);
        CHECK(result.error().code == ErrorCode::InvalidArgument);
    }

    SECTION("Missing chunk id is rejected") {
        REQUIRE_FALSE(index.add({makeRecord("", {1, 0, 0, 0})}));
    }

    SECTION("Stored vectors are unit length") {
        REQUIRE(index.add({makeRecord("a", {2, 0, 0, 0})}));
        const auto* stored = index.get("a");
        REQUIRE(stored != nullptr);
        CHECK(vector_utils::norm(stored->embedding.vector) == Approx(1.0f));
    }
}

TEST_CASE_METHOD(VectorIndexFixture, "VectorIndex - search ordering", "[vector][index][catch2]") {
    REQUIRE(index.add({
        makeRecord("far", {0, 1, 0, 0}),
        makeRecord("near", {1, 0.1f, 0, 0}),
        makeRecord("tie_first", {1, 1, 0, 0}),
        makeRecord("tie_second", {1, 1, 0, 0}),
    }));

    SECTION("Scores are non-increasing") {
        auto results = index.search({1, 0, 0, 0}, 4);
        REQUIRE(results);
        REQUIRE(results.value().size() == 4);
        for (size_t i = 1; i < results.value().size(); ++i) {
            CHECK(results.value()[i - 1].score >= results.value()[i].score);
        }
        CHECK(results.value()[0].record.id() == "near");
        CHECK(results.value()[3].record.id() == "far");
    }

    SECTION("Equal scores keep insertion order") {
        auto results = index.search({1, 1, 0, 0}, 2);
        REQUIRE(results);
        REQUIRE(results.value().size() == 2);
        CHECK(results.value()[0].record.id() == "tie_first");
        CHECK(results.value()[1].record.id() == "tie_second");
        CHECK(results.value()[0].score == Approx(1.0f));
    }

    SECTION("k bounds the result size") {
        CHECK(index.search({1, 0, 0, 0}, 10).value().size() == 4);
        CHECK(index.search({1, 0, 0, 0}, 0).value().empty());
    }

    SECTION("Query dimension must match") {
        auto results = index.search({1, 0}, 2);
        REQUIRE_FALSE(results);
        CHECK(results.error().code == ErrorCode::InvalidArgument);
    }

    SECTION("Filters restrict candidates") {
        SearchFilter filter;
        filter.file_name = "far.py";
        auto results = index.search({1, 0, 0, 0}, 4, &filter);
        REQUIRE(results);
        REQUIRE(results.value().size() == 1);
        CHECK(results.value()[0].record.id() == "far");
    }
}

TEST_CASE_METHOD(VectorIndexFixture, "VectorIndex - replace and remove", "[vector][index][catch2]") {
    REQUIRE(index.add({makeRecord("a", {1, 0, 0, 0}), makeRecord("b", {0, 1, 0, 0}),
                       makeRecord("c", {0, 0, 1, 0})}));

    SECTION("Same id replaces in place") {
        auto replacement = makeRecord("a", {0, 0, 0, 1});
        replacement.text = "updated";
        REQUIRE(index.add({replacement}));
        CHECK(index.size() == 3);
        CHECK(index.records()[0].id() == "a");
        CHECK(index.records()[0].text == "updated");
    }

    SECTION("Remove reports the number removed") {
        CHECK(index.remove({"b", "missing"}) == 1);
        CHECK(index.size() == 2);
        CHECK_FALSE(index.contains("b"));
        CHECK(index.contains("c"));
        REQUIRE(index.get("c") != nullptr);
        CHECK(index.get("c")->text == "text of c");
    }

    SECTION("Clear empties the index") {
        index.clear();
        CHECK(index.empty());
        CHECK(index.search({1, 0, 0, 0}, 3).value().empty());
    }
}
