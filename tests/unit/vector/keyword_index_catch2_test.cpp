#include <catch2/catch_approx.hpp>
#include <catch2/catch_test_macros.hpp>
#include <coderag/vector/keyword_index.h>

using namespace coderag;
using namespace coderag::vector;
using Catch::Approx;

namespace {

IndexRecord keywordRecord(const std::string& id, const std::string& text) {
    IndexRecord record;
    record.metadata.chunk_id = id;
    record.metadata.file_name = id + ".py";
    record.metadata.language = "python";
    record.embedding.backend_tag = BackendCapability::KeywordOnly;
    record.text = text;
    return record;
}

} // namespace

TEST_CASE("KeywordIndex - keyword extraction", "[vector][keyword][catch2]") {
    auto keywords = KeywordIndex::extractKeywords(
        "def parse_config(path):\n    result = load(path)\nclass Loader:\n    pass\n"
        "import json\nab = 1\n");
    CHECK(keywords.count("parse_config") == 1);
    CHECK(keywords.count("result") == 1);
    CHECK(keywords.count("loader") == 1);
    CHECK(keywords.count("json") == 1);
    CHECK(keywords.count("ab") == 0);

    auto terms = KeywordIndex::queryTerms("How do I parse the parse config?");
    REQUIRE(terms.size() == 4);
    CHECK(terms[0] == "how");
    CHECK(terms[1] == "parse");
    CHECK(terms[2] == "the");
    CHECK(terms[3] == "config");
}

TEST_CASE("KeywordIndex - scoring", "[vector][keyword][catch2]") {
    KeywordIndex index;
    REQUIRE(index.add({
        keywordRecord("tok", "def tokenize(text):\n    return text.split()\n"),
        keywordRecord("ren", "class Renderer:\n    pass\n"),
    }));
    CHECK(index.size() == 2);
    CHECK(index.keywordCount() >= 2);

    SECTION("Keyword and substring hits both count") {
        auto results = index.search("tokenize", 5);
        REQUIRE(results.size() == 1);
        CHECK(results[0].record.id() == "tok");
        CHECK(results[0].score == Approx(1.0f));
    }

    SECTION("Ties keep insertion order") {
        auto results = index.search("renderer tokenize", 5);
        REQUIRE(results.size() == 2);
        CHECK(results[0].record.id() == "tok");
        CHECK(results[1].record.id() == "ren");
        CHECK(results[0].score == Approx(0.5f));
        CHECK(results[1].score == Approx(0.5f));
    }

    SECTION("Substring-only match scores lower") {
        auto results = index.search("split", 5);
        REQUIRE(results.size() == 1);
        CHECK(results[0].score == Approx(0.5f));
    }

    SECTION("No overlap returns nothing") {
        CHECK(index.search("database migration", 5).empty());
        CHECK(index.search("a b", 5).empty());
    }

    SECTION("Filters apply") {
        SearchFilter filter;
        filter.file_name = "ren.py";
        auto results = index.search("renderer tokenize", 5, &filter);
        REQUIRE(results.size() == 1);
        CHECK(results[0].record.id() == "ren");
    }

    SECTION("Removal rebuilds postings") {
        CHECK(index.remove({"tok"}) == 1);
        CHECK(index.search("tokenize", 5).empty());
        auto results = index.search("renderer", 5);
        REQUIRE(results.size() == 1);
        CHECK(results[0].record.id() == "ren");
    }

    SECTION("Replacing a record updates its keywords") {
        REQUIRE(index.add({keywordRecord("tok", "def detokenize(parts):\n    pass\n")}));
        CHECK(index.size() == 2);
        auto results = index.search("detokenize", 5);
        REQUIRE(results.size() == 1);
        CHECK(results[0].score == Approx(1.0f));
    }
}

TEST_CASE("KeywordIndex - rejects vector records", "[vector][keyword][catch2]") {
    KeywordIndex index;
    auto record = keywordRecord("x", "def x(): pass");
    record.embedding.backend_tag = BackendCapability::FeatureHeuristic;
    auto result = index.add({record});
    REQUIRE_FALSE(result);
    CHECK(result.error().code == ErrorCode::InvalidArgument);
    CHECK(index.size() == 0);
}
