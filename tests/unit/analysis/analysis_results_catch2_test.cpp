#include <catch2/catch_approx.hpp>
#include <catch2/catch_test_macros.hpp>
#include <coderag/analysis/analysis_results.h>

#include "common/test_helpers_catch2.h"

using namespace coderag;
using namespace coderag::analysis;
using Catch::Approx;

TEST_CASE("AnalysisResults - parsing", "[analysis][results][catch2]") {
    SECTION("Full entry with object issues and numeric complexity") {
        auto parsed = AnalysisResults::parse(R"({
            "file_analyses": {
                "src/app.py": {
                    "language": "python",
                    "issues": [
                        {"category": "security", "severity": "high",
                         "message": "Use of eval", "line": 12},
                        {"category": "style", "description": "Line too long"}
                    ],
                    "complexity": 7.5
                }
            }
        })");
        REQUIRE(parsed);
        const auto& results = parsed.value();
        CHECK(results.size() == 1);

        const auto* app = results.find("src/app.py");
        REQUIRE(app != nullptr);
        CHECK(app->language == "python");
        REQUIRE(app->issues.size() == 2);
        CHECK(app->issues[0].category == "security");
        CHECK(app->issues[0].severity == "high");
        CHECK(app->issues[0].line == 12);
        CHECK(app->issues[1].message == "Line too long");
        CHECK(app->complexity_score == Approx(7.5));
    }

    SECTION("Complexity from nested objects and bare issue strings") {
        auto parsed = AnalysisResults::parse(R"({
            "file_analyses": {
                "a.js": {"issues": ["injection"], "complexity": {"complexity_score": 3}},
                "b.js": {"metrics": {"complexity_score": 11}}
            }
        })");
        REQUIRE(parsed);
        const auto* a = parsed.value().find("a.js");
        REQUIRE(a != nullptr);
        REQUIRE(a->issues.size() == 1);
        CHECK(a->issues[0].category == "injection");
        CHECK(a->complexity_score == Approx(3.0));

        const auto* b = parsed.value().find("b.js");
        REQUIRE(b != nullptr);
        CHECK(b->issues.empty());
        CHECK(b->complexity_score == Approx(11.0));
    }

    SECTION("Missing file_analyses is an empty result") {
        auto parsed = AnalysisResults::parse(R"({"summary": {}})");
        REQUIRE(parsed);
        CHECK(parsed.value().empty());
    }

    SECTION("Malformed input is rejected") {
        auto broken = AnalysisResults::parse("{not json");
        REQUIRE_FALSE(broken);
        CHECK(broken.error().code == ErrorCode::InvalidData);

        auto wrongShape = AnalysisResults::parse(R"({"file_analyses": []})");
        REQUIRE_FALSE(wrongShape);
        CHECK(wrongShape.error().code == ErrorCode::InvalidData);
    }
}

TEST_CASE("AnalysisResults - path lookup", "[analysis][results][catch2]") {
    AnalysisResults results;
    FileAnalysis facts;
    facts.complexity_score = 2.0;
    results.set("./src/../src/util.py", facts);

    CHECK(results.find("src/util.py") != nullptr);
    CHECK(results.find("./src/util.py") != nullptr);
    CHECK(results.find("src/other.py") == nullptr);
}

TEST_CASE("AnalysisResults - loadFromFile", "[analysis][results][catch2]") {
    test::TempDir dir;
    auto path = test::write_file(dir / "analysis.json",
                                 R"({"file_analyses": {"x.py": {"issues": ["bug"]}}})");
    auto loaded = AnalysisResults::loadFromFile(path);
    REQUIRE(loaded);
    REQUIRE(loaded.value().find("x.py") != nullptr);
    CHECK(loaded.value().find("x.py")->issues.size() == 1);

    auto missing = AnalysisResults::loadFromFile(dir / "nope.json");
    REQUIRE_FALSE(missing);
    CHECK(missing.error().code == ErrorCode::FileNotFound);
}
