#include <catch2/catch_test_macros.hpp>
#include <coderag/search/backend_selector.h>

using namespace coderag;
using namespace coderag::search;

namespace {

// Provider whose initialize() always fails
class BrokenProvider : public ml::IEmbeddingProvider {
public:
    Result<std::vector<float>> generateEmbedding(const std::string&) override {
        return Error{ErrorCode::NotInitialized, "broken"};
    }
    Result<std::vector<std::vector<float>>>
    generateBatchEmbeddings(const std::vector<std::string>&) override {
        return Error{ErrorCode::NotInitialized, "broken"};
    }
    bool isAvailable() const override { return false; }
    std::string getProviderName() const override { return "Broken"; }
    size_t getEmbeddingDimension() const override { return 0; }
    Result<void> initialize() override { return Error{ErrorCode::InternalError, "no model"}; }
    void shutdown() override {}
};

std::unique_ptr<ml::IEmbeddingProvider> makeBroken() {
    return std::make_unique<BrokenProvider>();
}

BackendSelector makeSelector(std::string provider, size_t dimension = 512) {
    vector::FeatureEmbedderConfig features;
    features.dimension = dimension;
    return BackendSelector(SelectorConfig{std::move(provider)}, features);
}

} // namespace

TEST_CASE("BackendSelector - state names", "[search][selector][catch2]") {
    CHECK(backendStateToString(BackendState::Uninitialized) == "UNINITIALIZED");
    CHECK(backendStateToString(BackendState::FullSemantic) == "FULL_SEMANTIC");
    CHECK(backendStateToString(BackendState::FeatureHeuristic) == "FEATURE_HEURISTIC");
    CHECK(backendStateToString(BackendState::KeywordOnly) == "KEYWORD_ONLY");
    CHECK_FALSE(capabilityOf(BackendState::Uninitialized).has_value());
    CHECK(capabilityOf(BackendState::KeywordOnly) == vector::BackendCapability::KeywordOnly);
}

TEST_CASE("BackendSelector - initial tier", "[search][selector][catch2]") {
    SECTION("No provider configured") {
        auto selector = makeSelector("");
        CHECK(selector.state() == BackendState::Uninitialized);
        CHECK(selector.initialize() == BackendState::FeatureHeuristic);
        CHECK(selector.activeProvider().empty());
    }

    SECTION("Registered provider") {
        auto selector = makeSelector("Mock");
        CHECK(selector.initialize() == BackendState::FullSemantic);
        CHECK(selector.activeProvider() == "Mock");
    }

    SECTION("Unknown provider falls back") {
        auto selector = makeSelector("NoSuchModel");
        CHECK(selector.initialize() == BackendState::FeatureHeuristic);
    }

    SECTION("Provider that fails to initialize falls back") {
        ml::registerEmbeddingProvider("Broken", &makeBroken);
        auto selector = makeSelector("Broken");
        CHECK(selector.initialize() == BackendState::FeatureHeuristic);
        ml::unregisterEmbeddingProvider("Broken");
    }

    SECTION("Feature tier that cannot be built falls back to keywords") {
        auto selector = makeSelector("", 64);
        CHECK(selector.initialize() == BackendState::KeywordOnly);
    }
}

TEST_CASE("BackendSelector - transitions", "[search][selector][catch2]") {
    auto selector = makeSelector("Mock");
    REQUIRE(selector.initialize() == BackendState::FullSemantic);

    SECTION("initialize is a no-op once selected") {
        CHECK(selector.initialize() == BackendState::FullSemantic);
    }

    SECTION("demote walks down one tier at a time") {
        CHECK(selector.demote() == BackendState::FeatureHeuristic);
        CHECK(selector.activeProvider().empty());
        CHECK(selector.initialize() == BackendState::FeatureHeuristic);
        CHECK(selector.demote() == BackendState::KeywordOnly);
        CHECK(selector.demote() == BackendState::KeywordOnly);
    }

    SECTION("reinitialize starts again from the top") {
        selector.demote();
        selector.demote();
        REQUIRE(selector.state() == BackendState::KeywordOnly);
        CHECK(selector.reinitialize() == BackendState::FullSemantic);
        CHECK(selector.activeProvider() == "Mock");
    }
}

TEST_CASE("BackendSelector - backends per tier", "[search][selector][catch2]") {
    SECTION("Nothing before initialize") {
        auto selector = makeSelector("");
        auto backend = selector.createBackend();
        REQUIRE_FALSE(backend);
        CHECK(backend.error().code == ErrorCode::NotInitialized);
    }

    SECTION("Each tier builds its own backend") {
        auto selector = makeSelector("Mock");
        selector.initialize();

        auto semantic = selector.createBackend();
        REQUIRE(semantic);
        CHECK(semantic.value()->capability() == vector::BackendCapability::FullSemantic);
        CHECK(semantic.value()->dimension() == 384);

        selector.demote();
        auto features = selector.createBackend();
        REQUIRE(features);
        CHECK(features.value()->capability() == vector::BackendCapability::FeatureHeuristic);
        CHECK(features.value()->dimension() == 512);

        selector.demote();
        auto keywords = selector.createBackend();
        REQUIRE(keywords);
        CHECK(keywords.value()->capability() == vector::BackendCapability::KeywordOnly);
        CHECK(keywords.value()->dimension() == 0);

        // The semantic backend created earlier keeps its provider alive
        vector::IndexRecord record;
        record.metadata.chunk_id = "c1";
        record.text = "def still_works(): pass";
        std::vector<vector::IndexRecord> records{record};
        auto added = semantic.value()->add(std::move(records));
        REQUIRE(added);
        CHECK(added.value() == 1);
    }
}
