#pragma once

#include <coderag/core/types.h>
#include <coderag/ml/provider.h>
#include <coderag/vector/feature_embedder.h>
#include <coderag/vector/retrieval_backend.h>

#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>

namespace coderag::search {

enum class BackendState { Uninitialized, FullSemantic, FeatureHeuristic, KeywordOnly };

// "UNINITIALIZED", "FULL_SEMANTIC", "FEATURE_HEURISTIC", "KEYWORD_ONLY"
std::string_view backendStateToString(BackendState state);

std::optional<vector::BackendCapability> capabilityOf(BackendState state);

struct SelectorConfig {
    // Registered provider name; empty skips the FULL_SEMANTIC tier
    std::string embedding_provider;
};

/**
 * Chooses the live retrieval tier.
 *
 * initialize() walks FULL_SEMANTIC -> FEATURE_HEURISTIC -> KEYWORD_ONLY and
 * stops at the first tier that can be constructed. Higher tiers are never
 * retried on their own: only reinitialize() starts again from the top, and
 * demote() moves one tier down after a runtime provider failure.
 */
class BackendSelector {
public:
    BackendSelector(SelectorConfig config, vector::FeatureEmbedderConfig features);
    ~BackendSelector();

    BackendSelector(const BackendSelector&) = delete;
    BackendSelector& operator=(const BackendSelector&) = delete;

    // No-op once a tier is selected
    BackendState initialize();

    BackendState reinitialize();

    BackendState demote();

    BackendState state() const;

    // Fresh, empty backend for the current tier
    Result<std::unique_ptr<vector::IRetrievalBackend>> createBackend() const;

    // Provider name while FULL_SEMANTIC, empty otherwise
    std::string activeProvider() const;

private:
    BackendState selectFrom(BackendState first);
    Result<std::shared_ptr<ml::IEmbeddingProvider>> openProvider() const;
    void releaseProvider();

    SelectorConfig config_;
    vector::FeatureEmbedderConfig features_;
    BackendState state_ = BackendState::Uninitialized;
    std::shared_ptr<ml::IEmbeddingProvider> provider_;
    mutable std::mutex mutex_;
};

} // namespace coderag::search
