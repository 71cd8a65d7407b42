#include <coderag/search/backend_selector.h>
#include <coderag/vector/semantic_embedder.h>

#include <spdlog/spdlog.h>

namespace coderag::search {

std::string_view backendStateToString(BackendState state) {
    switch (state) {
        case BackendState::Uninitialized:
            return "UNINITIALIZED";
        case BackendState::FullSemantic:
            return "FULL_SEMANTIC";
        case BackendState::FeatureHeuristic:
            return "FEATURE_HEURISTIC";
        case BackendState::KeywordOnly:
            return "KEYWORD_ONLY";
    }
    return "UNINITIALIZED";
}

std::optional<vector::BackendCapability> capabilityOf(BackendState state) {
    switch (state) {
        case BackendState::FullSemantic:
            return vector::BackendCapability::FullSemantic;
        case BackendState::FeatureHeuristic:
            return vector::BackendCapability::FeatureHeuristic;
        case BackendState::KeywordOnly:
            return vector::BackendCapability::KeywordOnly;
        case BackendState::Uninitialized:
            break;
    }
    return std::nullopt;
}

BackendSelector::BackendSelector(SelectorConfig config, vector::FeatureEmbedderConfig features)
    : config_(std::move(config)), features_(features) {}

BackendSelector::~BackendSelector() {
    releaseProvider();
}

BackendState BackendSelector::initialize() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (state_ != BackendState::Uninitialized) {
        return state_;
    }
    return selectFrom(BackendState::FullSemantic);
}

BackendState BackendSelector::reinitialize() {
    std::lock_guard<std::mutex> lock(mutex_);
    releaseProvider();
    state_ = BackendState::Uninitialized;
    return selectFrom(BackendState::FullSemantic);
}

BackendState BackendSelector::demote() {
    std::lock_guard<std::mutex> lock(mutex_);
    switch (state_) {
        case BackendState::Uninitialized:
            return selectFrom(BackendState::FullSemantic);
        case BackendState::FullSemantic:
            spdlog::warn("Embedding provider '{}' failed, leaving FULL_SEMANTIC",
                         config_.embedding_provider);
            releaseProvider();
            return selectFrom(BackendState::FeatureHeuristic);
        case BackendState::FeatureHeuristic:
            spdlog::warn("Feature embedding failed, falling back to KEYWORD_ONLY");
            return selectFrom(BackendState::KeywordOnly);
        case BackendState::KeywordOnly:
            break;
    }
    return state_;
}

BackendState BackendSelector::state() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return state_;
}

std::string BackendSelector::activeProvider() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return state_ == BackendState::FullSemantic && provider_ ? provider_->getProviderName()
                                                             : std::string();
}

Result<std::unique_ptr<vector::IRetrievalBackend>> BackendSelector::createBackend() const {
    std::lock_guard<std::mutex> lock(mutex_);
    switch (state_) {
        case BackendState::FullSemantic:
            return std::unique_ptr<vector::IRetrievalBackend>(
                std::make_unique<vector::VectorRetrievalBackend>(
                    std::make_unique<vector::SemanticEmbedder>(provider_)));
        case BackendState::FeatureHeuristic: {
            auto embedder = vector::CodeFeatureEmbedder::create(features_);
            if (!embedder) {
                return embedder.error();
            }
            return std::unique_ptr<vector::IRetrievalBackend>(
                std::make_unique<vector::VectorRetrievalBackend>(std::move(embedder).value()));
        }
        case BackendState::KeywordOnly:
            return std::unique_ptr<vector::IRetrievalBackend>(
                std::make_unique<vector::KeywordRetrievalBackend>());
        case BackendState::Uninitialized:
            break;
    }
    return Error{ErrorCode::NotInitialized, "Backend selector has not been initialized"};
}

Result<std::shared_ptr<ml::IEmbeddingProvider>> BackendSelector::openProvider() const {
    if (config_.embedding_provider.empty()) {
        return Error{ErrorCode::NotInitialized, "No embedding provider configured"};
    }
    std::shared_ptr<ml::IEmbeddingProvider> provider =
        ml::createEmbeddingProvider(config_.embedding_provider);
    if (!provider) {
        return Error{ErrorCode::NotSupported,
                     "Unknown embedding provider '" + config_.embedding_provider + "'"};
    }
    if (auto init = provider->initialize(); !init) {
        return init.error();
    }
    if (!provider->isAvailable() || provider->getEmbeddingDimension() == 0) {
        provider->shutdown();
        return Error{ErrorCode::NotInitialized,
                     "Embedding provider '" + config_.embedding_provider + "' is unavailable"};
    }
    return provider;
}

BackendState BackendSelector::selectFrom(BackendState first) {
    if (first == BackendState::FullSemantic) {
        auto provider = openProvider();
        if (provider) {
            provider_ = std::move(provider).value();
            state_ = BackendState::FullSemantic;
            spdlog::info("Retrieval backend: FULL_SEMANTIC via '{}' ({} dims)",
                         provider_->getProviderName(), provider_->getEmbeddingDimension());
            return state_;
        }
        if (config_.embedding_provider.empty()) {
            spdlog::debug("FULL_SEMANTIC skipped: {}", provider.error().message);
        } else {
            spdlog::warn("FULL_SEMANTIC unavailable: {}", provider.error().message);
        }
        first = BackendState::FeatureHeuristic;
    }

    if (first == BackendState::FeatureHeuristic) {
        auto embedder = vector::CodeFeatureEmbedder::create(features_);
        if (embedder) {
            state_ = BackendState::FeatureHeuristic;
            spdlog::info("Retrieval backend: FEATURE_HEURISTIC ({} dims)", features_.dimension);
            return state_;
        }
        spdlog::warn("FEATURE_HEURISTIC unavailable: {}", embedder.error().message);
    }

    state_ = BackendState::KeywordOnly;
    spdlog::info("Retrieval backend: KEYWORD_ONLY");
    return state_;
}

void BackendSelector::releaseProvider() {
    if (provider_) {
        // Backends created earlier may still hold the provider
        if (provider_.use_count() == 1) {
            provider_->shutdown();
        }
        provider_.reset();
    }
}

} // namespace coderag::search
