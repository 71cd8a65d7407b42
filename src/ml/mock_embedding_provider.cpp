#include <coderag/ml/provider.h>

#include <spdlog/spdlog.h>

#include <cctype>
#include <cmath>
#include <cstdint>
#include <map>
#include <mutex>

namespace coderag::ml {

// ============================================================================
// Mock Embedding Provider Implementation
// ============================================================================

namespace {

uint64_t fnv1a(std::string_view token) {
    uint64_t hash = 1469598103934665603ULL;
    for (char c : token) {
        hash ^= static_cast<unsigned char>(c);
        hash *= 1099511628211ULL;
    }
    return hash;
}

/**
 * Deterministic provider for tests and offline use.
 * Each lowercase alphanumeric token is hashed into a signed bucket, so texts
 * sharing vocabulary land close together and results are stable across runs.
 */
class MockEmbeddingProvider : public IEmbeddingProvider {
public:
    explicit MockEmbeddingProvider(size_t dimension = 384) : dimension_(dimension) {
        spdlog::debug("MockEmbeddingProvider created with dimension {}", dimension);
    }

    ~MockEmbeddingProvider() override {
        if (initialized_) {
            shutdown();
        }
    }

    Result<void> initialize() override {
        if (!initialized_) {
            spdlog::debug("Initializing MockEmbeddingProvider");
            initialized_ = true;
        }
        return Result<void>();
    }

    void shutdown() override { initialized_ = false; }

    Result<std::vector<float>> generateEmbedding(const std::string& text) override {
        if (!initialized_) {
            return Error{ErrorCode::NotInitialized, "Mock provider not initialized"};
        }

        std::vector<float> embedding(dimension_, 0.0f);
        std::string token;
        auto flush = [&]() {
            if (token.empty()) {
                return;
            }
            uint64_t h = fnv1a(token);
            embedding[h % dimension_] += (h >> 63) ? -1.0f : 1.0f;
            token.clear();
        };
        for (char c : text) {
            if (std::isalnum(static_cast<unsigned char>(c)) || c == '_') {
                token.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
            } else {
                flush();
            }
        }
        flush();

        float norm = 0.0f;
        for (float val : embedding) {
            norm += val * val;
        }
        norm = std::sqrt(norm);
        if (norm > 0) {
            for (float& val : embedding) {
                val /= norm;
            }
        }
        return embedding;
    }

    Result<std::vector<std::vector<float>>>
    generateBatchEmbeddings(const std::vector<std::string>& texts) override {
        std::vector<std::vector<float>> embeddings;
        embeddings.reserve(texts.size());
        for (const auto& text : texts) {
            auto result = generateEmbedding(text);
            if (!result) {
                return result.error();
            }
            embeddings.push_back(std::move(result).value());
        }
        return embeddings;
    }

    bool isAvailable() const override { return true; }

    std::string getProviderName() const override { return "Mock"; }

    size_t getEmbeddingDimension() const override { return dimension_; }

private:
    size_t dimension_;
    bool initialized_ = false;
};

std::mutex& registryMutex() {
    static std::mutex mutex;
    return mutex;
}

std::map<std::string, EmbeddingProviderFactory>& registry() {
    static std::map<std::string, EmbeddingProviderFactory> providers{
        {"Mock", []() -> std::unique_ptr<IEmbeddingProvider> {
             return std::make_unique<MockEmbeddingProvider>();
         }}};
    return providers;
}

} // namespace

// ============================================================================
// Provider Factory Implementation
// ============================================================================

void registerEmbeddingProvider(const std::string& name, EmbeddingProviderFactory factory) {
    std::lock_guard<std::mutex> lock(registryMutex());
    registry()[name] = factory;
}

void unregisterEmbeddingProvider(const std::string& name) {
    std::lock_guard<std::mutex> lock(registryMutex());
    registry().erase(name);
}

std::vector<std::string> getRegisteredEmbeddingProviders() {
    std::lock_guard<std::mutex> lock(registryMutex());
    std::vector<std::string> names;
    for (const auto& [name, _] : registry()) {
        names.push_back(name);
    }
    return names;
}

std::unique_ptr<IEmbeddingProvider> createEmbeddingProvider(const std::string& name) {
    if (name.empty()) {
        return nullptr;
    }
    EmbeddingProviderFactory factory = nullptr;
    {
        std::lock_guard<std::mutex> lock(registryMutex());
        auto it = registry().find(name);
        if (it != registry().end()) {
            factory = it->second;
        }
    }
    if (!factory) {
        spdlog::warn("Embedding provider '{}' is not registered", name);
        return nullptr;
    }
    return factory();
}

} // namespace coderag::ml
