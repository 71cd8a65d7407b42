#pragma once

#include <coderag/core/types.h>

#include <memory>
#include <string>
#include <vector>

namespace coderag::ml {

// ============================================================================
// Abstract Embedding Provider Interface
// ============================================================================

/**
 * Abstract interface for embedding providers.
 * The retrieval engine reaches full semantic mode only through this seam, so
 * model runtimes stay out of the core library.
 */
class IEmbeddingProvider {
public:
    virtual ~IEmbeddingProvider() = default;

    /**
     * Generate embedding for a single text
     * @param text Input text to embed
     * @return Vector of float embeddings or error
     */
    virtual Result<std::vector<float>> generateEmbedding(const std::string& text) = 0;

    /**
     * Generate embeddings for a batch of texts
     * @param texts Input texts to embed
     * @return Vector of embedding vectors or error
     */
    virtual Result<std::vector<std::vector<float>>>
    generateBatchEmbeddings(const std::vector<std::string>& texts) = 0;

    virtual bool isAvailable() const = 0;

    // Name the provider is registered under (e.g. "Mock")
    virtual std::string getProviderName() const = 0;

    // Embedding dimension, 0 if not known yet
    virtual size_t getEmbeddingDimension() const = 0;

    virtual Result<void> initialize() = 0;
    virtual void shutdown() = 0;
};

// ============================================================================
// Embedding Provider Factory
// ============================================================================

using EmbeddingProviderFactory = std::unique_ptr<IEmbeddingProvider> (*)();

/**
 * Create a registered embedding provider by name.
 * There is no implicit default: an empty or unknown name yields nullptr.
 * The built-in "Mock" provider (deterministic hashed bag-of-tokens, 384 dims)
 * is only created when asked for by name.
 */
std::unique_ptr<IEmbeddingProvider> createEmbeddingProvider(const std::string& name);

// Register (or replace) a provider factory
void registerEmbeddingProvider(const std::string& name, EmbeddingProviderFactory factory);

void unregisterEmbeddingProvider(const std::string& name);

// Sorted list of registered provider names
std::vector<std::string> getRegisteredEmbeddingProviders();

} // namespace coderag::ml
