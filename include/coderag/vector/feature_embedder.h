#pragma once

#include <coderag/core/types.h>
#include <coderag/vector/index_record.h>

#include <cstdint>
#include <memory>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace coderag::vector {

/**
 * Configuration for the hand-engineered code feature embedding
 */
struct FeatureEmbedderConfig {
    size_t dimension = 512; // Must be in [128, 65536]
    float definition_weight = 1.0f;
    float import_weight = 0.8f;
    float risk_weight = 1.5f;
    float structure_weight = 1.0f;
    float vocabulary_weight = 1.0f;
};

/**
 * Strategy that turns chunk and query text into fixed-length vectors.
 * embed* calls are deterministic and never mutate the embedder; learn()
 * is the only mutating call and runs during ingestion.
 */
class IFeatureEmbedder {
public:
    virtual ~IFeatureEmbedder() = default;

    virtual Result<std::vector<float>> embed(const std::string& text) const = 0;

    // Chunk-side embedding; implementations may fold metadata into the input
    virtual Result<std::vector<float>> embedChunk(const std::string& text,
                                                  const Metadata& metadata) const {
        (void)metadata;
        return embed(text);
    }

    virtual Result<std::vector<float>> embedQuery(const std::string& text) const {
        return embed(text);
    }

    virtual size_t dimension() const = 0;
    virtual BackendCapability capability() const = 0;

    // Corpus-local state (vocabulary); no-op for stateless embedders
    virtual void learn(const std::vector<std::string>& texts) { (void)texts; }
    virtual std::vector<std::string> vocabulary() const { return {}; }
    virtual Result<void> restoreVocabulary(const std::vector<std::string>& words) {
        (void)words;
        return Result<void>();
    }

    virtual std::unique_ptr<IFeatureEmbedder> clone() const = 0;
};

/**
 * FEATURE_HEURISTIC embedder. Slices of the output vector:
 *   [0,16)    definitions (def/class/function/struct/...)
 *   [16,32)   imports: keyword counts, hashed module buckets
 *   [32,48)   risk patterns: dynamic execution, unsafe deserialization,
 *             string-built SQL, shell execution; slot 47 flags any risk
 *   [48,64)   structure: loops, branches, nesting, exceptions, size
 *   [64,dim)  term frequencies over the corpus vocabulary
 * Each non-empty slice is L2-normalized and then weighted.
 */
class CodeFeatureEmbedder : public IFeatureEmbedder {
public:
    static constexpr size_t kMinDimension = 128;
    static constexpr size_t kMaxDimension = 65536;
    static constexpr size_t kDefinitionOffset = 0;
    static constexpr size_t kImportOffset = 16;
    static constexpr size_t kRiskOffset = 32;
    static constexpr size_t kAnyRiskSlot = 47;
    static constexpr size_t kStructureOffset = 48;
    static constexpr size_t kStructureSizeOffset = 56; // Size features, chunk side only
    static constexpr size_t kVocabularyOffset = 64;
    static constexpr size_t kSliceWidth = 16;

    // NotSupported when the dimension cannot hold the fixed slices or exceeds kMaxDimension
    static Result<std::unique_ptr<CodeFeatureEmbedder>> create(const FeatureEmbedderConfig& config);

    Result<std::vector<float>> embed(const std::string& text) const override;
    Result<std::vector<float>> embedQuery(const std::string& text) const override;

    size_t dimension() const override { return config_.dimension; }
    BackendCapability capability() const override { return BackendCapability::FeatureHeuristic; }

    void learn(const std::vector<std::string>& texts) override;
    std::vector<std::string> vocabulary() const override { return words_; }
    Result<void> restoreVocabulary(const std::vector<std::string>& words) override;

    size_t vocabularySize() const { return words_.size(); }

    std::unique_ptr<IFeatureEmbedder> clone() const override;

    const FeatureEmbedderConfig& getConfig() const { return config_; }

private:
    explicit CodeFeatureEmbedder(const FeatureEmbedderConfig& config) : config_(config) {}

    std::vector<float> extract(const std::string& text, bool query) const;

    FeatureEmbedderConfig config_;
    std::unordered_map<std::string, uint32_t> vocab_;
    std::vector<std::string> words_; // Indexed by vocabulary id
};

// Lowercase word tokens (alphanumerics and '_')
std::vector<std::string> tokenizeWords(std::string_view text);

} // namespace coderag::vector
