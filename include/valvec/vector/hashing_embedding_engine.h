#pragma once

#include <cstddef>
#include <string>
#include <string_view>
#include <vector>

#include <valvec/vector/embedding_engine.h>

namespace valvec::vector {

/**
 * Deterministic feature-hashing embedder for tests and offline setups.
 * Lower-cased word tokens and character trigrams are bucketed with FNV-1a and the
 * result is L2-normalized, so texts sharing words are close under cosine distance.
 */
class HashingEmbeddingEngine : public IEmbeddingEngine {
public:
    static constexpr std::size_t kDefaultDimension = 384;

    explicit HashingEmbeddingEngine(std::size_t dimension = kDefaultDimension);

    boost::asio::awaitable<Result<std::vector<std::vector<float>>>>
    embedText(std::vector<std::string> texts) override;

    std::size_t getVectorSize() const override { return dimension_; }
    std::string getEngineName() const override { return "hashing"; }

    // Synchronous single-text embedding
    std::vector<float> embedOne(std::string_view text) const;

private:
    std::size_t dimension_;
};

} // namespace valvec::vector
