#pragma once

#include <cstddef>
#include <string>
#include <utility>
#include <vector>
#include <boost/asio/awaitable.hpp>

#include <valvec/core/types.h>

namespace valvec::vector {

// ============================================================================
// Abstract Embedding Engine Interface
// ============================================================================

/**
 * Text to fixed-length vector capability consumed by the adapter.
 * Implementations may call out to a remote model; the adapter only relies on
 * one vector per input text, each getVectorSize() long.
 */
class IEmbeddingEngine {
public:
    virtual ~IEmbeddingEngine() = default;

    /**
     * Embed a batch of texts
     * @param texts Input texts; an empty batch yields an empty result
     * @return One embedding per text, in input order
     */
    virtual boost::asio::awaitable<Result<std::vector<std::vector<float>>>>
    embedText(std::vector<std::string> texts) = 0;

    /**
     * Dimensionality of every vector this engine returns
     */
    virtual std::size_t getVectorSize() const = 0;

    virtual std::string getEngineName() const { return "unknown"; }
};

} // namespace valvec::vector
