#pragma once

#include <optional>
#include <string>
#include <vector>
#include <utility>
#include <boost/asio/awaitable.hpp>

#include <nlohmann/json.hpp>

#include <valvec/core/types.h>
#include <valvec/vector/data_point.h>

namespace valvec::vector {

/**
 * @brief Capability surface of a vector database adapter
 *
 * Read paths treat a missing collection as empty; write paths fail with
 * CollectionNotFound. Every operation is asynchronous and takes its arguments by value, so
 * the returned awaitable may outlive the caller's temporaries.
 */
class IVectorDbAdapter {
public:
    virtual ~IVectorDbAdapter() = default;

    /**
     * @brief True if the collection's index exists. Lookup failures count as absent.
     */
    virtual boost::asio::awaitable<bool> hasCollection(std::string collection) = 0;

    /**
     * @brief Create the collection's index if it does not exist yet
     * @param schema Accepted for interface compatibility and ignored
     */
    virtual boost::asio::awaitable<Result<void>>
    createCollection(std::string collection,
                     std::optional<nlohmann::json> schema = std::nullopt) = 0;

    /**
     * @brief Embed and store data points (not atomic across points)
     */
    virtual boost::asio::awaitable<Result<void>>
    createDataPoints(std::string collection, std::vector<DataPoint> points) = 0;

    /**
     * @brief Fetch stored payloads by id, skipping ids that do not exist
     */
    virtual boost::asio::awaitable<Result<std::vector<ScoredResult>>>
    retrieve(std::string collection, std::vector<std::string> ids) = 0;

    /**
     * @brief k-nearest-neighbour search by text or vector
     */
    virtual boost::asio::awaitable<Result<std::vector<ScoredResult>>>
    search(std::string collection, SearchRequest request) = 0;

    /**
     * @brief One search per query text, filtered to score < scoreThreshold
     * @param scoreThreshold nullopt disables filtering
     */
    virtual boost::asio::awaitable<Result<std::vector<std::vector<ScoredResult>>>>
    batchSearch(std::string collection, std::vector<std::string> queryTexts,
                std::optional<int64_t> limit, bool withVectors = false,
                std::optional<float> scoreThreshold = DEFAULT_SCORE_THRESHOLD) = 0;

    /**
     * @brief Delete points by id
     */
    virtual boost::asio::awaitable<Result<DeleteResult>>
    deleteDataPoints(std::string collection, std::vector<std::string> ids) = 0;

    /**
     * @brief Drop every index (and, by configuration, its documents)
     */
    virtual boost::asio::awaitable<Result<void>> prune() = 0;
};

} // namespace valvec::vector
