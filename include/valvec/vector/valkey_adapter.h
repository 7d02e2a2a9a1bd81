#pragma once

#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>
#include <boost/asio/any_io_executor.hpp>
#include <utility>
#include <boost/asio/awaitable.hpp>

#include <valvec/client/valkey_client.h>
#include <valvec/config/adapter_config.h>
#include <valvec/core/async_mutex.h>
#include <valvec/core/types.h>
#include <valvec/vector/data_point.h>
#include <valvec/vector/embedding_engine.h>
#include <valvec/vector/vector_db_interface.h>

namespace valvec::vector {

// Result of an index lookup: a value means found, nullopt means the index does not exist.
// Transport failures are reported through the enclosing Result.
using CollectionState = std::optional<IndexInfo>;

/**
 * @brief Vector database adapter backed by valkey-search and valkey-json
 *
 * Each collection is an HNSW index `index:{name}` over JSON documents stored under
 * `vdb:{name}:{id}`. The adapter owns one lazily created ValkeyClient shared by every
 * operation; `clientFactory` opens it (RedisClient::create unless another is supplied).
 */
class ValkeyAdapter : public IVectorDbAdapter {
public:
    /**
     * @brief Create an adapter. No connection is made until first use.
     * @return NotInitialized when no embedding engine is supplied
     */
    static Result<std::shared_ptr<ValkeyAdapter>>
    create(config::AdapterConfig config, std::shared_ptr<IEmbeddingEngine> embeddingEngine,
           client::ClientFactory clientFactory = {});

    ~ValkeyAdapter() override;

    ValkeyAdapter(const ValkeyAdapter&) = delete;
    ValkeyAdapter& operator=(const ValkeyAdapter&) = delete;

    // Connection management
    boost::asio::awaitable<Result<std::shared_ptr<client::ValkeyClient>>> getConnection();
    boost::asio::awaitable<void> close();
    bool isConnected() const;

    boost::asio::awaitable<Result<std::vector<std::vector<float>>>>
    embedData(std::vector<std::string> texts);

    // Schema
    boost::asio::awaitable<Result<CollectionState>> lookupCollection(std::string collection);

    boost::asio::awaitable<bool> hasCollection(std::string collection) override;
    boost::asio::awaitable<Result<void>>
    createCollection(std::string collection,
                     std::optional<nlohmann::json> schema = std::nullopt) override;

    // Search
    boost::asio::awaitable<Result<std::vector<ScoredResult>>>
    search(std::string collection, SearchRequest request) override;

    boost::asio::awaitable<Result<std::vector<std::vector<ScoredResult>>>>
    batchSearch(std::string collection, std::vector<std::string> queryTexts,
                std::optional<int64_t> limit, bool withVectors = false,
                std::optional<float> scoreThreshold = DEFAULT_SCORE_THRESHOLD) override;

    // Mutations
    boost::asio::awaitable<Result<void>>
    createDataPoints(std::string collection, std::vector<DataPoint> points) override;

    boost::asio::awaitable<Result<std::vector<ScoredResult>>>
    retrieve(std::string collection, std::vector<std::string> ids) override;

    boost::asio::awaitable<Result<DeleteResult>>
    deleteDataPoints(std::string collection, std::vector<std::string> ids) override;

    boost::asio::awaitable<Result<void>> prune() override;

    // Naming
    static std::string indexName(const std::string& collection);
    static std::string keyPrefix(const std::string& collection);
    static std::string documentKey(const std::string& collection, const std::string& id);

    const config::AdapterConfig& config() const noexcept { return config_; }
    std::size_t vectorSize() const { return embeddingEngine_->getVectorSize(); }

private:
    ValkeyAdapter(config::AdapterConfig config, std::shared_ptr<IEmbeddingEngine> embeddingEngine,
                  client::ConnectionOptions options, client::ClientFactory clientFactory);

    boost::asio::awaitable<Result<std::vector<ScoredResult>>>
    searchByVector(std::shared_ptr<client::ValkeyClient> valkey, std::string collection,
                   std::vector<float> queryVector, int64_t limit, bool withVector);

    boost::asio::awaitable<Result<void>>
    deleteCollectionDocuments(std::shared_ptr<client::ValkeyClient> valkey, std::string collection);

    config::AdapterConfig config_;
    std::shared_ptr<IEmbeddingEngine> embeddingEngine_;
    client::ConnectionOptions options_;
    client::ClientFactory clientFactory_;

    core::AsyncMutex connectMutex_;
    core::AsyncMutex collectionMutex_;
    mutable std::mutex clientMutex_;
    std::shared_ptr<client::ValkeyClient> client_;
};

} // namespace valvec::vector
