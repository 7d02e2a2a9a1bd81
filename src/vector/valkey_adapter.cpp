#include <valvec/vector/valkey_adapter.h>

#include <spdlog/spdlog.h>

#include <valvec/client/commands.h>
#include <valvec/client/global_io_context.h>
#include <valvec/client/redis_client.h>
#include <valvec/core/format.h>
#include <valvec/vector/document_codec.h>

namespace valvec::vector {

using boost::asio::awaitable;

namespace {

client::ConnectionOptions withExecutor(client::ConnectionOptions options) {
    if (!options.executor) {
        options.executor = client::GlobalIOContext::global_executor();
    }
    return options;
}

} // namespace

Result<std::shared_ptr<ValkeyAdapter>>
ValkeyAdapter::create(config::AdapterConfig config, std::shared_ptr<IEmbeddingEngine> embeddingEngine,
                      client::ClientFactory clientFactory) {
    if (!embeddingEngine) {
        return Error{ErrorCode::NotInitialized,
                     "Embedding engine is required to initialize the Valkey adapter"};
    }
    if (embeddingEngine->getVectorSize() == 0) {
        return Error{ErrorCode::NotInitialized, "Embedding engine reports zero dimensions"};
    }
    auto options = config.toConnectionOptions();
    if (!options) {
        return options.error();
    }
    auto resolved = withExecutor(std::move(options).value());
    if (!clientFactory) {
        clientFactory = &client::RedisClient::create;
    }
    return std::shared_ptr<ValkeyAdapter>(new ValkeyAdapter(std::move(config),
                                                            std::move(embeddingEngine),
                                                            std::move(resolved),
                                                            std::move(clientFactory)));
}

ValkeyAdapter::ValkeyAdapter(config::AdapterConfig config,
                             std::shared_ptr<IEmbeddingEngine> embeddingEngine,
                             client::ConnectionOptions options,
                             client::ClientFactory clientFactory)
    : config_(std::move(config)), embeddingEngine_(std::move(embeddingEngine)),
      options_(std::move(options)), clientFactory_(std::move(clientFactory)),
      connectMutex_(*options_.executor),
      collectionMutex_(*options_.executor) {
    spdlog::debug("[ValkeyAdapter] created for {}:{} ({} dimensions, engine '{}')", options_.host,
                  options_.port, embeddingEngine_->getVectorSize(),
                  embeddingEngine_->getEngineName());
}

ValkeyAdapter::~ValkeyAdapter() = default;

std::string ValkeyAdapter::indexName(const std::string& collection) {
    return vector::indexName(collection);
}

std::string ValkeyAdapter::keyPrefix(const std::string& collection) {
    return vector::keyPrefix(collection);
}

std::string ValkeyAdapter::documentKey(const std::string& collection, const std::string& id) {
    return vector::documentKey(collection, id);
}

// ============================================================================
// Connection
// ============================================================================

awaitable<Result<std::shared_ptr<client::ValkeyClient>>> ValkeyAdapter::getConnection() {
    {
        std::lock_guard<std::mutex> lk(clientMutex_);
        if (client_) {
            co_return client_;
        }
    }

    // Serialize first use so concurrent callers share one handle
    auto guard = co_await connectMutex_.lock();
    {
        std::lock_guard<std::mutex> lk(clientMutex_);
        if (client_) {
            co_return client_;
        }
    }

    auto created = co_await clientFactory_(options_);
    if (!created) {
        spdlog::error("[ValkeyAdapter] failed to connect to {}:{}: {}", options_.host,
                      options_.port, created.error().message);
        co_return created.error();
    }
    spdlog::info("[ValkeyAdapter] connected to {}:{}", options_.host, options_.port);
    std::lock_guard<std::mutex> lk(clientMutex_);
    client_ = created.value();
    co_return client_;
}

bool ValkeyAdapter::isConnected() const {
    std::lock_guard<std::mutex> lk(clientMutex_);
    return client_ != nullptr;
}

awaitable<void> ValkeyAdapter::close() {
    std::shared_ptr<client::ValkeyClient> handle;
    {
        std::lock_guard<std::mutex> lk(clientMutex_);
        handle = std::move(client_);
        client_.reset();
    }
    if (!handle) {
        co_return;
    }
    auto r = co_await handle->close();
    if (!r) {
        spdlog::debug("[ValkeyAdapter] error while closing connection: {}", r.error().message);
    }
}

awaitable<Result<std::vector<std::vector<float>>>>
ValkeyAdapter::embedData(std::vector<std::string> texts) {
    if (texts.empty()) {
        co_return std::vector<std::vector<float>>{};
    }
    auto vectors = co_await embeddingEngine_->embedText(texts);
    if (!vectors) {
        spdlog::error("[ValkeyAdapter] embedding {} texts failed: {}", texts.size(),
                      vectors.error().message);
        co_return vectors.error();
    }
    if (vectors.value().size() != texts.size()) {
        co_return Error{ErrorCode::InvalidData,
                        valvec::format("Embedding engine returned {} vectors for {} texts",
                                       vectors.value().size(), texts.size())};
    }
    co_return vectors;
}

// ============================================================================
// Schema
// ============================================================================

awaitable<Result<CollectionState>> ValkeyAdapter::lookupCollection(std::string collection) {
    auto conn = co_await getConnection();
    if (!conn) {
        co_return conn.error();
    }
    auto info = co_await client::ft::info(*conn.value(), indexName(collection));
    if (!info) {
        co_return info.error();
    }
    co_return CollectionState{std::move(info).value()};
}

awaitable<bool> ValkeyAdapter::hasCollection(std::string collection) {
    auto state = co_await lookupCollection(collection);
    if (!state) {
        spdlog::debug("[ValkeyAdapter] hasCollection('{}') lookup failed: {}", collection,
                      state.error().message);
        co_return false;
    }
    co_return state.value().has_value();
}

awaitable<Result<void>> ValkeyAdapter::createCollection(std::string collection,
                                                        std::optional<nlohmann::json> schema) {
    auto guard = co_await collectionMutex_.lock();

    auto state = co_await lookupCollection(collection);
    if (!state) {
        spdlog::error("[ValkeyAdapter] createCollection('{}') lookup failed: {}", collection,
                      state.error().message);
        co_return state.error();
    }
    if (state.value()) {
        spdlog::info("[ValkeyAdapter] collection '{}' already exists", collection);
        co_return Result<void>();
    }
    if (schema) {
        spdlog::debug("[ValkeyAdapter] ignoring payload schema for collection '{}'", collection);
    }

    auto conn = co_await getConnection();
    if (!conn) {
        co_return conn.error();
    }

    client::IndexDefinition definition;
    definition.prefixes = {keyPrefix(collection)};
    definition.tags = {client::TagField{"$.id", "id"}};
    definition.vector = client::VectorField{"$.vector", "vector", vectorSize(),
                                            client::DistanceMetric::Cosine};

    auto created = co_await client::ft::create(*conn.value(), indexName(collection), definition);
    if (!created) {
        spdlog::error("[ValkeyAdapter] creating index for '{}' failed: {}", collection,
                      created.error().message);
        co_return created.error();
    }
    spdlog::info("[ValkeyAdapter] created collection '{}' ({} dimensions)", collection,
                 vectorSize());
    co_return Result<void>();
}

} // namespace valvec::vector
