#include <valvec/vector/valkey_adapter.h>

#include <spdlog/spdlog.h>

#include <valvec/client/commands.h>
#include <valvec/core/async_gather.h>
#include <valvec/core/format.h>
#include <valvec/vector/document_codec.h>

namespace valvec::vector {

using boost::asio::awaitable;

namespace {

constexpr const char* kVectorParam = "query_vector";

client::SearchOptions knnOptions(const std::vector<float>& queryVector, int64_t limit,
                                 bool withVector) {
    client::SearchOptions options;
    options.params.emplace_back(kVectorParam, packFloat32(queryVector));
    options.returnFields = {
        {"$.id", "id"},
        {"$.payload_data", "payload_data"},
        {"__vector_score", "score"},
    };
    if (withVector) {
        options.returnFields.push_back({"$.vector", "vector"});
    }
    options.offset = 0;
    options.count = static_cast<std::size_t>(limit);
    options.dialect = 2;
    return options;
}

} // namespace

awaitable<Result<std::vector<ScoredResult>>>
ValkeyAdapter::searchByVector(std::shared_ptr<client::ValkeyClient> valkey, std::string collection,
                              std::vector<float> queryVector, int64_t limit, bool withVector) {
    auto query = valvec::format("*=>[KNN {} @vector ${}]", limit, kVectorParam);
    auto reply = co_await client::ft::search(*valkey, indexName(collection), query,
                                             knnOptions(queryVector, limit, withVector));
    if (!reply) {
        spdlog::error("[ValkeyAdapter] search in '{}' failed: {}", collection,
                      reply.error().message);
        co_return reply.error();
    }
    co_return decodeSearchResults(reply.value());
}

awaitable<Result<std::vector<ScoredResult>>> ValkeyAdapter::search(std::string collection,
                                                                   SearchRequest request) {
    if (!request.queryText && !request.queryVector) {
        co_return Error{ErrorCode::MissingQueryParameter,
                        "One of queryText or queryVector must be provided"};
    }

    auto state = co_await lookupCollection(collection);
    if (!state) {
        spdlog::error("[ValkeyAdapter] search lookup for '{}' failed: {}", collection,
                      state.error().message);
        co_return state.error();
    }
    if (!state.value()) {
        spdlog::debug("[ValkeyAdapter] search in missing collection '{}'", collection);
        co_return std::vector<ScoredResult>{};
    }

    const int64_t limit = request.limit.value_or(state.value()->numDocs);
    if (limit <= 0) {
        co_return std::vector<ScoredResult>{};
    }

    std::vector<float> queryVector;
    if (request.queryVector) {
        queryVector = std::move(*request.queryVector);
    } else {
        std::vector<std::string> texts{*request.queryText};
        auto embedded = co_await embedData(std::move(texts));
        if (!embedded) {
            co_return embedded.error();
        }
        queryVector = std::move(embedded.value().front());
    }

    auto conn = co_await getConnection();
    if (!conn) {
        co_return conn.error();
    }
    co_return co_await searchByVector(conn.value(), collection, std::move(queryVector), limit,
                                      request.withVector);
}

awaitable<Result<std::vector<std::vector<ScoredResult>>>>
ValkeyAdapter::batchSearch(std::string collection, std::vector<std::string> queryTexts,
                           std::optional<int64_t> limit, bool withVectors,
                           std::optional<float> scoreThreshold) {
    using Batch = std::vector<std::vector<ScoredResult>>;

    auto state = co_await lookupCollection(collection);
    if (!state) {
        spdlog::error("[ValkeyAdapter] batch search lookup for '{}' failed: {}", collection,
                      state.error().message);
        co_return state.error();
    }
    if (!state.value() || queryTexts.empty()) {
        co_return Batch{};
    }

    const int64_t resolvedLimit = limit.value_or(state.value()->numDocs);
    if (resolvedLimit <= 0) {
        co_return Batch(queryTexts.size());
    }

    auto vectors = co_await embedData(queryTexts);
    if (!vectors) {
        co_return vectors.error();
    }
    auto conn = co_await getConnection();
    if (!conn) {
        co_return conn.error();
    }

    std::vector<awaitable<Result<std::vector<ScoredResult>>>> tasks;
    tasks.reserve(queryTexts.size());
    for (auto& v : vectors.value()) {
        tasks.push_back(searchByVector(conn.value(), collection, std::move(v), resolvedLimit,
                                       withVectors));
    }
    auto joined = co_await core::gatherAll<std::vector<ScoredResult>>(std::move(tasks));
    if (!joined) {
        co_return joined.error();
    }

    Batch out;
    out.reserve(joined.value().size());
    for (auto& results : joined.value()) {
        std::vector<ScoredResult> kept;
        for (auto& r : results) {
            // Cosine distance: smaller is closer. Results without a score cannot be ranked.
            if (!scoreThreshold) {
                kept.push_back(std::move(r));
            } else if (r.score && *r.score < *scoreThreshold) {
                kept.push_back(std::move(r));
            }
        }
        out.push_back(std::move(kept));
    }
    co_return out;
}

} // namespace valvec::vector
