#include <valvec/vector/valkey_adapter.h>

#include <algorithm>

#include <spdlog/spdlog.h>

#include <valvec/client/commands.h>
#include <valvec/core/async_gather.h>
#include <valvec/core/format.h>
#include <valvec/vector/document_codec.h>

namespace valvec::vector {

using boost::asio::awaitable;

namespace {

constexpr std::size_t kDeleteChunk = 500;

// Escape glob metacharacters so a collection name matches literally in SCAN MATCH
std::string globEscape(std::string_view s) {
    std::string out;
    out.reserve(s.size());
    for (char c : s) {
        if (c == '*' || c == '?' || c == '[' || c == ']' || c == '\\') {
            out.push_back('\\');
        }
        out.push_back(c);
    }
    return out;
}

awaitable<Result<void>> writeDocument(std::shared_ptr<client::ValkeyClient> valkey, std::string key,
                                      std::string document) {
    co_return co_await client::json::set(*valkey, key, "$", document);
}

awaitable<Result<std::optional<std::string>>>
readDocument(std::shared_ptr<client::ValkeyClient> valkey, std::string key) {
    co_return co_await client::json::get(*valkey, key, "$");
}

// JSON.GET with a "$" path wraps the document in a single-element array
ScoredResult decodeStoredDocument(const std::string& id, const std::string& raw) {
    ScoredResult r;
    r.id = id;
    auto doc = nlohmann::json::parse(raw, nullptr, false);
    if (!doc.is_discarded() && doc.is_array() && doc.size() == 1) {
        doc = doc[0];
    }
    if (doc.is_discarded() || !doc.is_object()) {
        r.payload = raw;
        return r;
    }
    auto it = doc.find("payload_data");
    if (it == doc.end() || !it->is_string()) {
        r.payload = raw;
        return r;
    }
    auto payload = nlohmann::json::parse(it->get<std::string>(), nullptr, false);
    if (payload.is_discarded()) {
        r.payload = raw;
        return r;
    }
    r.payload = std::move(payload);
    return r;
}

} // namespace

awaitable<Result<void>> ValkeyAdapter::createDataPoints(std::string collection,
                                                        std::vector<DataPoint> points) {
    auto state = co_await lookupCollection(collection);
    if (!state) {
        spdlog::error("[ValkeyAdapter] createDataPoints lookup for '{}' failed: {}", collection,
                      state.error().message);
        co_return state.error();
    }
    if (!state.value()) {
        co_return Error{ErrorCode::CollectionNotFound,
                        valvec::format("Collection '{}' not found", collection)};
    }
    if (points.empty()) {
        co_return Result<void>();
    }

    std::vector<std::string> texts;
    texts.reserve(points.size());
    for (const auto& p : points) {
        texts.push_back(p.getEmbeddableData());
    }
    auto vectors = co_await embedData(texts);
    if (!vectors) {
        co_return vectors.error();
    }

    auto conn = co_await getConnection();
    if (!conn) {
        co_return conn.error();
    }

    std::vector<awaitable<Result<void>>> writes;
    writes.reserve(points.size());
    for (std::size_t i = 0; i < points.size(); ++i) {
        auto doc = encodeDocument(points[i], std::move(vectors.value()[i]), vectorSize());
        if (!doc) {
            spdlog::error("[ValkeyAdapter] encoding '{}' for '{}' failed: {}", points[i].id,
                          collection, doc.error().message);
            co_return doc.error();
        }
        writes.push_back(writeDocument(conn.value(), documentKey(collection, points[i].id),
                                       doc.value().toJson().dump()));
    }

    auto written = co_await core::gatherAll(std::move(writes));
    if (!written) {
        spdlog::error("[ValkeyAdapter] writing {} points to '{}' failed: {}", points.size(),
                      collection, written.error().message);
        co_return written.error();
    }
    spdlog::debug("[ValkeyAdapter] stored {} points in '{}'", points.size(), collection);
    co_return Result<void>();
}

awaitable<Result<std::vector<ScoredResult>>>
ValkeyAdapter::retrieve(std::string collection, std::vector<std::string> ids) {
    if (ids.empty()) {
        co_return std::vector<ScoredResult>{};
    }
    auto conn = co_await getConnection();
    if (!conn) {
        spdlog::error("[ValkeyAdapter] retrieve from '{}' failed: {}", collection,
                      conn.error().message);
        co_return std::vector<ScoredResult>{};
    }

    std::vector<awaitable<Result<std::optional<std::string>>>> reads;
    reads.reserve(ids.size());
    for (const auto& id : ids) {
        reads.push_back(readDocument(conn.value(), documentKey(collection, id)));
    }
    auto docs = co_await core::gatherAll<std::optional<std::string>>(std::move(reads));
    if (!docs) {
        spdlog::error("[ValkeyAdapter] retrieve from '{}' failed: {}", collection,
                      docs.error().message);
        co_return std::vector<ScoredResult>{};
    }

    std::vector<ScoredResult> results;
    for (std::size_t i = 0; i < ids.size(); ++i) {
        const auto& raw = docs.value()[i];
        if (!raw) {
            continue;
        }
        results.push_back(decodeStoredDocument(ids[i], *raw));
    }
    co_return results;
}

awaitable<Result<DeleteResult>>
ValkeyAdapter::deleteDataPoints(std::string collection, std::vector<std::string> ids) {
    if (ids.empty()) {
        co_return DeleteResult{};
    }
    auto conn = co_await getConnection();
    if (!conn) {
        co_return conn.error();
    }
    std::vector<std::string> keys;
    keys.reserve(ids.size());
    for (const auto& id : ids) {
        keys.push_back(documentKey(collection, id));
    }
    auto removed = co_await client::del(*conn.value(), keys);
    if (!removed) {
        spdlog::error("[ValkeyAdapter] deleting {} points from '{}' failed: {}", ids.size(),
                      collection, removed.error().message);
        co_return removed.error();
    }
    co_return DeleteResult{removed.value()};
}

awaitable<Result<void>>
ValkeyAdapter::deleteCollectionDocuments(std::shared_ptr<client::ValkeyClient> valkey,
                                         std::string collection) {
    auto keys = co_await client::scanKeys(*valkey, globEscape(keyPrefix(collection)) + "*");
    if (!keys) {
        co_return keys.error();
    }
    auto& all = keys.value();
    for (std::size_t start = 0; start < all.size(); start += kDeleteChunk) {
        auto end = std::min(all.size(), start + kDeleteChunk);
        std::vector<std::string> chunk(all.begin() + static_cast<std::ptrdiff_t>(start),
                                       all.begin() + static_cast<std::ptrdiff_t>(end));
        auto removed = co_await client::del(*valkey, chunk);
        if (!removed) {
            co_return removed.error();
        }
    }
    spdlog::debug("[ValkeyAdapter] deleted {} documents of '{}'", all.size(), collection);
    co_return Result<void>();
}

awaitable<Result<void>> ValkeyAdapter::prune() {
    auto conn = co_await getConnection();
    if (!conn) {
        co_return conn.error();
    }
    auto valkey = conn.value();

    auto indexes = co_await client::ft::list(*valkey);
    if (!indexes) {
        spdlog::error("[ValkeyAdapter] prune: listing indexes failed: {}", indexes.error().message);
        co_return indexes.error();
    }

    for (const auto& index : indexes.value()) {
        auto dropped = co_await client::ft::dropIndex(*valkey, index);
        if (!dropped) {
            spdlog::error("[ValkeyAdapter] prune: dropping '{}' failed: {}", index,
                          dropped.error().message);
            co_return dropped.error();
        }
        if (!config_.pruneDeletesDocuments) {
            continue;
        }
        if (auto collection = collectionFromIndexName(index)) {
            auto cleared = co_await deleteCollectionDocuments(valkey, *collection);
            if (!cleared) {
                spdlog::error("[ValkeyAdapter] prune: deleting documents of '{}' failed: {}",
                              *collection, cleared.error().message);
                co_return cleared.error();
            }
        }
    }
    spdlog::info("[ValkeyAdapter] pruned {} indexes", indexes.value().size());
    co_return Result<void>();
}

} // namespace valvec::vector
