#pragma once

#include <cstddef>
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <utility>
#include <vector>
#include <boost/asio/awaitable.hpp>

#include <valvec/client/reply.h>
#include <valvec/client/valkey_client.h>
#include <valvec/core/types.h>

namespace valvec::client {

enum class DistanceMetric { Cosine, L2, InnerProduct };

const char* toString(DistanceMetric metric) noexcept;

struct TagField {
    std::string path;
    std::string alias;
};

// HNSW FLOAT32 vector field
struct VectorField {
    std::string path;
    std::string alias;
    std::size_t dimensions{0};
    DistanceMetric metric{DistanceMetric::Cosine};
};

// Index over JSON documents whose keys start with one of `prefixes`
struct IndexDefinition {
    std::vector<std::string> prefixes;
    std::vector<TagField> tags;
    std::optional<VectorField> vector;
};

struct ReturnField {
    std::string identifier;
    std::string alias;
};

struct SearchOptions {
    std::vector<std::pair<std::string, std::string>> params;
    std::vector<ReturnField> returnFields;
    std::size_t offset{0};
    std::optional<std::size_t> count;
    int dialect{2};
};

struct IndexInfo {
    std::string name;
    int64_t numDocs{0};
    std::map<std::string, std::string> attributes;
};

struct SearchHit {
    std::string key;
    std::map<std::string, std::string> fields;
};

// FT.SEARCH reply with every key and field value normalized to valid UTF-8 text
struct SearchReply {
    int64_t total{0};
    std::vector<SearchHit> hits;
};

std::vector<std::string> buildCreateIndexArgs(const std::string& index,
                                              const IndexDefinition& definition);
std::vector<std::string> buildSearchArgs(const std::string& index, const std::string& query,
                                         const SearchOptions& options);

// Accepts `[total, {key: fields}]` and the flat RESP2 `[total, key, fields, key, fields...]`
// shapes; fields may be a Map or an alternating name/value array. Anything else is nullopt.
std::optional<SearchReply> normalizeSearchReply(const Reply& reply);

// FT.INFO reply (flat array or Map) to IndexInfo; nullopt if the shape is unrecognized
std::optional<IndexInfo> parseIndexInfo(const Reply& reply);

// Scalar reply rendered as text (strings normalized to UTF-8); nullopt for aggregates and null
std::optional<std::string> scalarText(const Reply& value);

// The command coroutines below copy their arguments; only `client` must outlive the awaitable.

namespace ft {

boost::asio::awaitable<Result<void>> create(ValkeyClient& client, std::string index,
                                            IndexDefinition definition);

// nullopt when the server answers with an error reply (unknown index)
boost::asio::awaitable<Result<std::optional<IndexInfo>>> info(ValkeyClient& client,
                                                              std::string index);

boost::asio::awaitable<Result<std::vector<std::string>>> list(ValkeyClient& client);

boost::asio::awaitable<Result<void>> dropIndex(ValkeyClient& client, std::string index);

// Raw reply; error replies become ProtocolError
boost::asio::awaitable<Result<Reply>>
search(ValkeyClient& client, std::string index, std::string query, SearchOptions options);

} // namespace ft

namespace json {

boost::asio::awaitable<Result<void>> set(ValkeyClient& client, std::string key,
                                         std::string path, std::string value);

// nullopt when the key does not exist
boost::asio::awaitable<Result<std::optional<std::string>>>
get(ValkeyClient& client, std::string key, std::string path);

} // namespace json

// Number of keys removed
boost::asio::awaitable<Result<int64_t>> del(ValkeyClient& client,
                                            std::vector<std::string> keys);

// Full SCAN iteration collecting every key matching `pattern`
boost::asio::awaitable<Result<std::vector<std::string>>>
scanKeys(ValkeyClient& client, std::string pattern, std::size_t batchSize = 500);

} // namespace valvec::client
