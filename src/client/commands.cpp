#include <valvec/client/commands.h>

#include <spdlog/spdlog.h>

#include <valvec/core/format.h>

namespace valvec::client {

using boost::asio::awaitable;

namespace {

Error replyError(const std::string& command, const Reply& reply) {
    return Error{ErrorCode::ProtocolError,
                 valvec::format("{} failed: {}", command, reply.toDebugString())};
}

// Command result with server error replies turned into ProtocolError
awaitable<Result<Reply>> checked(ValkeyClient& client, std::vector<std::string> args) {
    auto name = args.front();
    auto reply = co_await client.command(std::move(args));
    if (!reply) {
        co_return reply.error();
    }
    if (reply.value().isError()) {
        co_return replyError(name, reply.value());
    }
    co_return reply;
}

// Decode an alternating name/value sequence (Map or flat array) into text pairs
bool collectFields(const Reply& value, std::map<std::string, std::string>& out) {
    if (!value.isMap() && !value.isArray()) {
        return false;
    }
    if (value.elements.size() % 2 != 0) {
        return false;
    }
    for (std::size_t i = 0; i + 1 < value.elements.size(); i += 2) {
        auto name = scalarText(value.elements[i]);
        if (!name) {
            return false;
        }
        auto text = scalarText(value.elements[i + 1]);
        if (text) {
            out[*name] = std::move(*text);
        }
    }
    return true;
}

} // namespace

const char* toString(DistanceMetric metric) noexcept {
    switch (metric) {
        case DistanceMetric::Cosine:
            return "COSINE";
        case DistanceMetric::L2:
            return "L2";
        case DistanceMetric::InnerProduct:
            return "IP";
    }
    return "COSINE";
}

std::optional<std::string> scalarText(const Reply& value) {
    switch (value.type) {
        case ReplyType::Status:
        case ReplyType::String:
            return toText(value.str);
        case ReplyType::Integer:
            return std::to_string(value.integer);
        case ReplyType::Double:
            return valvec::format("{}", value.number);
        case ReplyType::Boolean:
            return std::string(value.boolean ? "true" : "false");
        default:
            return std::nullopt;
    }
}

std::vector<std::string> buildCreateIndexArgs(const std::string& index,
                                              const IndexDefinition& definition) {
    std::vector<std::string> args{"FT.CREATE", index, "ON", "JSON"};
    if (!definition.prefixes.empty()) {
        args.emplace_back("PREFIX");
        args.push_back(std::to_string(definition.prefixes.size()));
        args.insert(args.end(), definition.prefixes.begin(), definition.prefixes.end());
    }
    args.emplace_back("SCHEMA");
    for (const auto& tag : definition.tags) {
        args.push_back(tag.path);
        if (!tag.alias.empty()) {
            args.emplace_back("AS");
            args.push_back(tag.alias);
        }
        args.emplace_back("TAG");
    }
    if (definition.vector) {
        const auto& v = *definition.vector;
        args.push_back(v.path);
        if (!v.alias.empty()) {
            args.emplace_back("AS");
            args.push_back(v.alias);
        }
        args.insert(args.end(), {"VECTOR", "HNSW", "6", "TYPE", "FLOAT32", "DIM",
                                 std::to_string(v.dimensions), "DISTANCE_METRIC",
                                 toString(v.metric)});
    }
    return args;
}

std::vector<std::string> buildSearchArgs(const std::string& index, const std::string& query,
                                         const SearchOptions& options) {
    std::vector<std::string> args{"FT.SEARCH", index, query};
    if (!options.params.empty()) {
        args.emplace_back("PARAMS");
        args.push_back(std::to_string(options.params.size() * 2));
        for (const auto& [name, value] : options.params) {
            args.push_back(name);
            args.push_back(value);
        }
    }
    if (!options.returnFields.empty()) {
        std::size_t tokens = 0;
        for (const auto& f : options.returnFields) {
            tokens += f.alias.empty() ? 1 : 3;
        }
        args.emplace_back("RETURN");
        args.push_back(std::to_string(tokens));
        for (const auto& f : options.returnFields) {
            args.push_back(f.identifier);
            if (!f.alias.empty()) {
                args.emplace_back("AS");
                args.push_back(f.alias);
            }
        }
    }
    if (options.count) {
        args.emplace_back("LIMIT");
        args.push_back(std::to_string(options.offset));
        args.push_back(std::to_string(*options.count));
    }
    if (options.dialect > 0) {
        args.emplace_back("DIALECT");
        args.push_back(std::to_string(options.dialect));
    }
    return args;
}

std::optional<SearchReply> normalizeSearchReply(const Reply& reply) {
    if (!reply.isArray() || reply.elements.empty()) {
        return std::nullopt;
    }
    auto total = reply.elements.front().asInteger();
    if (!total) {
        return std::nullopt;
    }

    SearchReply out;
    out.total = *total;

    // [total, {key: fields, ...}]
    if (reply.elements.size() == 2 && reply.elements[1].isMap()) {
        const auto& docs = reply.elements[1].elements;
        for (std::size_t i = 0; i + 1 < docs.size(); i += 2) {
            auto key = scalarText(docs[i]);
            if (!key) {
                return std::nullopt;
            }
            SearchHit hit{std::move(*key), {}};
            if (!docs[i + 1].isNull() && !collectFields(docs[i + 1], hit.fields)) {
                return std::nullopt;
            }
            out.hits.push_back(std::move(hit));
        }
        return out;
    }

    // [total, key, fields, key, fields, ...]
    if ((reply.elements.size() - 1) % 2 != 0) {
        return std::nullopt;
    }
    for (std::size_t i = 1; i + 1 < reply.elements.size(); i += 2) {
        auto key = scalarText(reply.elements[i]);
        if (!key) {
            return std::nullopt;
        }
        SearchHit hit{std::move(*key), {}};
        if (!reply.elements[i + 1].isNull() && !collectFields(reply.elements[i + 1], hit.fields)) {
            return std::nullopt;
        }
        out.hits.push_back(std::move(hit));
    }
    return out;
}

std::optional<IndexInfo> parseIndexInfo(const Reply& reply) {
    if ((!reply.isArray() && !reply.isMap()) || reply.elements.size() % 2 != 0) {
        return std::nullopt;
    }
    IndexInfo info;
    for (std::size_t i = 0; i + 1 < reply.elements.size(); i += 2) {
        auto name = scalarText(reply.elements[i]);
        if (!name) {
            continue;
        }
        const auto& value = reply.elements[i + 1];
        if (*name == "index_name") {
            info.name = scalarText(value).value_or("");
        } else if (*name == "num_docs") {
            if (auto n = value.asInteger()) {
                info.numDocs = *n;
            } else if (auto d = value.asDouble()) {
                info.numDocs = static_cast<int64_t>(*d);
            }
        } else if (auto text = scalarText(value)) {
            info.attributes.emplace(std::move(*name), std::move(*text));
        }
    }
    return info;
}

namespace ft {

awaitable<Result<void>> create(ValkeyClient& client, std::string index,
                               IndexDefinition definition) {
    auto reply = co_await client.command(buildCreateIndexArgs(index, definition));
    if (!reply) {
        co_return reply.error();
    }
    if (!reply.value().isOk()) {
        co_return replyError("FT.CREATE", reply.value());
    }
    co_return Result<void>();
}

awaitable<Result<std::optional<IndexInfo>>> info(ValkeyClient& client, std::string index) {
    std::vector<std::string> args{"FT.INFO", index};
    auto reply = co_await client.command(std::move(args));
    if (!reply) {
        co_return reply.error();
    }
    if (reply.value().isError()) {
        spdlog::debug("[ValkeyCommands] FT.INFO {}: {}", index, reply.value().str);
        co_return std::optional<IndexInfo>{};
    }
    auto parsed = parseIndexInfo(reply.value());
    if (!parsed) {
        co_return Error{ErrorCode::ProtocolError,
                        valvec::format("Unexpected FT.INFO reply: {}",
                                       reply.value().toDebugString())};
    }
    if (parsed->name.empty()) {
        parsed->name = index;
    }
    co_return std::optional<IndexInfo>{std::move(*parsed)};
}

awaitable<Result<std::vector<std::string>>> list(ValkeyClient& client) {
    std::vector<std::string> args{"FT._LIST"};
    auto reply = co_await checked(client, std::move(args));
    if (!reply) {
        co_return reply.error();
    }
    const auto& value = reply.value();
    if (!value.isArray()) {
        co_return Error{ErrorCode::ProtocolError,
                        valvec::format("Unexpected FT._LIST reply: {}", value.toDebugString())};
    }
    std::vector<std::string> names;
    names.reserve(value.elements.size());
    for (const auto& e : value.elements) {
        if (auto name = scalarText(e)) {
            names.push_back(std::move(*name));
        }
    }
    co_return names;
}

awaitable<Result<void>> dropIndex(ValkeyClient& client, std::string index) {
    std::vector<std::string> args{"FT.DROPINDEX", index};
    auto reply = co_await checked(client, std::move(args));
    if (!reply) {
        co_return reply.error();
    }
    co_return Result<void>();
}

awaitable<Result<Reply>> search(ValkeyClient& client, std::string index,
                                    std::string query, SearchOptions options) {
    co_return co_await checked(client, buildSearchArgs(index, query, options));
}

} // namespace ft

namespace json {

awaitable<Result<void>> set(ValkeyClient& client, std::string key, std::string path,
                            std::string value) {
    std::vector<std::string> args{"JSON.SET", key, path, value};
    auto reply = co_await client.command(std::move(args));
    if (!reply) {
        co_return reply.error();
    }
    if (!reply.value().isOk()) {
        co_return replyError("JSON.SET", reply.value());
    }
    co_return Result<void>();
}

awaitable<Result<std::optional<std::string>>> get(ValkeyClient& client, std::string key,
                                                  std::string path) {
    std::vector<std::string> args{"JSON.GET", key, path};
    auto reply = co_await checked(client, std::move(args));
    if (!reply) {
        co_return reply.error();
    }
    const auto& value = reply.value();
    if (value.isNull()) {
        co_return std::optional<std::string>{};
    }
    if (!value.isString()) {
        co_return Error{ErrorCode::ProtocolError,
                        valvec::format("Unexpected JSON.GET reply: {}", value.toDebugString())};
    }
    co_return std::optional<std::string>{toText(value.str)};
}

} // namespace json

awaitable<Result<int64_t>> del(ValkeyClient& client, std::vector<std::string> keys) {
    if (keys.empty()) {
        co_return int64_t{0};
    }
    std::vector<std::string> args;
    args.reserve(keys.size() + 1);
    args.emplace_back("DEL");
    args.insert(args.end(), keys.begin(), keys.end());
    auto reply = co_await checked(client, std::move(args));
    if (!reply) {
        co_return reply.error();
    }
    auto n = reply.value().asInteger();
    if (!n) {
        co_return Error{ErrorCode::ProtocolError,
                        valvec::format("Unexpected DEL reply: {}", reply.value().toDebugString())};
    }
    co_return *n;
}

awaitable<Result<std::vector<std::string>>> scanKeys(ValkeyClient& client,
                                                     std::string pattern,
                                                     std::size_t batchSize) {
    std::vector<std::string> keys;
    std::string cursor = "0";
    do {
        std::vector<std::string> args{"SCAN", cursor, "MATCH", pattern, "COUNT",
                                      std::to_string(batchSize)};
        auto reply = co_await checked(client, std::move(args));
        if (!reply) {
            co_return reply.error();
        }
        const auto& value = reply.value();
        if (!value.isArray() || value.elements.size() != 2 || !value.elements[1].isArray()) {
            co_return Error{ErrorCode::ProtocolError,
                            valvec::format("Unexpected SCAN reply: {}", value.toDebugString())};
        }
        auto next = scalarText(value.elements[0]);
        if (!next) {
            co_return Error{ErrorCode::ProtocolError, "SCAN reply without cursor"};
        }
        cursor = std::move(*next);
        for (const auto& k : value.elements[1].elements) {
            if (k.isString()) {
                keys.push_back(k.str);
            }
        }
    } while (cursor != "0");
    co_return keys;
}

} // namespace valvec::client
