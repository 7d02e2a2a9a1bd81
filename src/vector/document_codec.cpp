#include <valvec/vector/document_codec.h>

#include <bit>
#include <cstdint>
#include <cstdlib>
#include <span>

#include <spdlog/spdlog.h>

#include <valvec/core/format.h>
#include <valvec/core/uuid.h>

namespace valvec::vector {

namespace {

constexpr std::string_view kIndexPrefix = "index:";
constexpr std::string_view kKeyPrefix = "vdb:";
constexpr std::size_t kUuidBytes = 16;

// Some servers return string-valued JSON paths still JSON-encoded ("\"abc\"")
std::string unwrapJsonString(std::string_view text) {
    if (text.size() >= 2 && text.front() == '"' && text.back() == '"') {
        auto parsed = nlohmann::json::parse(text, nullptr, false);
        if (!parsed.is_discarded() && parsed.is_string()) {
            return parsed.get<std::string>();
        }
    }
    return std::string(text);
}

std::optional<float> parseScore(const std::string& text) {
    if (text.empty()) {
        return std::nullopt;
    }
    char* end = nullptr;
    float v = std::strtof(text.c_str(), &end);
    if (end != text.c_str() + text.size()) {
        return std::nullopt;
    }
    return v;
}

const std::string* findField(const client::SearchHit& hit, const char* name) {
    auto it = hit.fields.find(name);
    return it == hit.fields.end() ? nullptr : &it->second;
}

} // namespace

std::string indexName(std::string_view collection) {
    return std::string(kIndexPrefix) + std::string(collection);
}

std::string keyPrefix(std::string_view collection) {
    return std::string(kKeyPrefix) + std::string(collection) + ":";
}

std::string documentKey(std::string_view collection, std::string_view id) {
    return keyPrefix(collection) + std::string(id);
}

std::optional<std::string> collectionFromIndexName(std::string_view index) {
    if (index.size() <= kIndexPrefix.size() || index.substr(0, kIndexPrefix.size()) != kIndexPrefix) {
        return std::nullopt;
    }
    return std::string(index.substr(kIndexPrefix.size()));
}

nlohmann::json serializeForJson(const nlohmann::json& value) {
    if (value.is_binary()) {
        const auto& bytes = value.get_binary();
        if (bytes.size() == kUuidBytes) {
            return core::formatUUID(std::span<const uint8_t, kUuidBytes>(bytes.data(), kUuidBytes));
        }
        return value;
    }
    if (value.is_object()) {
        auto out = nlohmann::json::object();
        for (auto it = value.begin(); it != value.end(); ++it) {
            out[it.key()] = serializeForJson(it.value());
        }
        return out;
    }
    if (value.is_array()) {
        auto out = nlohmann::json::array();
        for (const auto& item : value) {
            out.push_back(serializeForJson(item));
        }
        return out;
    }
    return value;
}

nlohmann::json serializePayload(const DataPoint& point) {
    nlohmann::json merged = point.payload.is_object() ? point.payload : nlohmann::json::object();
    if (!point.payload.is_object() && !point.payload.is_null()) {
        merged["_payload"] = point.payload;
    }
    merged["id"] = point.id;
    merged["type"] = point.type;
    if (!merged.contains("metadata") || !merged["metadata"].is_object()) {
        merged["metadata"] = nlohmann::json::object();
    }
    merged["metadata"]["index_fields"] = point.indexFields;
    return serializeForJson(merged);
}

std::string packFloat32(const std::vector<float>& values) {
    std::string out;
    out.resize(values.size() * sizeof(float));
    for (std::size_t i = 0; i < values.size(); ++i) {
        auto bits = std::bit_cast<uint32_t>(values[i]);
        for (std::size_t b = 0; b < sizeof(float); ++b) {
            out[i * sizeof(float) + b] = static_cast<char>((bits >> (8 * b)) & 0xFF);
        }
    }
    return out;
}

Result<StorageDocument> encodeDocument(const DataPoint& point, std::vector<float> vector,
                                       std::size_t dimension) {
    if (vector.size() != dimension) {
        return Error{ErrorCode::InvalidData,
                     valvec::format("Embedding for '{}' has {} dimensions, collection expects {}",
                                    point.id, vector.size(), dimension)};
    }
    StorageDocument doc;
    doc.id = point.id;
    doc.vector = std::move(vector);
    doc.payloadData = serializePayload(point).dump();
    return doc;
}

nlohmann::json decodePayload(std::string_view payloadData) {
    auto parsed = nlohmann::json::parse(payloadData, nullptr, false);
    if (parsed.is_discarded()) {
        return nlohmann::json{{"_payload_raw", std::string(payloadData)}};
    }
    if (parsed.is_object()) {
        return parsed;
    }
    return nlohmann::json{{"_payload", std::move(parsed)}};
}

std::optional<std::vector<float>> decodeVectorField(std::string_view text) {
    auto parsed = nlohmann::json::parse(text, nullptr, false);
    if (parsed.is_discarded() || !parsed.is_array()) {
        return std::nullopt;
    }
    // JSONPath results may come wrapped in an outer array
    if (parsed.size() == 1 && parsed[0].is_array()) {
        parsed = parsed[0];
    }
    std::vector<float> out;
    out.reserve(parsed.size());
    for (const auto& v : parsed) {
        if (!v.is_number()) {
            return std::nullopt;
        }
        out.push_back(v.get<float>());
    }
    return out;
}

std::vector<ScoredResult> decodeSearchResults(const client::SearchReply& reply) {
    std::vector<ScoredResult> results;
    results.reserve(reply.hits.size());
    for (const auto& hit : reply.hits) {
        ScoredResult r;
        if (const auto* id = findField(hit, "id")) {
            r.id = unwrapJsonString(*id);
        } else {
            r.id = hit.key;
        }

        if (const auto* score = findField(hit, "score")) {
            r.score = parseScore(*score);
        } else if (const auto* raw = findField(hit, "__vector_score")) {
            r.score = parseScore(*raw);
        }

        if (const auto* payload = findField(hit, "payload_data")) {
            // valkey-search renders $.payload_data as a JSON string literal
            r.payload = decodePayload(unwrapJsonString(*payload));
        }

        if (const auto* vec = findField(hit, "vector")) {
            r.vector = decodeVectorField(*vec);
        }
        results.push_back(std::move(r));
    }
    return results;
}

std::vector<ScoredResult> decodeSearchResults(const client::Reply& reply) {
    auto normalized = client::normalizeSearchReply(reply);
    if (!normalized) {
        spdlog::debug("[DocumentCodec] unrecognized search reply: {}", reply.toDebugString());
        return {};
    }
    return decodeSearchResults(*normalized);
}

} // namespace valvec::vector
