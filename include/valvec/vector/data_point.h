#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include <valvec/client/commands.h>
#include <valvec/core/types.h>

namespace valvec::vector {

/**
 * A typed record to be stored and searched.
 * The embeddable text is the value of the first index field present in the payload.
 */
struct DataPoint {
    std::string id;
    std::string type{"DataPoint"};
    std::vector<std::string> indexFields;
    nlohmann::json payload = nlohmann::json::object();

    std::string getEmbeddableData() const {
        if (!payload.is_object()) {
            return {};
        }
        for (const auto& field : indexFields) {
            auto it = payload.find(field);
            if (it == payload.end() || it->is_null()) {
                continue;
            }
            return it->is_string() ? it->get<std::string>() : it->dump();
        }
        return {};
    }
};

// Document written under vdb:{collection}:{id}
struct StorageDocument {
    std::string id;
    std::vector<float> vector;
    std::string payloadData;

    nlohmann::json toJson() const {
        return nlohmann::json{{"id", id}, {"vector", vector}, {"payload_data", payloadData}};
    }
};

// Lower score means more similar (cosine distance)
struct ScoredResult {
    std::string id;
    nlohmann::json payload = nlohmann::json::object();
    std::optional<float> score;
    std::optional<std::vector<float>> vector;
};

using IndexInfo = client::IndexInfo;

struct DeleteResult {
    int64_t deleted{0};
};

struct SearchRequest {
    std::optional<std::string> queryText;
    std::optional<std::vector<float>> queryVector;
    std::optional<int64_t> limit{static_cast<int64_t>(DEFAULT_SEARCH_LIMIT)};
    bool withVector{false};
};

} // namespace valvec::vector
