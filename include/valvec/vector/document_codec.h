#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include <nlohmann/json.hpp>

#include <valvec/client/commands.h>
#include <valvec/client/reply.h>
#include <valvec/core/types.h>
#include <valvec/vector/data_point.h>

namespace valvec::vector {

// ============================================================================
// Naming
// ============================================================================

std::string indexName(std::string_view collection);
std::string keyPrefix(std::string_view collection);
std::string documentKey(std::string_view collection, std::string_view id);

// Collection name for an index following the index:{name} convention
std::optional<std::string> collectionFromIndexName(std::string_view index);

// ============================================================================
// Payload serialization
// ============================================================================

/**
 * Recursively convert a payload tree to plain JSON. 16-byte binary values are raw UUIDs and
 * become canonical 8-4-4-4-12 strings; objects and arrays are walked; everything else passes
 * through unchanged.
 */
nlohmann::json serializeForJson(const nlohmann::json& value);

// Payload with id, type and metadata.index_fields merged in, then serialized
nlohmann::json serializePayload(const DataPoint& point);

// ============================================================================
// Vector packing (little-endian float32 regardless of host order)
// ============================================================================

std::string packFloat32(const std::vector<float>& values);

// ============================================================================
// Documents
// ============================================================================

// Fails with InvalidData if the vector length differs from `dimension`
Result<StorageDocument> encodeDocument(const DataPoint& point, std::vector<float> vector,
                                       std::size_t dimension);

// Parse stored payload text: object as-is, other JSON as {"_payload": v},
// unparsable text as {"_payload_raw": text}
nlohmann::json decodePayload(std::string_view payloadData);

// Vector from the JSON text of the stored vector field; nullopt if it does not parse
std::optional<std::vector<float>> decodeVectorField(std::string_view text);

// Never fails: malformed entries degrade and malformed replies decode to an empty list
std::vector<ScoredResult> decodeSearchResults(const client::SearchReply& reply);
std::vector<ScoredResult> decodeSearchResults(const client::Reply& reply);

} // namespace valvec::vector
