#pragma once

#include "models.hpp"

#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <vector>

namespace prodsearch {

/// Map one catalog product record into a ProductPayload.
/// Missing text fields default to empty, missing optional fields stay unset.
/// Throws std::invalid_argument if the record is not an object or has no integer id.
ProductPayload parseProductRecord(const nlohmann::json& record);

/// Serialise a payload with snake_case field names; unset optionals become null.
nlohmann::json payloadToJson(const ProductPayload& payload);

/// Map one Qdrant scored point ({"id","score","payload","vector"?}) into a ProductPoint.
ProductPoint parseScoredPoint(const nlohmann::json& node);

/// Parse the body of a points/search reply.
/// Throws std::runtime_error if the expected "result" array is missing.
std::vector<ProductPoint> parseSearchResult(const nlohmann::json& responseBody);

/// Return the error message of a Qdrant error reply, if there is one.
std::optional<std::string> extractStoreError(const nlohmann::json& responseBody);

} // namespace prodsearch
