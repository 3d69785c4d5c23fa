#include "mapping.hpp"

#include <stdexcept>

namespace prodsearch {

namespace {

template <typename T>
std::optional<T> optionalField(const nlohmann::json& node, const char* key) {
    auto it = node.find(key);
    if (it == node.end() || it->is_null()) {
        return std::nullopt;
    }
    return it->get<T>();
}

template <typename T>
void putOptional(nlohmann::json& out, const char* key, const std::optional<T>& value) {
    if (value) {
        out[key] = *value;
    } else {
        out[key] = nullptr;
    }
}

// Catalog dumps are not consistent about null vs. missing strings.
std::string stringField(const nlohmann::json& node, const char* key) {
    auto it = node.find(key);
    if (it == node.end() || it->is_null()) {
        return "";
    }
    return it->get<std::string>();
}

} // namespace

ProductPayload parseProductRecord(const nlohmann::json& record) {
    if (!record.is_object()) {
        throw std::invalid_argument("Product record is not a JSON object");
    }
    auto idIt = record.find("id");
    if (idIt == record.end() || !idIt->is_number_integer()) {
        throw std::invalid_argument("Product record has no integer 'id'");
    }

    ProductPayload p;
    p.id           = idIt->get<int64_t>();
    p.name         = stringField(record, "name");
    p.description  = stringField(record, "description");
    p.material     = optionalField<std::string>(record, "material");
    p.rating       = optionalField<double>(record, "rating");
    p.images       = optionalField<std::vector<std::string>>(record, "images")
                         .value_or(std::vector<std::string>{});
    p.code         = stringField(record, "code");

    p.brandId      = optionalField<int64_t>(record, "brand_id");
    p.brandName    = optionalField<std::string>(record, "brand_name");
    p.categoryId   = optionalField<int64_t>(record, "category_id");
    p.categoryName = optionalField<std::string>(record, "category_name");
    p.genderId     = optionalField<int64_t>(record, "gender_id");
    p.genderName   = optionalField<std::string>(record, "gender_name");

    p.shopId       = optionalField<int64_t>(record, "shop_id").value_or(0);
    p.shopName     = stringField(record, "shop_name");
    p.link         = optionalField<std::string>(record, "link");
    p.status       = stringField(record, "status");

    p.colors       = optionalField<std::vector<std::string>>(record, "colors");
    p.sizes        = optionalField<std::vector<std::string>>(record, "sizes");

    p.region       = stringField(record, "region");
    p.currency     = stringField(record, "currency");
    p.currentPrice = optionalField<double>(record, "current_price");
    p.oldPrice     = optionalField<double>(record, "old_price");
    p.offPercent   = optionalField<int64_t>(record, "off_percent");

    p.updateDate   = stringField(record, "update_date");
    return p;
}

nlohmann::json payloadToJson(const ProductPayload& p) {
    nlohmann::json out = nlohmann::json::object();
    out["id"]          = p.id;
    out["name"]        = p.name;
    out["description"] = p.description;
    putOptional(out, "material", p.material);
    putOptional(out, "rating", p.rating);
    out["images"]      = p.images;
    out["code"]        = p.code;

    putOptional(out, "brand_id", p.brandId);
    putOptional(out, "brand_name", p.brandName);
    putOptional(out, "category_id", p.categoryId);
    putOptional(out, "category_name", p.categoryName);
    putOptional(out, "gender_id", p.genderId);
    putOptional(out, "gender_name", p.genderName);

    out["shop_id"]     = p.shopId;
    out["shop_name"]   = p.shopName;
    putOptional(out, "link", p.link);
    out["status"]      = p.status;

    putOptional(out, "colors", p.colors);
    putOptional(out, "sizes", p.sizes);

    out["region"]      = p.region;
    out["currency"]    = p.currency;
    putOptional(out, "current_price", p.currentPrice);
    putOptional(out, "old_price", p.oldPrice);
    putOptional(out, "off_percent", p.offPercent);

    out["update_date"] = p.updateDate;
    return out;
}

ProductPoint parseScoredPoint(const nlohmann::json& node) {
    ProductPoint point;
    point.id = node.at("id").get<int64_t>();

    if (node.contains("score") && node["score"].is_number()) {
        point.score = node["score"].get<double>();
    }
    if (node.contains("vector") && node["vector"].is_array()) {
        point.vector = node["vector"].get<Vector>();
    }
    if (node.contains("payload") && node["payload"].is_object()) {
        point.payload = parseProductRecord(node["payload"]);
    } else {
        point.payload.id = point.id;
    }
    return point;
}

std::vector<ProductPoint> parseSearchResult(const nlohmann::json& responseBody) {
    if (!responseBody.contains("result") || !responseBody["result"].is_array()) {
        throw std::runtime_error("Search response missing 'result' array");
    }

    std::vector<ProductPoint> points;
    for (const auto& node : responseBody["result"]) {
        points.push_back(parseScoredPoint(node));
    }
    return points;
}

std::optional<std::string> extractStoreError(const nlohmann::json& responseBody) {
    if (responseBody.contains("status")) {
        const auto& status = responseBody["status"];
        if (status.is_object() && status.contains("error")) {
            return status["error"].get<std::string>();
        }
        if (status.is_string() && status.get<std::string>() != "ok") {
            return status.get<std::string>();
        }
    }
    return std::nullopt;
}

} // namespace prodsearch
