#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace prodsearch {

using Vector = std::vector<float>;

/// Dimensionality of every vector stored in a product collection.
constexpr std::size_t kVectorSize = 512;

/// Snapshot of the catalog attributes of one product.
struct ProductPayload {
    int64_t     id = 0;
    std::string name;
    std::string description;
    std::optional<std::string> material;
    std::optional<double>      rating;
    std::vector<std::string>   images;      // ordered image URLs, first is primary
    std::string code;

    std::optional<int64_t>     brandId;
    std::optional<std::string> brandName;
    std::optional<int64_t>     categoryId;
    std::optional<std::string> categoryName;
    std::optional<int64_t>     genderId;
    std::optional<std::string> genderName;

    int64_t     shopId = 0;
    std::string shopName;
    std::optional<std::string> link;
    std::string status;

    std::optional<std::vector<std::string>> colors;
    std::optional<std::vector<std::string>> sizes;

    std::string region;
    std::string currency;
    std::optional<double>  currentPrice;
    std::optional<double>  oldPrice;
    std::optional<int64_t> offPercent;

    std::string updateDate;  // ISO-8601
};

/// One point of a product collection. The product id doubles as the point id,
/// so upserting the same product again overwrites it.
struct ProductPoint {
    int64_t               id = 0;
    std::optional<Vector> vector;
    ProductPayload        payload;
    std::optional<double> score;  // set on search results only
};

} // namespace prodsearch
