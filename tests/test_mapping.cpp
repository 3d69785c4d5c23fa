/// @file test_mapping.cpp
/// Unit tests for mapping.hpp: catalog records, payload JSON and store replies.

#include "mapping.hpp"
#include "fakes.hpp"

#include <gtest/gtest.h>
#include <nlohmann/json.hpp>

using namespace prodsearch;
using json = nlohmann::json;

// ============================================================================
// parseProductRecord
// ============================================================================

TEST(ParseProductRecord, FullRecord) {
    auto p = parseProductRecord(prodsearch::testing::makeRecord(1001, {"https://img/a.jpg", "https://img/b.jpg"}, 59.9));

    EXPECT_EQ(p.id, 1001);
    EXPECT_EQ(p.name, "Product 1001");
    EXPECT_FALSE(p.material.has_value());
    ASSERT_TRUE(p.rating.has_value());
    EXPECT_DOUBLE_EQ(*p.rating, 4.5);
    ASSERT_EQ(p.images.size(), 2u);
    EXPECT_EQ(p.images[0], "https://img/a.jpg");
    EXPECT_EQ(p.brandName.value_or(""), "Acme");
    EXPECT_FALSE(p.categoryId.has_value());
    EXPECT_EQ(p.shopId, 7);
    ASSERT_TRUE(p.colors.has_value());
    EXPECT_EQ(p.colors->size(), 2u);
    EXPECT_DOUBLE_EQ(p.currentPrice.value_or(0), 59.9);
    EXPECT_EQ(p.offPercent.value_or(0), 20);
    EXPECT_EQ(p.updateDate, "2024-05-01T10:00:00");
}

TEST(ParseProductRecord, MissingFieldsDefault) {
    auto p = parseProductRecord({{"id", 5}});

    EXPECT_EQ(p.id, 5);
    EXPECT_EQ(p.name, "");
    EXPECT_TRUE(p.images.empty());
    EXPECT_FALSE(p.currentPrice.has_value());
    EXPECT_FALSE(p.colors.has_value());
    EXPECT_EQ(p.shopId, 0);
}

TEST(ParseProductRecord, NullTextFieldsBecomeEmpty) {
    auto p = parseProductRecord({{"id", 5}, {"description", nullptr}, {"status", nullptr}});
    EXPECT_EQ(p.description, "");
    EXPECT_EQ(p.status, "");
}

TEST(ParseProductRecord, MissingIdThrows) {
    EXPECT_THROW(parseProductRecord({{"name", "x"}}), std::invalid_argument);
    EXPECT_THROW(parseProductRecord({{"id", "1001"}}), std::invalid_argument);
    EXPECT_THROW(parseProductRecord(json::array()), std::invalid_argument);
}

// ============================================================================
// payloadToJson
// ============================================================================

TEST(PayloadToJson, UsesSnakeCaseAndNullForUnset) {
    ProductPayload p;
    p.id           = 7;
    p.name         = "Linen shirt";
    p.currentPrice = 39.0;
    p.colors       = std::vector<std::string>{"white"};

    auto j = payloadToJson(p);
    EXPECT_EQ(j["id"], 7);
    EXPECT_EQ(j["name"], "Linen shirt");
    EXPECT_EQ(j["current_price"], 39.0);
    EXPECT_EQ(j["colors"], json::array({"white"}));
    EXPECT_TRUE(j["old_price"].is_null());
    EXPECT_TRUE(j["brand_name"].is_null());
    EXPECT_TRUE(j["images"].is_array());
    EXPECT_TRUE(j.contains("update_date"));
}

TEST(PayloadToJson, CatalogRecordSurvivesTheTrip) {
    const auto record = prodsearch::testing::makeRecord(42, {"https://img/42.png"}, 12.5, "Zeta");
    EXPECT_EQ(payloadToJson(parseProductRecord(record)), record);
}

// ============================================================================
// parseSearchResult
// ============================================================================

TEST(ParseSearchResult, ScoredPointsInOrder) {
    json response = {
        {"result", json::array({
            {{"id", 7}, {"version", 3}, {"score", 0.93}, {"payload", {{"id", 7}, {"name", "A"}}}},
            {{"id", 9}, {"version", 1}, {"score", 0.41}, {"payload", {{"id", 9}, {"name", "B"}}}}
        })},
        {"status", "ok"},
        {"time", 0.002}
    };

    auto points = parseSearchResult(response);
    ASSERT_EQ(points.size(), 2u);
    EXPECT_EQ(points[0].id, 7);
    EXPECT_DOUBLE_EQ(points[0].score.value_or(0), 0.93);
    EXPECT_EQ(points[0].payload.name, "A");
    EXPECT_FALSE(points[0].vector.has_value());
    EXPECT_EQ(points[1].id, 9);
}

TEST(ParseSearchResult, PointWithoutPayloadKeepsId) {
    auto points = parseSearchResult({{"result", json::array({{{"id", 3}, {"score", 0.5}}})}});
    ASSERT_EQ(points.size(), 1u);
    EXPECT_EQ(points[0].payload.id, 3);
}

TEST(ParseSearchResult, EmptyResult) {
    EXPECT_TRUE(parseSearchResult({{"result", json::array()}}).empty());
}

TEST(ParseSearchResult, MissingResultThrows) {
    EXPECT_THROW(parseSearchResult({{"status", "ok"}}), std::runtime_error);
}

// ============================================================================
// extractStoreError
// ============================================================================

TEST(ExtractStoreError, ErrorObject) {
    json body = {{"status", {{"error", "Not found: Collection `x` doesn't exist!"}}}};
    EXPECT_EQ(extractStoreError(body).value_or(""), "Not found: Collection `x` doesn't exist!");
}

TEST(ExtractStoreError, OkStatusHasNoError) {
    EXPECT_FALSE(extractStoreError({{"status", "ok"}, {"result", true}}).has_value());
    EXPECT_FALSE(extractStoreError(json::object()).has_value());
}
