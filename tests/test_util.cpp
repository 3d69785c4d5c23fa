/// @file test_util.cpp
/// Unit tests for util.hpp: URL parsing, backoff, base64 and vector math.

#include "util.hpp"

#include <gtest/gtest.h>
#include <cmath>
#include <limits>
#include <stdexcept>

using namespace prodsearch;

// ============================================================================
// parseUrl
// ============================================================================

TEST(ParseUrl, HttpWithPort) {
    auto parts = parseUrl("http://localhost:6333/collections");
    EXPECT_EQ(parts.scheme, "http");
    EXPECT_EQ(parts.host, "localhost");
    EXPECT_EQ(parts.port, "6333");
    EXPECT_EQ(parts.target, "/collections");
}

TEST(ParseUrl, HttpWithoutPortDefaultsTo80) {
    auto parts = parseUrl("http://example.com/api");
    EXPECT_EQ(parts.port, "80");
    EXPECT_EQ(parts.target, "/api");
}

TEST(ParseUrl, HttpsWithoutPortDefaultsTo443) {
    auto parts = parseUrl("https://cdn.shop.example/images/1001/main.jpg");
    EXPECT_EQ(parts.scheme, "https");
    EXPECT_EQ(parts.host, "cdn.shop.example");
    EXPECT_EQ(parts.port, "443");
    EXPECT_EQ(parts.target, "/images/1001/main.jpg");
}

TEST(ParseUrl, UrlWithoutPathDefaultsToSlash) {
    auto parts = parseUrl("http://qdrant:6333");
    EXPECT_EQ(parts.host, "qdrant");
    EXPECT_EQ(parts.port, "6333");
    EXPECT_EQ(parts.target, "/");
}

TEST(ParseUrl, QueryStringIsKeptInTarget) {
    auto parts = parseUrl("https://img.example/resize?w=224&src=a.png");
    EXPECT_EQ(parts.target, "/resize?w=224&src=a.png");

    auto bare = parseUrl("http://img.example?id=7");
    EXPECT_EQ(bare.host, "img.example");
    EXPECT_EQ(bare.target, "/?id=7");
}

TEST(ParseUrl, MissingSchemeThrows) {
    EXPECT_THROW(parseUrl("localhost:6333/collections"), std::invalid_argument);
}

TEST(ParseUrl, UnsupportedSchemeThrows) {
    EXPECT_THROW(parseUrl("ftp://files.example/a.png"), std::invalid_argument);
}

TEST(ParseUrl, EmptyHostThrows) {
    EXPECT_THROW(parseUrl("http:///collections"), std::invalid_argument);
}

// ============================================================================
// computeBackoffMs
// ============================================================================

TEST(ComputeBackoff, Attempt0InRange200To300) {
    // base=200, jitter in [0,100] => result in [200, 300]
    for (int i = 0; i < 50; ++i) {
        auto ms = computeBackoffMs(0).count();
        EXPECT_GE(ms, 200);
        EXPECT_LE(ms, 300);
    }
}

TEST(ComputeBackoff, Attempt2InRange800To900) {
    for (int i = 0; i < 50; ++i) {
        auto ms = computeBackoffMs(2).count();
        EXPECT_GE(ms, 800);
        EXPECT_LE(ms, 900);
    }
}

TEST(ComputeBackoff, ClampsToMaxPlusJitter) {
    // 200 * 2^10 = 204800, clamped to 5000, + jitter => [5000, 5100]
    for (int i = 0; i < 50; ++i) {
        auto ms = computeBackoffMs(10).count();
        EXPECT_GE(ms, 5000);
        EXPECT_LE(ms, 5100);
    }
}

TEST(ComputeBackoff, HugeAttemptDoesNotOverflow) {
    auto ms = computeBackoffMs(200, 100, 500).count();
    EXPECT_GE(ms, 500);
    EXPECT_LE(ms, 600);
}

// ============================================================================
// base64Encode
// ============================================================================

TEST(Base64Encode, KnownVectors) {
    EXPECT_EQ(base64Encode(""), "");
    EXPECT_EQ(base64Encode("f"), "Zg==");
    EXPECT_EQ(base64Encode("fo"), "Zm8=");
    EXPECT_EQ(base64Encode("foo"), "Zm9v");
    EXPECT_EQ(base64Encode("foobar"), "Zm9vYmFy");
}

TEST(Base64Encode, BinaryBytes) {
    EXPECT_EQ(base64Encode(std::string("\x89PNG", 4)), "iVBORw==");
    EXPECT_EQ(base64Encode(std::string("\xFF\xFE\xFD", 3)), "//79");
    EXPECT_EQ(base64Encode(std::string("\x00\x00", 2)), "AAA=");
}

TEST(Base64Encode, PaddedLengthForEveryRemainder) {
    for (std::size_t n = 0; n < 12; ++n) {
        const auto encoded = base64Encode(std::string(n, '\xA5'));
        EXPECT_EQ(encoded.size(), (n + 2) / 3 * 4) << "input length " << n;
    }
}

// ============================================================================
// Vector math
// ============================================================================

TEST(L2Normalize, ScalesToUnitLength) {
    Vector v{3.0f, 4.0f};
    l2Normalize(v);
    EXPECT_FLOAT_EQ(v[0], 0.6f);
    EXPECT_FLOAT_EQ(v[1], 0.8f);
}

TEST(L2Normalize, ZeroVectorUnchanged) {
    Vector v{0.0f, 0.0f, 0.0f};
    l2Normalize(v);
    for (float x : v) {
        EXPECT_EQ(x, 0.0f);
        EXPECT_FALSE(std::isnan(x));
    }
}

TEST(CosineSimilarity, IdenticalOrthogonalOpposite) {
    EXPECT_NEAR(cosineSimilarity({1, 2, 3}, {1, 2, 3}), 1.0, 1e-9);
    EXPECT_NEAR(cosineSimilarity({1, 0}, {0, 1}), 0.0, 1e-9);
    EXPECT_NEAR(cosineSimilarity({1, 0}, {-2, 0}), -1.0, 1e-9);
}

TEST(CosineSimilarity, IgnoresMagnitude) {
    EXPECT_NEAR(cosineSimilarity({1, 1}, {10, 10}), 1.0, 1e-9);
}

TEST(CosineSimilarity, DegenerateInputsYieldZero) {
    EXPECT_EQ(cosineSimilarity({}, {}), 0.0);
    EXPECT_EQ(cosineSimilarity({1, 2}, {1, 2, 3}), 0.0);
    EXPECT_EQ(cosineSimilarity({0, 0}, {1, 1}), 0.0);
}
