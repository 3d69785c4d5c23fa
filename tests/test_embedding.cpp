/// @file test_embedding.cpp
/// Unit tests for embedding.hpp: text cache, concurrent image encoding, failures.

#include "embedding.hpp"
#include "clip_client.hpp"
#include "errors.hpp"
#include "fakes.hpp"

#include <gtest/gtest.h>
#include <nlohmann/json.hpp>
#include <cmath>
#include <memory>
#include <thread>

using namespace prodsearch;
using namespace prodsearch::testing;
using json = nlohmann::json;

namespace {

class EmbeddingProviderTest : public ::testing::Test {
protected:
    void SetUp() override {
        auto model   = std::make_unique<FakeModel>();
        auto fetcher = std::make_unique<FakeFetcher>();
        mModel   = model.get();
        mFetcher = fetcher.get();
        mProvider = std::make_unique<EmbeddingProvider>(std::move(model), std::move(fetcher));
    }

    FakeModel*   mModel   = nullptr;
    FakeFetcher* mFetcher = nullptr;
    std::unique_ptr<EmbeddingProvider> mProvider;
};

double norm(const Vector& v) {
    double sum = 0.0;
    for (float x : v) sum += static_cast<double>(x) * x;
    return std::sqrt(sum);
}

} // namespace

// ============================================================================
// Text
// ============================================================================

TEST_F(EmbeddingProviderTest, TextVectorHasFixedSizeAndUnitLength) {
    auto v = mProvider->encodeText("black leather boots");
    EXPECT_EQ(v.size(), kVectorSize);
    EXPECT_NEAR(norm(v), 1.0, 1e-5);
}

TEST_F(EmbeddingProviderTest, RepeatedTextIsServedFromCache) {
    auto first  = mProvider->encodeText("men's black sneakers");
    auto second = mProvider->encodeText("men's black sneakers");

    EXPECT_EQ(first, second);  // bit-identical
    EXPECT_EQ(mModel->textCalls.load(), 1);
    EXPECT_EQ(mProvider->textCache().hits(), 1u);
}

TEST_F(EmbeddingProviderTest, DifferentTextsAreEncodedSeparately) {
    auto a = mProvider->encodeText("red dress");
    auto b = mProvider->encodeText("blue dress");
    EXPECT_NE(a, b);
    EXPECT_EQ(mModel->textCalls.load(), 2);
}

TEST_F(EmbeddingProviderTest, BlankTextFailsWithEncodingError) {
    EXPECT_THROW(mProvider->encodeText(""), EncodingError);
    EXPECT_THROW(mProvider->encodeText("  \t\n"), EncodingError);
    EXPECT_EQ(mModel->textCalls.load(), 0);
}

TEST_F(EmbeddingProviderTest, WrongDimensionFailsAndIsNotCached) {
    mModel->pinned["tiny"] = Vector{1.0f, 2.0f};
    EXPECT_THROW(mProvider->encodeText("tiny"), EncodingError);
    EXPECT_FALSE(mProvider->textCache().contains("tiny"));
}

TEST_F(EmbeddingProviderTest, CacheIsBoundedAtCapacity) {
    for (std::size_t i = 0; i < EmbeddingProvider::kTextCacheCapacity + 50; ++i) {
        mProvider->encodeText("query " + std::to_string(i));
    }
    EXPECT_EQ(mProvider->textCache().size(), EmbeddingProvider::kTextCacheCapacity);
    EXPECT_FALSE(mProvider->textCache().contains("query 0"));

    // An evicted entry costs a new model call.
    const int before = mModel->textCalls.load();
    mProvider->encodeText("query 0");
    EXPECT_EQ(mModel->textCalls.load(), before + 1);
}

TEST_F(EmbeddingProviderTest, ConcurrentSearchesShareTheCache) {
    std::vector<std::thread> workers;
    for (int t = 0; t < 8; ++t) {
        workers.emplace_back([this] {
            for (int i = 0; i < 50; ++i) {
                auto v = mProvider->encodeText("query " + std::to_string(i % 10));
                EXPECT_EQ(v.size(), kVectorSize);
            }
        });
    }
    for (auto& w : workers) w.join();

    EXPECT_EQ(mProvider->textCache().size(), 10u);
    EXPECT_GE(mModel->textCalls.load(), 10);
}

// ============================================================================
// Images
// ============================================================================

TEST_F(EmbeddingProviderTest, OneVectorPerImageInInputOrder) {
    mModel->pinned["https://img/a.png"] = axis(0);
    mModel->pinned["https://img/b.png"] = axis(1);
    mModel->pinned["https://img/c.png"] = axis(2);

    auto vectors = mProvider->encodeImages({"https://img/a.png", "https://img/b.png", "https://img/c.png"});

    ASSERT_EQ(vectors.size(), 3u);
    EXPECT_EQ(vectors[0], axis(0));
    EXPECT_EQ(vectors[1], axis(1));
    EXPECT_EQ(vectors[2], axis(2));
    EXPECT_EQ(mFetcher->calls.load(), 3);
    EXPECT_EQ(mModel->imageCalls.load(), 1);  // one model call for the whole set
}

TEST_F(EmbeddingProviderTest, NoImagesNoWork) {
    EXPECT_TRUE(mProvider->encodeImages({}).empty());
    EXPECT_EQ(mModel->imageCalls.load(), 0);
}

TEST_F(EmbeddingProviderTest, UnreachableImageFailsWholeCall) {
    mFetcher->unreachable.insert("https://img/down.png");

    try {
        mProvider->encodeImages({"https://img/a.png", "https://img/down.png"});
        FAIL() << "expected ImageFetchError";
    } catch (const ImageFetchError& e) {
        EXPECT_EQ(e.url(), "https://img/down.png");
    }
    EXPECT_EQ(mModel->imageCalls.load(), 0);
}

TEST_F(EmbeddingProviderTest, UndecodableImageFailsWithImageFetchError) {
    mFetcher->garbage.insert("https://img/page.html");
    EXPECT_THROW(mProvider->encodeImages({"https://img/page.html"}), ImageFetchError);
}

TEST_F(EmbeddingProviderTest, ModelFailureBecomesEncodingError) {
    mModel->failingUrls.insert("https://img/a.png");
    EXPECT_THROW(mProvider->encodeImages({"https://img/a.png"}), EncodingError);
}

// ============================================================================
// detectImageFormat
// ============================================================================

TEST(DetectImageFormat, MagicBytes) {
    EXPECT_EQ(detectImageFormat(std::string("\xFF\xD8\xFF\xE0rest", 8)), ImageFormat::Jpeg);
    EXPECT_EQ(detectImageFormat(std::string("\x89PNG\r\n\x1A\nIHDR", 12)), ImageFormat::Png);
    EXPECT_EQ(detectImageFormat("GIF89a...."), ImageFormat::Gif);
    EXPECT_EQ(detectImageFormat(std::string("RIFF\x10\x00\x00\x00WEBPVP8 ", 16)), ImageFormat::Webp);
}

TEST(DetectImageFormat, NonImagesAreUnknown) {
    EXPECT_EQ(detectImageFormat(""), ImageFormat::Unknown);
    EXPECT_EQ(detectImageFormat("<!DOCTYPE html>"), ImageFormat::Unknown);
    EXPECT_EQ(detectImageFormat("\xFF\xD8"), ImageFormat::Unknown);
}

// ============================================================================
// parseEmbeddingResponse
// ============================================================================

TEST(ParseEmbeddingResponse, OrdersByIndex) {
    json body = {{"data", json::array({
        {{"index", 1}, {"embedding", {0.0, 1.0}}},
        {{"index", 0}, {"embedding", {1.0, 0.0}}}
    })}};

    auto vectors = parseEmbeddingResponse(body);
    ASSERT_EQ(vectors.size(), 2u);
    EXPECT_EQ(vectors[0], (Vector{1.0f, 0.0f}));
    EXPECT_EQ(vectors[1], (Vector{0.0f, 1.0f}));
}

TEST(ParseEmbeddingResponse, WithoutIndexKeepsOrder) {
    json body = {{"data", json::array({
        {{"embedding", {0.5, 0.5}}},
        {{"embedding", {0.25, 0.75}}}
    })}};

    auto vectors = parseEmbeddingResponse(body);
    ASSERT_EQ(vectors.size(), 2u);
    EXPECT_FLOAT_EQ(vectors[1][1], 0.75f);
}

TEST(ParseEmbeddingResponse, MalformedBodyThrows) {
    const json noData = {{"error", "model not loaded"}};
    EXPECT_THROW(parseEmbeddingResponse(noData), std::runtime_error);

    json noEmbedding;
    noEmbedding["data"] = json::array();
    noEmbedding["data"].push_back({{"index", 0}});
    EXPECT_THROW(parseEmbeddingResponse(noEmbedding), std::runtime_error);
}
