#pragma once

/// @file fakes.hpp
/// In-process stand-ins for the embedding model and the image fetcher.

#include "embedding.hpp"
#include "errors.hpp"
#include "models.hpp"
#include "util.hpp"

#include <nlohmann/json.hpp>
#include <atomic>
#include <functional>
#include <map>
#include <mutex>
#include <random>
#include <set>
#include <string>
#include <vector>

namespace prodsearch {
namespace testing {

/// Deterministic pseudo-random vector for a key.
inline Vector vectorFor(const std::string& key, std::size_t dims = kVectorSize) {
    std::mt19937 rng(static_cast<std::mt19937::result_type>(std::hash<std::string>{}(key)));
    std::uniform_real_distribution<float> dist(-1.0f, 1.0f);
    Vector v(dims);
    for (auto& x : v) x = dist(rng);
    return v;
}

/// Vector with a single 1 at @p hot.
inline Vector axis(std::size_t hot, std::size_t dims = kVectorSize) {
    Vector v(dims, 0.0f);
    v[hot % dims] = 1.0f;
    return v;
}

/// Model that hashes its input into a vector, or returns a pinned one.
class FakeModel : public EmbeddingModel {
public:
    std::map<std::string, Vector> pinned;      // text or image URL -> vector
    std::set<std::string>         failingUrls; // embedImages throws if it sees one
    std::size_t                   dims = kVectorSize;

    std::atomic<int> textCalls{0};
    std::atomic<int> imageCalls{0};
    std::atomic<int> imagesSeen{0};

    Vector embedText(const std::string& text) override {
        ++textCalls;
        auto it = pinned.find(text);
        return it != pinned.end() ? it->second : vectorFor("text:" + text, dims);
    }

    std::vector<Vector> embedImages(const std::vector<ImageData>& images) override {
        ++imageCalls;
        imagesSeen += static_cast<int>(images.size());
        std::vector<Vector> out;
        for (const auto& image : images) {
            if (failingUrls.count(image.url)) {
                throw std::runtime_error("model rejected " + image.url);
            }
            auto it = pinned.find(image.url);
            out.push_back(it != pinned.end() ? it->second : vectorFor("image:" + image.url, dims));
        }
        return out;
    }

    std::string name() const override { return "fake-clip"; }
};

/// Serves a tiny PNG for every URL, except the ones marked unreachable or garbage.
class FakeFetcher : public ImageFetcher {
public:
    std::set<std::string> unreachable;
    std::set<std::string> garbage;

    std::atomic<int> calls{0};

    FetchedImage fetch(const std::string& url) override {
        ++calls;
        {
            std::lock_guard<std::mutex> lock(mMutex);
            mFetched.push_back(url);
        }
        if (unreachable.count(url)) {
            throw ImageFetchError(url, "connection refused");
        }
        FetchedImage image;
        image.url         = url;
        image.contentType = garbage.count(url) ? "text/html" : "image/png";
        image.bytes       = garbage.count(url) ? std::string("<html>nope</html>")
                                               : std::string("\x89PNG\r\n\x1A\n", 8) + url;
        return image;
    }

    std::vector<std::string> fetched() const {
        std::lock_guard<std::mutex> lock(mMutex);
        return mFetched;
    }

private:
    mutable std::mutex       mMutex;
    std::vector<std::string> mFetched;
};

/// Catalog record in the shape the product dumps use.
inline nlohmann::json makeRecord(int64_t id,
                                 std::vector<std::string> images,
                                 double price = 100.0,
                                 const std::string& brand = "Acme") {
    return {
        {"id", id},
        {"name", "Product " + std::to_string(id)},
        {"description", "Description of product " + std::to_string(id)},
        {"material", nullptr},
        {"rating", 4.5},
        {"images", images},
        {"code", "P" + std::to_string(id)},
        {"brand_id", 1},
        {"brand_name", brand},
        {"category_id", nullptr},
        {"category_name", nullptr},
        {"gender_id", 2},
        {"gender_name", "women"},
        {"shop_id", 7},
        {"shop_name", "Main Shop"},
        {"link", "https://shop.example/p/" + std::to_string(id)},
        {"status", "IN_STOCK"},
        {"colors", {"red", "black"}},
        {"sizes", {"S", "M"}},
        {"region", "EU"},
        {"currency", "EUR"},
        {"current_price", price},
        {"old_price", price * 1.25},
        {"off_percent", 20},
        {"update_date", "2024-05-01T10:00:00"}
    };
}

/// Records with ids first..first+count-1, one image each.
inline std::vector<nlohmann::json> makeCatalog(int64_t first, std::size_t count) {
    std::vector<nlohmann::json> records;
    for (std::size_t i = 0; i < count; ++i) {
        const int64_t id = first + static_cast<int64_t>(i);
        records.push_back(makeRecord(id, {"https://img.example/" + std::to_string(id) + ".png"}));
    }
    return records;
}

} // namespace testing
} // namespace prodsearch
