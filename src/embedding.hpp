#pragma once

#include "lru_cache.hpp"
#include "models.hpp"

#include <cstddef>
#include <memory>
#include <string>
#include <vector>

namespace prodsearch {

enum class ImageFormat { Unknown, Jpeg, Png, Gif, Webp, Bmp };

const char* toString(ImageFormat format);

/// Identify the image container from its leading magic bytes.
ImageFormat detectImageFormat(const std::string& bytes);

/// Raw bytes of one downloaded image.
struct FetchedImage {
    std::string url;
    std::string contentType;
    std::string bytes;
};

/// An image whose container format has been recognised.
struct ImageData {
    std::string url;
    ImageFormat format = ImageFormat::Unknown;
    std::string bytes;
};

/// Retrieves image bytes by locator.  Must tolerate concurrent calls.
class ImageFetcher {
public:
    virtual ~ImageFetcher() = default;

    /// @throws ImageFetchError if the image cannot be retrieved.
    virtual FetchedImage fetch(const std::string& url) = 0;
};

/// The embedding model itself: text and images in, raw vectors out.
class EmbeddingModel {
public:
    virtual ~EmbeddingModel() = default;

    virtual Vector embedText(const std::string& text) = 0;

    /// One vector per image, in input order.
    virtual std::vector<Vector> embedImages(const std::vector<ImageData>& images) = 0;

    virtual std::string name() const = 0;
};

/// Turns text and images into fixed-length vectors.
///
/// Text vectors are normalised to unit length and memoised in a bounded LRU
/// cache, so a repeated query costs a single model call.  Images of one call
/// are fetched concurrently and embedded together.
class EmbeddingProvider {
public:
    static constexpr std::size_t kTextCacheCapacity = 1000;

    EmbeddingProvider(std::unique_ptr<EmbeddingModel> model,
                      std::unique_ptr<ImageFetcher> fetcher,
                      std::size_t dimensions = kVectorSize,
                      std::size_t textCacheCapacity = kTextCacheCapacity);

    /// @throws EncodingError if the text is blank or the model fails.
    Vector encodeText(const std::string& text);

    /// One vector per URL, in input order.  Any failure fails the whole call.
    /// @throws ImageFetchError if an image is unreachable or undecodable.
    /// @throws EncodingError   if the model fails.
    std::vector<Vector> encodeImages(const std::vector<std::string>& urls);

    std::size_t dimensions() const { return mDimensions; }
    const LruCache<std::string, Vector>& textCache() const { return mTextCache; }

    void setVerbose(bool v) { mVerbose = v; }

private:
    std::unique_ptr<EmbeddingModel> mModel;
    std::unique_ptr<ImageFetcher>   mFetcher;
    std::size_t                     mDimensions;
    LruCache<std::string, Vector>   mTextCache;
    bool                            mVerbose = false;

    std::vector<ImageData> fetchAll(const std::vector<std::string>& urls);
    void checkDimensions(const Vector& v, const std::string& what) const;
};

} // namespace prodsearch
