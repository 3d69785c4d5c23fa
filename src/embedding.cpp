#include "embedding.hpp"
#include "errors.hpp"
#include "util.hpp"

#include <algorithm>
#include <cctype>
#include <exception>
#include <future>
#include <iostream>

namespace prodsearch {

const char* toString(ImageFormat format) {
    switch (format) {
        case ImageFormat::Jpeg:    return "jpeg";
        case ImageFormat::Png:     return "png";
        case ImageFormat::Gif:     return "gif";
        case ImageFormat::Webp:    return "webp";
        case ImageFormat::Bmp:     return "bmp";
        case ImageFormat::Unknown: break;
    }
    return "unknown";
}

ImageFormat detectImageFormat(const std::string& bytes) {
    auto startsWith = [&bytes](const char* magic, std::size_t len, std::size_t offset = 0) {
        return bytes.size() >= offset + len && bytes.compare(offset, len, magic, len) == 0;
    };

    if (startsWith("\xFF\xD8\xFF", 3))               return ImageFormat::Jpeg;
    if (startsWith("\x89PNG\r\n\x1A\n", 8))          return ImageFormat::Png;
    if (startsWith("GIF87a", 6) || startsWith("GIF89a", 6)) return ImageFormat::Gif;
    if (startsWith("RIFF", 4) && startsWith("WEBP", 4, 8))  return ImageFormat::Webp;
    if (startsWith("BM", 2) && bytes.size() > 26)   return ImageFormat::Bmp;
    return ImageFormat::Unknown;
}

// ---------------------------------------------------------------------------
// EmbeddingProvider
// ---------------------------------------------------------------------------

EmbeddingProvider::EmbeddingProvider(std::unique_ptr<EmbeddingModel> model,
                                     std::unique_ptr<ImageFetcher> fetcher,
                                     std::size_t dimensions,
                                     std::size_t textCacheCapacity)
    : mModel(std::move(model))
    , mFetcher(std::move(fetcher))
    , mDimensions(dimensions)
    , mTextCache(textCacheCapacity) {}

Vector EmbeddingProvider::encodeText(const std::string& text) {
    const bool blank = std::all_of(text.begin(), text.end(), [](unsigned char c) {
        return std::isspace(c) != 0;
    });
    if (blank) {
        throw EncodingError("Cannot encode empty text");
    }

    if (auto cached = mTextCache.get(text)) {
        return *cached;
    }

    Vector v;
    try {
        v = mModel->embedText(text);
    } catch (const EncodingError&) {
        throw;
    } catch (const std::exception& e) {
        throw EncodingError("Text encoding failed: " + std::string(e.what()));
    }

    checkDimensions(v, "text");
    l2Normalize(v);
    mTextCache.put(text, v);

    if (mVerbose) {
        std::cerr << "[EmbeddingProvider] Encoded text (" << text.size()
                  << " chars), cache size " << mTextCache.size() << "\n";
    }
    return v;
}

std::vector<Vector> EmbeddingProvider::encodeImages(const std::vector<std::string>& urls) {
    if (urls.empty()) {
        return {};
    }

    const auto images = fetchAll(urls);

    std::vector<Vector> vectors;
    try {
        vectors = mModel->embedImages(images);
    } catch (const EncodingError&) {
        throw;
    } catch (const std::exception& e) {
        throw EncodingError("Image encoding failed: " + std::string(e.what()));
    }

    if (vectors.size() != images.size()) {
        throw EncodingError("Model returned " + std::to_string(vectors.size()) +
                            " vectors for " + std::to_string(images.size()) +
                            " images");
    }
    for (std::size_t i = 0; i < vectors.size(); ++i) {
        checkDimensions(vectors[i], "image " + images[i].url);
    }

    if (mVerbose) {
        std::cerr << "[EmbeddingProvider] Encoded " << vectors.size()
                  << " images\n";
    }
    return vectors;
}

std::vector<ImageData> EmbeddingProvider::fetchAll(const std::vector<std::string>& urls) {
    // Issue every download at once, then wait for all of them.
    std::vector<std::future<FetchedImage>> pending;
    pending.reserve(urls.size());
    for (const auto& url : urls) {
        pending.push_back(std::async(std::launch::async, [this, url] {
            return mFetcher->fetch(url);
        }));
    }

    std::vector<ImageData> images;
    images.reserve(urls.size());
    std::exception_ptr firstError;

    for (std::size_t i = 0; i < pending.size(); ++i) {
        try {
            FetchedImage fetched = pending[i].get();

            ImageData image;
            image.url    = urls[i];
            image.format = detectImageFormat(fetched.bytes);
            if (image.format == ImageFormat::Unknown) {
                throw ImageFetchError(urls[i], "not a decodable image (content-type '" +
                                               fetched.contentType + "', " +
                                               std::to_string(fetched.bytes.size()) +
                                               " bytes)");
            }
            image.bytes = std::move(fetched.bytes);
            images.push_back(std::move(image));
        } catch (const ImageFetchError&) {
            if (!firstError) firstError = std::current_exception();
        } catch (const std::exception& e) {
            if (!firstError) {
                firstError = std::make_exception_ptr(ImageFetchError(urls[i], e.what()));
            }
        }
    }

    if (firstError) {
        std::rethrow_exception(firstError);
    }
    return images;
}

void EmbeddingProvider::checkDimensions(const Vector& v, const std::string& what) const {
    if (v.size() != mDimensions) {
        throw EncodingError("Embedding for " + what + " has " +
                            std::to_string(v.size()) + " dimensions, expected " +
                            std::to_string(mDimensions));
    }
}

} // namespace prodsearch
