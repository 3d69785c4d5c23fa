#pragma once

#include "embedding.hpp"
#include "http_client.hpp"

#include <nlohmann/json.hpp>
#include <string>
#include <vector>

namespace prodsearch {

/// EmbeddingModel backed by a CLIP inference service.
///
///   POST {base}/v1/embeddings/text   {"model": m, "input": [text]}
///   POST {base}/v1/embeddings/image  {"model": m, "images": [{"format", "data"}]}
///
/// Both reply {"data": [{"index": i, "embedding": [...]}, ...]}.
class ClipServiceModel : public EmbeddingModel {
public:
    ClipServiceModel(const std::string& baseUrl,
                     const std::string& modelName,
                     int timeoutMs = 30000);

    Vector embedText(const std::string& text) override;
    std::vector<Vector> embedImages(const std::vector<ImageData>& images) override;
    std::string name() const override { return mModelName; }

    void setVerbose(bool v) { mClient.setVerbose(v); }

private:
    HttpClient  mClient;
    std::string mModelName;

    std::vector<Vector> call(const std::string& path, const nlohmann::json& body);
};

/// Pull the embeddings out of a service reply, ordered by "index" when present.
/// Throws std::runtime_error if "data" is missing or malformed.
std::vector<Vector> parseEmbeddingResponse(const nlohmann::json& responseBody);

/// Downloads images over HTTP(S), one short-lived connection per image.
class HttpImageFetcher : public ImageFetcher {
public:
    explicit HttpImageFetcher(int timeoutMs = 10000) : mTimeoutMs(timeoutMs) {}

    FetchedImage fetch(const std::string& url) override;

private:
    int mTimeoutMs;
};

} // namespace prodsearch
