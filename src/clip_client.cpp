#include "clip_client.hpp"
#include "errors.hpp"
#include "util.hpp"

#include <algorithm>
#include <stdexcept>

namespace prodsearch {

ClipServiceModel::ClipServiceModel(const std::string& baseUrl,
                                   const std::string& modelName,
                                   int timeoutMs)
    : mClient(baseUrl, "", timeoutMs)
    , mModelName(modelName) {}

Vector ClipServiceModel::embedText(const std::string& text) {
    nlohmann::json body;
    body["model"] = mModelName;
    body["input"] = nlohmann::json::array({text});

    auto vectors = call("/v1/embeddings/text", body);
    if (vectors.size() != 1) {
        throw EncodingError("Expected one text embedding, got " +
                            std::to_string(vectors.size()));
    }
    return std::move(vectors.front());
}

std::vector<Vector> ClipServiceModel::embedImages(const std::vector<ImageData>& images) {
    nlohmann::json encoded = nlohmann::json::array();
    for (const auto& image : images) {
        encoded.push_back({
            {"format", toString(image.format)},
            {"data", base64Encode(image.bytes)}
        });
    }

    nlohmann::json body;
    body["model"]  = mModelName;
    body["images"] = std::move(encoded);
    return call("/v1/embeddings/image", body);
}

std::vector<Vector> ClipServiceModel::call(const std::string& path, const nlohmann::json& body) {
    const auto resp = mClient.post(path, body);
    if (!resp.ok()) {
        throw EncodingError("Embedding service " + path + " returned HTTP " +
                            std::to_string(resp.httpStatus) + ": " +
                            resp.body.substr(0, 200));
    }
    return parseEmbeddingResponse(resp.json());
}

std::vector<Vector> parseEmbeddingResponse(const nlohmann::json& responseBody) {
    if (!responseBody.contains("data") || !responseBody["data"].is_array()) {
        throw std::runtime_error("Embedding response missing 'data' array");
    }

    std::vector<std::pair<int64_t, Vector>> indexed;
    int64_t position = 0;
    for (const auto& item : responseBody["data"]) {
        if (!item.contains("embedding") || !item["embedding"].is_array()) {
            throw std::runtime_error("Embedding response item has no 'embedding'");
        }
        const int64_t index = item.value("index", position);
        indexed.emplace_back(index, item["embedding"].get<Vector>());
        ++position;
    }

    std::stable_sort(indexed.begin(), indexed.end(),
                     [](const auto& a, const auto& b) { return a.first < b.first; });

    std::vector<Vector> vectors;
    vectors.reserve(indexed.size());
    for (auto& entry : indexed) {
        vectors.push_back(std::move(entry.second));
    }
    return vectors;
}

// ---------------------------------------------------------------------------
// HttpImageFetcher
// ---------------------------------------------------------------------------

FetchedImage HttpImageFetcher::fetch(const std::string& url) {
    HttpClient::Response resp;
    try {
        HttpClient client(url, "", mTimeoutMs);
        resp = client.get("");
    } catch (const std::exception& e) {
        throw ImageFetchError(url, e.what());
    }

    if (!resp.ok()) {
        throw ImageFetchError(url, "HTTP " + std::to_string(resp.httpStatus));
    }
    if (resp.body.empty()) {
        throw ImageFetchError(url, "empty body");
    }

    FetchedImage image;
    image.url         = url;
    image.contentType = resp.contentType;
    image.bytes       = std::move(resp.body);
    return image;
}

} // namespace prodsearch
