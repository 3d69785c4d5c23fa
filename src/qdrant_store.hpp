#pragma once

#include "http_client.hpp"
#include "vector_store.hpp"

#include <nlohmann/json.hpp>
#include <atomic>
#include <string>

namespace prodsearch {

/// VectorStore backed by the Qdrant REST API.
///
/// Requests are sent once by default.  With maxAttempts > 1, HTTP 429/5xx
/// replies and network errors are retried with exponential backoff.
class QdrantStore : public VectorStore {
public:
    struct Options {
        std::string apiKey;
        int         timeoutMs   = 5000;
        int         maxAttempts = 1;
        bool        verbose     = false;
    };

    QdrantStore(const std::string& baseUrl, const Options& options);
    explicit QdrantStore(const std::string& baseUrl);

    void ensureCollection(const std::string& name, std::size_t vectorSize) override;
    void upsert(const std::string& collection,
                const std::vector<ProductPoint>& points) override;
    std::vector<ProductPoint> search(const std::string& collection,
                                     const Vector& query,
                                     const std::optional<Predicate>& predicate,
                                     std::size_t limit = kSearchLimit) override;

    int totalRetries() const { return mTotalRetries.load(); }

private:
    HttpClient mClient;
    Options    mOptions;
    std::atomic<int> mTotalRetries{0};

    /// Send with the retry policy; network failures surface as StoreUnavailableError.
    HttpClient::Response send(HttpMethod method,
                              const std::string& path,
                              const nlohmann::json* body);

    [[noreturn]] void fail(const std::string& operation,
                           const HttpClient::Response& resp) const;

    static bool isRetryableStatus(unsigned int status);
};

/// Qdrant filter JSON for a predicate: {"must": [...]}.
nlohmann::json toQdrantFilter(const Predicate& predicate);

/// Qdrant point JSON: {"id", "vector", "payload"}.
nlohmann::json toQdrantPoint(const ProductPoint& point);

} // namespace prodsearch
