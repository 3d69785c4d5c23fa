#include "qdrant_store.hpp"
#include "errors.hpp"
#include "mapping.hpp"
#include "util.hpp"

#include <iostream>
#include <stdexcept>
#include <thread>
#include <type_traits>
#include <variant>

namespace prodsearch {

namespace {

std::string collectionPath(const std::string& name) {
    return "/collections/" + name;
}

nlohmann::json rangeJson(const RangeBounds& bounds) {
    nlohmann::json range = nlohmann::json::object();
    if (bounds.gt)  range["gt"]  = *bounds.gt;
    if (bounds.gte) range["gte"] = *bounds.gte;
    if (bounds.lt)  range["lt"]  = *bounds.lt;
    if (bounds.lte) range["lte"] = *bounds.lte;
    return range;
}

} // namespace

nlohmann::json toQdrantFilter(const Predicate& predicate) {
    nlohmann::json must = nlohmann::json::array();
    for (const auto& condition : predicate.must) {
        std::visit([&must](const auto& c) {
            using T = std::decay_t<decltype(c)>;
            if constexpr (std::is_same_v<T, EqCondition>) {
                must.push_back({{"key", c.field}, {"match", {{"value", c.value}}}});
            } else {
                must.push_back({{"key", c.field}, {"range", rangeJson(c.bounds)}});
            }
        }, condition);
    }
    return {{"must", must}};
}

nlohmann::json toQdrantPoint(const ProductPoint& point) {
    if (!point.vector) {
        throw StoreError("Point " + std::to_string(point.id) + " has no vector");
    }
    return {
        {"id", point.id},
        {"vector", *point.vector},
        {"payload", payloadToJson(point.payload)}
    };
}

// ---------------------------------------------------------------------------
// Construction
// ---------------------------------------------------------------------------

QdrantStore::QdrantStore(const std::string& baseUrl, const Options& options)
    : mClient(baseUrl, options.apiKey, options.timeoutMs)
    , mOptions(options)
{
    if (mOptions.maxAttempts < 1) {
        throw std::invalid_argument("QdrantStore: maxAttempts must be >= 1");
    }
    mClient.setVerbose(options.verbose);
}

QdrantStore::QdrantStore(const std::string& baseUrl)
    : QdrantStore(baseUrl, Options{}) {}

// ---------------------------------------------------------------------------
// VectorStore
// ---------------------------------------------------------------------------

void QdrantStore::ensureCollection(const std::string& name, std::size_t vectorSize) {
    const auto existing = send(HttpMethod::Get, collectionPath(name), nullptr);

    if (existing.httpStatus == 200) {
        // Report a dimension mismatch but leave the collection alone.
        try {
            const auto body = existing.json();
            const auto sizePtr = nlohmann::json::json_pointer(
                "/result/config/params/vectors/size");
            if (body.contains(sizePtr) && body[sizePtr].is_number_unsigned() &&
                body[sizePtr].get<std::size_t>() != vectorSize) {
                std::cerr << "[QdrantStore] Warning: collection '" << name
                          << "' has vector size " << body[sizePtr]
                          << ", expected " << vectorSize
                          << "; leaving it unchanged\n";
            }
        } catch (const std::exception& e) {
            std::cerr << "[QdrantStore] Warning: unreadable collection info for '"
                      << name << "': " << e.what() << "\n";
        }
        std::cerr << "[QdrantStore] Collection '" << name << "' already exists.\n";
        return;
    }
    if (existing.httpStatus != 404) {
        fail("get collection '" + name + "'", existing);
    }

    nlohmann::json body = {
        {"vectors", {{"size", vectorSize}, {"distance", "Cosine"}}}
    };
    const auto created = send(HttpMethod::Put, collectionPath(name), &body);

    // 409: another process created it between our check and our create.
    if (created.httpStatus == 409) {
        std::cerr << "[QdrantStore] Collection '" << name << "' already exists.\n";
        return;
    }
    if (!created.ok()) {
        fail("create collection '" + name + "'", created);
    }
    std::cerr << "[QdrantStore] Collection '" << name << "' created.\n";
}

void QdrantStore::upsert(const std::string& collection,
                         const std::vector<ProductPoint>& points) {
    if (points.empty()) return;

    nlohmann::json encoded = nlohmann::json::array();
    for (const auto& point : points) {
        encoded.push_back(toQdrantPoint(point));
    }
    nlohmann::json body = {{"points", std::move(encoded)}};

    const auto resp = send(HttpMethod::Put,
                           collectionPath(collection) + "/points?wait=true",
                           &body);
    if (!resp.ok()) {
        fail("upsert " + std::to_string(points.size()) + " points", resp);
    }

    if (mOptions.verbose) {
        std::cerr << "[QdrantStore] Upserted " << points.size()
                  << " points into '" << collection << "'\n";
    }
}

std::vector<ProductPoint> QdrantStore::search(const std::string& collection,
                                              const Vector& query,
                                              const std::optional<Predicate>& predicate,
                                              std::size_t limit) {
    nlohmann::json body;
    body["vector"]       = query;
    body["limit"]        = limit;
    body["with_payload"] = true;
    if (predicate) {
        body["filter"] = toQdrantFilter(*predicate);
    }

    const auto resp = send(HttpMethod::Post,
                           collectionPath(collection) + "/points/search",
                           &body);
    if (!resp.ok()) {
        fail("search", resp);
    }

    try {
        return parseSearchResult(resp.json());
    } catch (const std::exception& e) {
        throw StoreError(std::string("Malformed search reply: ") + e.what(),
                         resp.httpStatus);
    }
}

// ---------------------------------------------------------------------------
// Private: transport with retry policy
// ---------------------------------------------------------------------------

HttpClient::Response QdrantStore::send(HttpMethod method,
                                       const std::string& path,
                                       const nlohmann::json* body) {
    const std::string payload = body ? body->dump() : std::string();

    for (int attempt = 0; attempt < mOptions.maxAttempts; ++attempt) {
        const bool last = (attempt == mOptions.maxAttempts - 1);
        try {
            auto resp = mClient.request(method, path, payload);

            if (isRetryableStatus(resp.httpStatus) && !last) {
                ++mTotalRetries;
                auto backoff = computeBackoffMs(attempt);
                std::cerr << "[QdrantStore] HTTP " << resp.httpStatus
                          << ", attempt " << (attempt + 1) << "/"
                          << mOptions.maxAttempts << ", backoff "
                          << backoff.count() << " ms\n";
                std::this_thread::sleep_for(backoff);
                continue;
            }
            return resp;

        } catch (const std::runtime_error& e) {
            if (last) {
                throw StoreUnavailableError(
                    std::string("Vector store unreachable: ") + e.what());
            }

            ++mTotalRetries;
            std::cerr << "[QdrantStore] Network error: " << e.what()
                      << ", attempt " << (attempt + 1) << "/"
                      << mOptions.maxAttempts << "\n";
            std::this_thread::sleep_for(computeBackoffMs(attempt));
        }
    }

    throw StoreUnavailableError("Vector store unreachable (no attempts made)");
}

void QdrantStore::fail(const std::string& operation,
                       const HttpClient::Response& resp) const {
    std::string detail;
    try {
        detail = extractStoreError(resp.json()).value_or(resp.body.substr(0, 200));
    } catch (const std::exception&) {
        detail = resp.body.substr(0, 200);
    }
    if (isRetryableStatus(resp.httpStatus)) {
        throw StoreUnavailableError("Qdrant " + operation + " failed with HTTP " +
                                    std::to_string(resp.httpStatus) + ": " + detail);
    }
    throw StoreError("Qdrant " + operation + " failed with HTTP " +
                     std::to_string(resp.httpStatus) + ": " + detail,
                     resp.httpStatus);
}

bool QdrantStore::isRetryableStatus(unsigned int status) {
    return status == 429 || status >= 500;
}

} // namespace prodsearch
