#pragma once

#include <nlohmann/json.hpp>

#include <string>

namespace prodsearch {

enum class HttpMethod { Get, Put, Post, Delete };

/// Synchronous HTTP(S) client built on Boost.Beast.
/// One connection per request; every request targets the host of the base URL.
class HttpClient {
public:
    struct Response {
        unsigned int httpStatus = 0;
        std::string  contentType;
        std::string  body;

        bool ok() const { return httpStatus >= 200 && httpStatus < 300; }

        /// Parse the body as JSON.
        /// @throws std::runtime_error if the body is not valid JSON.
        nlohmann::json json() const;
    };

    /// @param baseUrl    e.g. "http://localhost:6333"; request paths are appended to its path
    /// @param apiKey     Optional key, sent as the "api-key" header
    /// @param timeoutMs  Per-operation timeout in milliseconds
    explicit HttpClient(const std::string& baseUrl,
                        const std::string& apiKey = "",
                        int timeoutMs = 5000);

    /// Send one request.  An empty @p body sends no payload.
    /// @throws std::runtime_error on network / timeout errors.
    Response request(HttpMethod method,
                     const std::string& path,
                     const std::string& body = "",
                     const std::string& contentType = "application/json");

    Response get(const std::string& path) { return request(HttpMethod::Get, path); }
    Response put(const std::string& path, const nlohmann::json& body) {
        return request(HttpMethod::Put, path, body.dump());
    }
    Response post(const std::string& path, const nlohmann::json& body) {
        return request(HttpMethod::Post, path, body.dump());
    }
    Response del(const std::string& path) { return request(HttpMethod::Delete, path); }

    void setVerbose(bool v) { mVerbose = v; }
    const std::string& host() const { return mHost; }

private:
    std::string mHost;
    std::string mPort;
    std::string mBasePath;
    std::string mApiKey;
    int         mTimeoutMs;
    bool        mVerbose = false;
    bool        mUseSsl  = false;

    std::string joinTarget(const std::string& path) const;

    Response doHttpRequest(HttpMethod method, const std::string& target,
                           const std::string& body, const std::string& contentType);
    Response doHttpsRequest(HttpMethod method, const std::string& target,
                            const std::string& body, const std::string& contentType);
};

} // namespace prodsearch
