#include "http_client.hpp"
#include "util.hpp"

#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <boost/beast/version.hpp>
#include <boost/asio/connect.hpp>
#include <boost/asio/ip/tcp.hpp>

#ifdef PRODSEARCH_HAS_SSL
#include <boost/beast/ssl.hpp>
#include <boost/asio/ssl.hpp>
#endif

#include <cstdint>
#include <iostream>
#include <stdexcept>

namespace beast = boost::beast;
namespace http  = beast::http;
namespace net   = boost::asio;
using tcp       = net::ip::tcp;

namespace prodsearch {

namespace {

// Image downloads can be large; search replies are small.
constexpr std::uint64_t kBodyLimit = 64ull * 1024 * 1024;

http::verb toVerb(HttpMethod method) {
    switch (method) {
        case HttpMethod::Get:  return http::verb::get;
        case HttpMethod::Put:  return http::verb::put;
        case HttpMethod::Post: return http::verb::post;
        case HttpMethod::Delete: return http::verb::delete_;
    }
    return http::verb::get;
}

http::request<http::string_body>
buildRequest(HttpMethod method,
             const std::string& host,
             const std::string& target,
             const std::string& apiKey,
             const std::string& body,
             const std::string& contentType)
{
    http::request<http::string_body> req{toVerb(method), target, 11};
    req.set(http::field::host, host);
    req.set(http::field::accept, "*/*");
    req.set(http::field::user_agent, "prodsearch/1.0");
    if (!apiKey.empty()) {
        req.set("api-key", apiKey);
    }
    if (!body.empty()) {
        req.set(http::field::content_type, contentType);
        req.body() = body;
    }
    req.prepare_payload();
    return req;
}

HttpClient::Response
toResponse(http::response<http::string_body>& res)
{
    HttpClient::Response response;
    response.httpStatus  = res.result_int();
    const auto contentType = res[http::field::content_type];
    response.contentType.assign(contentType.data(), contentType.size());
    response.body        = std::move(res.body());
    return response;
}

} // namespace

// ---------------------------------------------------------------------------
// Construction
// ---------------------------------------------------------------------------

HttpClient::HttpClient(const std::string& baseUrl,
                       const std::string& apiKey,
                       int timeoutMs)
    : mApiKey(apiKey)
    , mTimeoutMs(timeoutMs)
{
    auto parts = parseUrl(baseUrl);
    mHost     = parts.host;
    mPort     = parts.port;
    mBasePath = parts.target;
    mUseSsl   = (parts.scheme == "https");

    if (mUseSsl) {
#ifndef PRODSEARCH_HAS_SSL
        throw std::runtime_error(
            "HTTPS endpoint requested but SSL support was not compiled in. "
            "Rebuild with OpenSSL to enable HTTPS.");
#endif
    }
}

nlohmann::json HttpClient::Response::json() const
{
    try {
        return nlohmann::json::parse(body);
    } catch (const nlohmann::json::parse_error& e) {
        throw std::runtime_error(
            std::string("Failed to parse JSON response: ") + e.what());
    }
}

// ---------------------------------------------------------------------------
// Public API
// ---------------------------------------------------------------------------

HttpClient::Response
HttpClient::request(HttpMethod method,
                    const std::string& path,
                    const std::string& body,
                    const std::string& contentType)
{
    const std::string target = joinTarget(path);

    if (mVerbose) {
        std::cerr << "[HttpClient] " << http::to_string(toVerb(method)) << " "
                  << mHost << ":" << mPort << target;
        if (!body.empty()) {
            std::cerr << " (" << body.size() << " bytes)";
        }
        std::cerr << "\n";
    }

    auto response = mUseSsl ? doHttpsRequest(method, target, body, contentType)
                            : doHttpRequest(method, target, body, contentType);

    if (mVerbose) {
        std::cerr << "[HttpClient] HTTP " << response.httpStatus << "\n";
    }
    return response;
}

std::string HttpClient::joinTarget(const std::string& path) const
{
    if (path.empty()) return mBasePath;
    if (mBasePath == "/") return path.front() == '/' ? path : "/" + path;

    std::string base = mBasePath;
    if (base.back() == '/') base.pop_back();
    return path.front() == '/' ? base + path : base + "/" + path;
}

// ---------------------------------------------------------------------------
// Plain HTTP
// ---------------------------------------------------------------------------

HttpClient::Response
HttpClient::doHttpRequest(HttpMethod method,
                          const std::string& target,
                          const std::string& body,
                          const std::string& contentType)
{
    net::io_context ioc;
    tcp::resolver   resolver(ioc);
    beast::tcp_stream stream(ioc);

    try {
        // Resolve + connect with timeout.
        auto const results = resolver.resolve(mHost, mPort);
        stream.expires_after(std::chrono::milliseconds(mTimeoutMs));
        stream.connect(results);

        auto req = buildRequest(method, mHost, target, mApiKey, body, contentType);
        http::write(stream, req);

        beast::flat_buffer buffer;
        http::response_parser<http::string_body> parser;
        parser.body_limit(kBodyLimit);
        stream.expires_after(std::chrono::milliseconds(mTimeoutMs));
        http::read(stream, buffer, parser);

        auto res = parser.release();

        // Graceful shutdown (non-critical errors are ignored).
        beast::error_code ec;
        stream.socket().shutdown(tcp::socket::shutdown_both, ec);

        return toResponse(res);
    } catch (const boost::system::system_error& e) {
        throw std::runtime_error("HTTP request to " + mHost + ":" + mPort +
                                 target + " failed: " + e.what());
    }
}

// ---------------------------------------------------------------------------
// HTTPS (compiled only when OpenSSL is available)
// ---------------------------------------------------------------------------

HttpClient::Response
HttpClient::doHttpsRequest(HttpMethod method,
                           const std::string& target,
                           const std::string& body,
                           const std::string& contentType)
{
#ifdef PRODSEARCH_HAS_SSL
    namespace ssl = net::ssl;

    net::io_context ioc;
    ssl::context    ctx(ssl::context::tlsv12_client);
    ctx.set_default_verify_paths();
    ctx.set_verify_mode(ssl::verify_peer);

    tcp::resolver resolver(ioc);
    beast::ssl_stream<beast::tcp_stream> stream(ioc, ctx);

    // SNI hostname.
    if (!SSL_set_tlsext_host_name(stream.native_handle(), mHost.c_str())) {
        throw std::runtime_error("Failed to set SNI hostname");
    }

    try {
        auto const results = resolver.resolve(mHost, mPort);
        beast::get_lowest_layer(stream).expires_after(
            std::chrono::milliseconds(mTimeoutMs));
        beast::get_lowest_layer(stream).connect(results);

        stream.handshake(ssl::stream_base::client);

        auto req = buildRequest(method, mHost, target, mApiKey, body, contentType);
        http::write(stream, req);

        beast::flat_buffer buffer;
        http::response_parser<http::string_body> parser;
        parser.body_limit(kBodyLimit);
        beast::get_lowest_layer(stream).expires_after(
            std::chrono::milliseconds(mTimeoutMs));
        http::read(stream, buffer, parser);

        auto res = parser.release();

        beast::error_code ec;
        stream.shutdown(ec);

        return toResponse(res);
    } catch (const boost::system::system_error& e) {
        throw std::runtime_error("HTTPS request to " + mHost + ":" + mPort +
                                 target + " failed: " + e.what());
    }
#else
    (void)method;
    (void)target;
    (void)body;
    (void)contentType;
    throw std::runtime_error("HTTPS not supported: built without OpenSSL");
#endif
}

} // namespace prodsearch
