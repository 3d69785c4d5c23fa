#pragma once

#include "models.hpp"

#include <chrono>
#include <cstdint>
#include <string>

namespace prodsearch {

/// Decomposed URL components.
struct UrlParts {
    std::string scheme;   // "http" or "https"
    std::string host;
    std::string port;     // "80", "443", "6333", etc.
    std::string target;   // path plus query (e.g. "/collections/products")
};

/// Parse an HTTP(S) URL into its components.
/// Throws std::invalid_argument on malformed input.
UrlParts parseUrl(const std::string& url);

/// Compute exponential-backoff delay with random jitter.
/// attempt is 0-based.  Clamped to [baseMs .. maxMs] before jitter.
std::chrono::milliseconds computeBackoffMs(int attempt,
                                           int64_t baseMs = 200,
                                           int64_t maxMs  = 5000);

/// Standard (padded) base64 encoding of raw bytes.
std::string base64Encode(const std::string& bytes);

/// Scale @p v to unit length in place.  A zero vector is left untouched.
void l2Normalize(Vector& v);

/// Cosine similarity in [-1, 1].  Returns 0 for empty, mismatched or
/// zero-magnitude inputs.
double cosineSimilarity(const Vector& a, const Vector& b);

} // namespace prodsearch
