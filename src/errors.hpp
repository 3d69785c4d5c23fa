#pragma once

#include <stdexcept>
#include <string>

namespace prodsearch {

/// Base class of every error raised by the search and ingestion engine.
class Error : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

/// A filter clause names an operation outside {eq, gt, gte, lt, lte}.
class UnsupportedOperationError : public Error {
public:
    explicit UnsupportedOperationError(const std::string& operation)
        : Error("Unsupported filter operation: '" + operation + "'")
        , mOperation(operation) {}

    const std::string& operation() const { return mOperation; }

private:
    std::string mOperation;
};

/// A filter clause carries a value the operation cannot use.
class InvalidFilterError : public Error {
public:
    using Error::Error;
};

/// Text or image content could not be turned into a vector.
class EncodingError : public Error {
public:
    using Error::Error;
};

/// An image source was unreachable or did not hold a decodable image.
class ImageFetchError : public Error {
public:
    ImageFetchError(const std::string& url, const std::string& reason)
        : Error("Failed to fetch image '" + url + "': " + reason)
        , mUrl(url) {}

    const std::string& url() const { return mUrl; }

private:
    std::string mUrl;
};

/// The vector store backend could not be reached.
class StoreUnavailableError : public Error {
public:
    using Error::Error;
};

/// The vector store backend answered but rejected the request.
class StoreError : public Error {
public:
    StoreError(const std::string& what, unsigned int httpStatus = 0)
        : Error(what), mHttpStatus(httpStatus) {}

    unsigned int httpStatus() const { return mHttpStatus; }

private:
    unsigned int mHttpStatus;
};

/// The product catalog could not be read or parsed.
class CatalogError : public Error {
public:
    using Error::Error;
};

/// The ingestion checkpoint could not be read or written.
class CheckpointError : public Error {
public:
    using Error::Error;
};

} // namespace prodsearch
