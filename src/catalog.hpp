#pragma once

#include <nlohmann/json.hpp>
#include <string>
#include <vector>

namespace prodsearch {

/// Ordered sequence of raw product records.  Records stay unparsed so that a
/// malformed one only fails the batch it lands in.
class CatalogSource {
public:
    virtual ~CatalogSource() = default;

    /// Read the whole catalog.
    /// @throws CatalogError if it cannot be read.
    virtual std::vector<nlohmann::json> load() = 0;
};

/// Catalog stored as a JSON array of product records in one file.
/// The file is re-read on every load() so appended products are picked up.
class JsonFileCatalog : public CatalogSource {
public:
    explicit JsonFileCatalog(std::string path) : mPath(std::move(path)) {}

    std::vector<nlohmann::json> load() override;

    const std::string& path() const { return mPath; }

private:
    std::string mPath;
};

/// Extract the record array from a catalog document.  Accepts a bare array
/// or an object with a "products" array.
/// Throws CatalogError otherwise.
std::vector<nlohmann::json> parseCatalog(const nlohmann::json& document);

} // namespace prodsearch
