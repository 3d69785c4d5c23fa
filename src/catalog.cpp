#include "catalog.hpp"
#include "errors.hpp"

#include <fstream>

namespace prodsearch {

std::vector<nlohmann::json> parseCatalog(const nlohmann::json& document) {
    const nlohmann::json* records = &document;
    if (document.is_object() && document.contains("products")) {
        records = &document["products"];
    }
    if (!records->is_array()) {
        throw CatalogError("Catalog must be a JSON array of product records");
    }
    return records->get<std::vector<nlohmann::json>>();
}

std::vector<nlohmann::json> JsonFileCatalog::load() {
    std::ifstream in(mPath);
    if (!in) {
        throw CatalogError("Cannot open catalog file '" + mPath + "'");
    }

    nlohmann::json document;
    try {
        document = nlohmann::json::parse(in);
    } catch (const nlohmann::json::parse_error& e) {
        throw CatalogError("Failed to parse catalog '" + mPath + "': " + e.what());
    }
    return parseCatalog(document);
}

} // namespace prodsearch
