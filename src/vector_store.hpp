#pragma once

#include "filter.hpp"
#include "models.hpp"

#include <cstddef>
#include <optional>
#include <string>
#include <vector>

namespace prodsearch {

/// Number of neighbours a search returns.
constexpr std::size_t kSearchLimit = 20;

/// Similarity-search backend holding product points.
class VectorStore {
public:
    virtual ~VectorStore() = default;

    /// Create a cosine-distance collection unless one with this name exists.
    /// An existing collection is never modified.
    virtual void ensureCollection(const std::string& name, std::size_t vectorSize) = 0;

    /// Create or replace points by id.  The batch succeeds or fails as a whole.
    virtual void upsert(const std::string& collection,
                        const std::vector<ProductPoint>& points) = 0;

    /// Nearest neighbours of @p query satisfying @p predicate, closest first.
    virtual std::vector<ProductPoint> search(const std::string& collection,
                                             const Vector& query,
                                             const std::optional<Predicate>& predicate,
                                             std::size_t limit = kSearchLimit) = 0;
};

} // namespace prodsearch
