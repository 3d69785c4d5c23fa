#pragma once

#include "vector_store.hpp"

#include <nlohmann/json.hpp>
#include <map>
#include <mutex>
#include <string>

namespace prodsearch {

/// In-process VectorStore with brute-force cosine search.
/// Payloads are kept in their JSON form so predicates are evaluated exactly
/// the way they would be sent to a remote backend.
class InMemoryVectorStore : public VectorStore {
public:
    void ensureCollection(const std::string& name, std::size_t vectorSize) override;
    void upsert(const std::string& collection,
                const std::vector<ProductPoint>& points) override;
    std::vector<ProductPoint> search(const std::string& collection,
                                     const Vector& query,
                                     const std::optional<Predicate>& predicate,
                                     std::size_t limit = kSearchLimit) override;

    std::size_t collectionCount() const;
    std::size_t pointCount(const std::string& collection) const;

private:
    struct StoredPoint {
        ProductPoint   point;
        nlohmann::json payload;
    };

    struct Collection {
        std::size_t vectorSize = 0;
        std::map<int64_t, StoredPoint> points;
    };

    mutable std::mutex mMutex;
    std::map<std::string, Collection> mCollections;

    Collection& find(const std::string& name);
};

/// Whether a payload satisfies every condition of @p predicate.
/// Equality against an array field matches when any element is equal.
bool matchesPredicate(const Predicate& predicate, const nlohmann::json& payload);

} // namespace prodsearch
