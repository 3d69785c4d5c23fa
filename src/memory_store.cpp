#include "memory_store.hpp"
#include "errors.hpp"
#include "mapping.hpp"
#include "util.hpp"

#include <algorithm>
#include <iostream>
#include <type_traits>
#include <variant>

namespace prodsearch {

namespace {

bool valueEquals(const nlohmann::json& field, const nlohmann::json& expected) {
    if (field.is_array()) {
        return std::any_of(field.begin(), field.end(), [&](const nlohmann::json& item) {
            return item == expected;
        });
    }
    return field == expected;
}

bool conditionHolds(const Condition& condition, const nlohmann::json& payload) {
    return std::visit([&payload](const auto& c) -> bool {
        auto it = payload.find(c.field);
        if (it == payload.end() || it->is_null()) {
            return false;
        }
        using T = std::decay_t<decltype(c)>;
        if constexpr (std::is_same_v<T, EqCondition>) {
            return valueEquals(*it, c.value);
        } else {
            return it->is_number() && c.bounds.contains(it->template get<double>());
        }
    }, condition);
}

} // namespace

bool matchesPredicate(const Predicate& predicate, const nlohmann::json& payload) {
    return std::all_of(predicate.must.begin(), predicate.must.end(),
                       [&payload](const Condition& c) { return conditionHolds(c, payload); });
}

void InMemoryVectorStore::ensureCollection(const std::string& name, std::size_t vectorSize) {
    std::lock_guard<std::mutex> lock(mMutex);
    auto it = mCollections.find(name);
    if (it != mCollections.end()) {
        if (it->second.vectorSize != vectorSize) {
            std::cerr << "[InMemoryVectorStore] Warning: collection '" << name
                      << "' has vector size " << it->second.vectorSize
                      << ", expected " << vectorSize << "; leaving it unchanged\n";
        }
        return;
    }
    mCollections[name].vectorSize = vectorSize;
}

void InMemoryVectorStore::upsert(const std::string& collection,
                                 const std::vector<ProductPoint>& points) {
    std::lock_guard<std::mutex> lock(mMutex);
    auto& target = find(collection);

    // Validate everything first so a bad point leaves the collection untouched.
    for (const auto& point : points) {
        if (!point.vector) {
            throw StoreError("Point " + std::to_string(point.id) + " has no vector");
        }
        if (point.vector->size() != target.vectorSize) {
            throw StoreError("Point " + std::to_string(point.id) + " has " +
                             std::to_string(point.vector->size()) +
                             " dimensions, collection '" + collection + "' expects " +
                             std::to_string(target.vectorSize));
        }
    }

    for (const auto& point : points) {
        StoredPoint stored{point, payloadToJson(point.payload)};
        stored.point.score.reset();
        target.points[point.id] = std::move(stored);
    }
}

std::vector<ProductPoint> InMemoryVectorStore::search(const std::string& collection,
                                                      const Vector& query,
                                                      const std::optional<Predicate>& predicate,
                                                      std::size_t limit) {
    std::lock_guard<std::mutex> lock(mMutex);
    auto& source = find(collection);
    if (query.size() != source.vectorSize) {
        throw StoreError("Query vector has " + std::to_string(query.size()) +
                         " dimensions, collection '" + collection + "' expects " +
                         std::to_string(source.vectorSize));
    }

    std::vector<std::pair<double, const StoredPoint*>> scored;
    for (const auto& entry : source.points) {
        const auto& stored = entry.second;
        if (predicate && !matchesPredicate(*predicate, stored.payload)) {
            continue;
        }
        scored.emplace_back(cosineSimilarity(query, *stored.point.vector), &stored);
    }

    // Closest first; ties broken by id so results are deterministic.
    std::sort(scored.begin(), scored.end(), [](const auto& a, const auto& b) {
        if (a.first != b.first) return a.first > b.first;
        return a.second->point.id < b.second->point.id;
    });

    std::vector<ProductPoint> results;
    const std::size_t count = std::min(limit, scored.size());
    for (std::size_t i = 0; i < count; ++i) {
        ProductPoint hit = scored[i].second->point;
        hit.vector.reset();  // like with_vector=false
        hit.score = scored[i].first;
        results.push_back(std::move(hit));
    }
    return results;
}

std::size_t InMemoryVectorStore::collectionCount() const {
    std::lock_guard<std::mutex> lock(mMutex);
    return mCollections.size();
}

std::size_t InMemoryVectorStore::pointCount(const std::string& collection) const {
    std::lock_guard<std::mutex> lock(mMutex);
    auto it = mCollections.find(collection);
    return it == mCollections.end() ? 0 : it->second.points.size();
}

InMemoryVectorStore::Collection& InMemoryVectorStore::find(const std::string& name) {
    auto it = mCollections.find(name);
    if (it == mCollections.end()) {
        throw StoreError("Collection '" + name + "' does not exist", 404);
    }
    return it->second;
}

} // namespace prodsearch
