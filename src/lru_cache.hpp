#pragma once

#include <cstddef>
#include <list>
#include <mutex>
#include <optional>
#include <unordered_map>
#include <utility>

namespace prodsearch {

/// Bounded least-recently-used map, safe for concurrent use.
/// A lookup hit moves the entry to the front; inserting past capacity evicts
/// the entry at the back.
template <typename Key, typename Value>
class LruCache {
public:
    explicit LruCache(std::size_t capacity) : mCapacity(capacity) {}

    std::optional<Value> get(const Key& key) {
        std::lock_guard<std::mutex> lock(mMutex);
        auto it = mIndex.find(key);
        if (it == mIndex.end()) {
            ++mMisses;
            return std::nullopt;
        }
        mEntries.splice(mEntries.begin(), mEntries, it->second);
        ++mHits;
        return it->second->second;
    }

    void put(const Key& key, Value value) {
        if (mCapacity == 0) return;

        std::lock_guard<std::mutex> lock(mMutex);
        auto it = mIndex.find(key);
        if (it != mIndex.end()) {
            it->second->second = std::move(value);
            mEntries.splice(mEntries.begin(), mEntries, it->second);
            return;
        }

        mEntries.emplace_front(key, std::move(value));
        mIndex[key] = mEntries.begin();

        if (mEntries.size() > mCapacity) {
            mIndex.erase(mEntries.back().first);
            mEntries.pop_back();
        }
    }

    bool contains(const Key& key) const {
        std::lock_guard<std::mutex> lock(mMutex);
        return mIndex.count(key) != 0;
    }

    std::size_t size() const {
        std::lock_guard<std::mutex> lock(mMutex);
        return mEntries.size();
    }

    std::size_t capacity() const { return mCapacity; }

    // ---- accessors for summary report ----
    std::size_t hits() const {
        std::lock_guard<std::mutex> lock(mMutex);
        return mHits;
    }
    std::size_t misses() const {
        std::lock_guard<std::mutex> lock(mMutex);
        return mMisses;
    }

private:
    using Entry = std::pair<Key, Value>;

    const std::size_t mCapacity;
    mutable std::mutex mMutex;
    std::list<Entry> mEntries;  // front = most recently used
    std::unordered_map<Key, typename std::list<Entry>::iterator> mIndex;
    std::size_t mHits   = 0;
    std::size_t mMisses = 0;
};

} // namespace prodsearch
