#pragma once

#include "model/MediaHandle.hpp"
#include "util/Clock.hpp"
#include <chrono>
#include <list>
#include <string>
#include <unordered_map>

namespace tessera::backend {

struct CacheStats {
    size_t size = 0;
    size_t capacity = 0;
    std::chrono::milliseconds ttl{0};
};

/**
 * Capacity- and time-bounded LRU store of resolved media handles.
 *
 * The list keeps entries in access order (front = most recently used) and
 * the map gives O(1) lookup by key. Keys are used verbatim: two URLs that
 * differ only in parameter order are distinct entries.
 *
 * Expired entries are invisible to get()/has() immediately; they are only
 * physically removed by get() on the expired key, by cleanup(), or by LRU
 * eviction.
 */
class MediaCache {
public:
    static constexpr size_t DEFAULT_CAPACITY = 500;
    static constexpr std::chrono::milliseconds DEFAULT_TTL{10 * 60 * 1000};

    explicit MediaCache(const util::Clock& clock,
                        size_t capacity = DEFAULT_CAPACITY,
                        std::chrono::milliseconds ttl = DEFAULT_TTL);

    // Returns nullptr if missing or expired; promotes a hit to most-recently-used
    model::MediaHandlePtr get(const std::string& key);

    // Insert or update; evicts the least-recently-used entry when full
    void set(const std::string& key, model::MediaHandlePtr value);

    // Liveness check only: does not promote and does not remove expired entries
    bool has(const std::string& key) const;

    bool erase(const std::string& key);
    void clear();

    // Sweep expired entries; returns how many were removed
    size_t cleanup();

    size_t size() const { return index_.size(); }
    size_t capacity() const { return capacity_; }
    std::chrono::milliseconds ttl() const { return ttl_; }
    CacheStats stats() const;

private:
    struct Entry {
        std::string key;
        model::MediaHandlePtr value;
        util::Clock::time_point inserted_at;
    };

    bool expired(const Entry& entry, util::Clock::time_point now) const;

    const util::Clock& clock_;
    size_t capacity_;
    std::chrono::milliseconds ttl_;
    std::list<Entry> lru_list_;
    std::unordered_map<std::string, std::list<Entry>::iterator> index_;
};

}  // namespace tessera::backend
