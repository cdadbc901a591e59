#pragma once

#include <deque>
#include <string>
#include <unordered_set>

namespace tessera::backend {

// Presence-only record of URLs that rendered successfully at least once.
// Used to skip entry animations for resources already seen, so it outlives
// any single view. Eviction is strict insertion order (FIFO), not LRU:
// lookups and re-marking never refresh a key.
class LoadedRegistry {
public:
    static constexpr size_t DEFAULT_CAPACITY = 2000;

    explicit LoadedRegistry(size_t capacity = DEFAULT_CAPACITY);

    void mark(const std::string& key);
    bool is_marked(const std::string& key) const;
    void clear();

    size_t size() const { return keys_.size(); }
    size_t capacity() const { return capacity_; }

private:
    size_t capacity_;
    std::unordered_set<std::string> keys_;
    std::deque<std::string> insertion_order_;
};

}  // namespace tessera::backend
