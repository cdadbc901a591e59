#include "backend/MediaCache.hpp"
#include "util/Logger.hpp"

namespace tessera::backend {

MediaCache::MediaCache(const util::Clock& clock, size_t capacity, std::chrono::milliseconds ttl)
    : clock_(clock), capacity_(capacity), ttl_(ttl) {
    if (capacity_ == 0) {
        util::Logger::warn("MediaCache: Capacity 0 requested, using 1");
        capacity_ = 1;
    }
}

bool MediaCache::expired(const Entry& entry, util::Clock::time_point now) const {
    return now - entry.inserted_at > ttl_;
}

model::MediaHandlePtr MediaCache::get(const std::string& key) {
    auto it = index_.find(key);
    if (it == index_.end()) {
        return nullptr;
    }

    if (expired(*it->second, clock_.now())) {
        lru_list_.erase(it->second);
        index_.erase(it);
        return nullptr;
    }

    // Move to front (most recently used)
    lru_list_.splice(lru_list_.begin(), lru_list_, it->second);
    return it->second->value;
}

void MediaCache::set(const std::string& key, model::MediaHandlePtr value) {
    auto now = clock_.now();

    auto it = index_.find(key);
    if (it != index_.end()) {
        it->second->value = std::move(value);
        it->second->inserted_at = now;
        lru_list_.splice(lru_list_.begin(), lru_list_, it->second);
        return;
    }

    // Evict-then-insert with no suspension point in between
    if (index_.size() >= capacity_) {
        const Entry& oldest = lru_list_.back();
        util::Logger::debug("MediaCache: Evicting least recently used " + oldest.key);
        index_.erase(oldest.key);
        lru_list_.pop_back();
    }

    lru_list_.push_front(Entry{key, std::move(value), now});
    index_[key] = lru_list_.begin();
}

bool MediaCache::has(const std::string& key) const {
    auto it = index_.find(key);
    if (it == index_.end()) {
        return false;
    }
    return !expired(*it->second, clock_.now());
}

bool MediaCache::erase(const std::string& key) {
    auto it = index_.find(key);
    if (it == index_.end()) {
        return false;
    }
    lru_list_.erase(it->second);
    index_.erase(it);
    return true;
}

void MediaCache::clear() {
    lru_list_.clear();
    index_.clear();
}

size_t MediaCache::cleanup() {
    auto now = clock_.now();
    size_t removed = 0;

    for (auto it = lru_list_.begin(); it != lru_list_.end(); ) {
        if (expired(*it, now)) {
            index_.erase(it->key);
            it = lru_list_.erase(it);
            ++removed;
        } else {
            ++it;
        }
    }

    if (removed > 0) {
        util::Logger::debug("MediaCache: Swept " + std::to_string(removed) + " expired entries (" +
                            std::to_string(index_.size()) + " remain)");
    }
    return removed;
}

CacheStats MediaCache::stats() const {
    return CacheStats{index_.size(), capacity_, ttl_};
}

}  // namespace tessera::backend
