#include "backend/LoadedRegistry.hpp"
#include "util/Logger.hpp"

namespace tessera::backend {

LoadedRegistry::LoadedRegistry(size_t capacity) : capacity_(capacity) {
    if (capacity_ == 0) {
        util::Logger::warn("LoadedRegistry: Capacity 0 requested, using 1");
        capacity_ = 1;
    }
}

void LoadedRegistry::mark(const std::string& key) {
    if (key.empty() || keys_.count(key) > 0) {
        return;
    }

    if (keys_.size() >= capacity_) {
        const std::string& oldest = insertion_order_.front();
        keys_.erase(oldest);
        insertion_order_.pop_front();
    }

    keys_.insert(key);
    insertion_order_.push_back(key);
}

bool LoadedRegistry::is_marked(const std::string& key) const {
    return !key.empty() && keys_.count(key) > 0;
}

void LoadedRegistry::clear() {
    keys_.clear();
    insertion_order_.clear();
}

}  // namespace tessera::backend
