#pragma once

#include "backend/Config.hpp"
#include "backend/LoadScheduler.hpp"
#include "backend/LoadedRegistry.hpp"
#include "backend/MediaCache.hpp"
#include "backend/MediaSource.hpp"
#include "backend/RetryController.hpp"
#include "events/EventLoop.hpp"
#include "url/VariantBuilder.hpp"
#include "util/Clock.hpp"
#include "util/FormatDetector.hpp"
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace tessera::backend {

struct EngineOptions {
    size_t cache_capacity = MediaCache::DEFAULT_CAPACITY;
    std::chrono::milliseconds cache_ttl = MediaCache::DEFAULT_TTL;
    std::chrono::milliseconds cleanup_interval{2 * 60 * 1000};
    size_t registry_capacity = LoadedRegistry::DEFAULT_CAPACITY;
    SchedulerOptions scheduler;
    RetryPolicy retry;
    int default_priority = 5;
    bool detect_next_gen_format = true;

    static EngineOptions from_config(const Config& cfg);
};

// Entry point for rendering code. Owns the cache, registry, scheduler,
// format detector and variant builder; borrows the network source, loop
// and clock, which must outlive it.
class MediaEngine {
public:
    using Completion = LoadScheduler::Completion;
    using BatchCallback = std::function<void(const std::vector<model::MediaHandlePtr>&)>;

    MediaEngine(MediaSource& source,
                events::EventLoop& loop,
                const util::Clock& clock,
                EngineOptions options = {},
                std::unique_ptr<util::FormatDetector> detector = nullptr);
    ~MediaEngine();

    MediaEngine(const MediaEngine&) = delete;
    MediaEngine& operator=(const MediaEngine&) = delete;

    // Completion always runs from the loop, never inside this call
    void request_load(const std::string& url, int priority, Completion done);

    bool is_loaded(const std::string& url) const;
    void mark_loaded(const std::string& url);

    std::string variant_url(const std::string& url, url::SizeClass size) const;
    std::optional<std::string> blur_placeholder(const std::string& url) const;
    std::string responsive_srcset(const std::string& url) const;

    CacheStats cache_stats() const { return cache_.stats(); }

    // Loads every non-blank URL; reports the handles that loaded once all settled
    void preload(const std::vector<std::string>& urls, int priority, BatchCallback done);

    std::unique_ptr<RetryController> create_attempt();
    std::unique_ptr<RetryController> create_attempt(int priority);

    void clear_queue();
    void clear_cache();
    void clear_registry();

    MediaCache& cache() { return cache_; }
    LoadedRegistry& registry() { return registry_; }
    LoadScheduler& scheduler() { return scheduler_; }
    util::FormatDetector& formats() { return *detector_; }
    const EngineOptions& options() const { return options_; }

private:
    events::EventLoop& loop_;
    EngineOptions options_;
    MediaCache cache_;
    LoadedRegistry registry_;
    LoadScheduler scheduler_;
    std::unique_ptr<util::FormatDetector> detector_;
    url::VariantBuilder variants_;
    std::string cleanup_task_;
};

}  // namespace tessera::backend
