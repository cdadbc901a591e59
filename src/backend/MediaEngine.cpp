#include "backend/MediaEngine.hpp"
#include "url/UrlUtils.hpp"
#include "util/Logger.hpp"
#include <atomic>

namespace tessera::backend {

namespace {

std::atomic<int> engine_counter{0};

}  // namespace

EngineOptions EngineOptions::from_config(const Config& cfg) {
    EngineOptions options;
    options.cache_capacity = cfg.cache_capacity;
    options.cache_ttl = std::chrono::milliseconds(cfg.cache_ttl_ms);
    options.cleanup_interval = std::chrono::milliseconds(cfg.cleanup_interval_ms);
    options.registry_capacity = cfg.registry_capacity;
    options.scheduler.concurrency = cfg.concurrency;
    options.scheduler.fetch_timeout = std::chrono::milliseconds(cfg.fetch_timeout_ms);
    options.retry.max_retries = cfg.max_retries;
    options.retry.base_delay = std::chrono::milliseconds(cfg.base_delay_ms);
    options.retry.fallback_url = cfg.fallback_url;
    options.default_priority = cfg.default_priority;
    options.detect_next_gen_format = cfg.detect_next_gen_format;
    return options;
}

MediaEngine::MediaEngine(MediaSource& source,
                         events::EventLoop& loop,
                         const util::Clock& clock,
                         EngineOptions options,
                         std::unique_ptr<util::FormatDetector> detector)
    : loop_(loop),
      options_(std::move(options)),
      cache_(clock, options_.cache_capacity, options_.cache_ttl),
      registry_(options_.registry_capacity),
      scheduler_(source, cache_, registry_, loop, options_.scheduler),
      detector_(detector ? std::move(detector) : std::make_unique<util::FormatDetector>()),
      variants_([this] { return options_.detect_next_gen_format && detector_->detect(); }) {
    if (options_.detect_next_gen_format) {
        detector_->start();
    }

    cleanup_task_ = "media-cache-cleanup-" + std::to_string(engine_counter++);
    loop_.schedule(cleanup_task_, options_.cleanup_interval, [this] { cache_.cleanup(); });

    util::Logger::info("MediaEngine: Started (cache=" + std::to_string(cache_.capacity()) +
                       ", registry=" + std::to_string(registry_.capacity()) +
                       ", concurrency=" + std::to_string(scheduler_.concurrency()) + ")");
}

MediaEngine::~MediaEngine() {
    loop_.unschedule(cleanup_task_);
}

void MediaEngine::request_load(const std::string& url, int priority, Completion done) {
    if (url::is_blank_source(url)) {
        loop_.post([url, done = std::move(done)] {
            model::LoadResult result;
            result.key = url;
            result.error = model::LoadError{model::LoadErrorKind::EmptyOrInvalidSource, "no URL provided"};
            if (done) done(result);
        });
        return;
    }

    scheduler_.submit(url, priority, std::move(done));
}

bool MediaEngine::is_loaded(const std::string& url) const {
    return registry_.is_marked(url);
}

void MediaEngine::mark_loaded(const std::string& url) {
    registry_.mark(url);
}

std::string MediaEngine::variant_url(const std::string& url, url::SizeClass size) const {
    return variants_.variant_url(url, size);
}

std::optional<std::string> MediaEngine::blur_placeholder(const std::string& url) const {
    return variants_.blur_placeholder(url);
}

std::string MediaEngine::responsive_srcset(const std::string& url) const {
    return variants_.responsive_srcset(url);
}

void MediaEngine::preload(const std::vector<std::string>& urls, int priority, BatchCallback done) {
    struct Batch {
        std::vector<model::MediaHandlePtr> slots;
        size_t remaining = 0;
        BatchCallback done;
    };

    std::vector<std::string> valid;
    for (const auto& u : urls) {
        if (!url::is_blank_source(u)) valid.push_back(u);
    }

    if (valid.empty()) {
        loop_.post([done = std::move(done)] {
            if (done) done({});
        });
        return;
    }

    auto batch = std::make_shared<Batch>();
    batch->slots.resize(valid.size());
    batch->remaining = valid.size();
    batch->done = std::move(done);

    for (size_t i = 0; i < valid.size(); ++i) {
        request_load(valid[i], priority, [batch, i](const model::LoadResult& result) {
            if (result.ok()) {
                batch->slots[i] = result.handle;
            }
            if (--batch->remaining > 0) return;

            std::vector<model::MediaHandlePtr> loaded;
            for (auto& handle : batch->slots) {
                if (handle) loaded.push_back(std::move(handle));
            }
            if (batch->done) batch->done(loaded);
        });
    }
}

std::unique_ptr<RetryController> MediaEngine::create_attempt() {
    return create_attempt(options_.default_priority);
}

std::unique_ptr<RetryController> MediaEngine::create_attempt(int priority) {
    return std::make_unique<RetryController>(scheduler_, registry_, loop_, options_.retry, priority);
}

void MediaEngine::clear_queue() {
    scheduler_.clear_pending();
}

void MediaEngine::clear_cache() {
    cache_.clear();
}

void MediaEngine::clear_registry() {
    registry_.clear();
}

}  // namespace tessera::backend
