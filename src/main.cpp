#include "backend/Config.hpp"
#include "backend/CurlMediaSource.hpp"
#include "backend/MediaEngine.hpp"
#include "events/EventLoop.hpp"
#include "url/VariantBuilder.hpp"
#include "util/Clock.hpp"
#include "util/Logger.hpp"
#include <algorithm>
#include <atomic>
#include <chrono>
#include <csignal>
#include <iostream>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

using namespace std::chrono_literals;

static std::atomic<bool> g_shutdown{false};

static void signal_handler(int) {
    g_shutdown.store(true);
}

namespace {

struct Options {
    std::string config_file;
    tessera::url::SizeClass size = tessera::url::SizeClass::Medium;
    std::optional<int> priority;
    bool use_variant = true;
    std::vector<std::string> urls;
};

void print_usage() {
    std::cerr << "Usage: tessera [--config FILE] [--size thumb|small|medium|large|full|blur]\n"
              << "               [--priority N] [--no-variant] URL...\n";
}

bool parse_args(int argc, char** argv, Options& opts) {
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--config" && i + 1 < argc) {
            opts.config_file = argv[++i];
        } else if (arg == "--size" && i + 1 < argc) {
            if (!tessera::url::parse_size_class(argv[++i], opts.size)) {
                std::cerr << "Unknown size class: " << argv[i] << "\n";
                return false;
            }
        } else if (arg == "--priority" && i + 1 < argc) {
            try {
                opts.priority = std::stoi(argv[++i]);
            } catch (const std::exception&) {
                std::cerr << "Invalid priority: " << argv[i] << "\n";
                return false;
            }
        } else if (arg == "--no-variant") {
            opts.use_variant = false;
        } else if (arg == "-h" || arg == "--help") {
            return false;
        } else if (!arg.empty() && arg[0] == '-') {
            std::cerr << "Unknown option: " << arg << "\n";
            return false;
        } else {
            opts.urls.push_back(arg);
        }
    }
    return !opts.urls.empty();
}

const char* outcome(const tessera::model::DisplayState& state) {
    if (state.state == tessera::model::AttemptState::Succeeded) return "OK";
    if (state.showing_fallback && state.handle) return "FALLBACK";
    return "FAILED";
}

}  // namespace

int main(int argc, char** argv) {
    using namespace tessera;

    Options opts;
    if (!parse_args(argc, argv, opts)) {
        print_usage();
        return 2;
    }

    try {
        auto config = opts.config_file.empty()
            ? backend::ConfigLoader::load_config()
            : backend::ConfigLoader::load_from_file(opts.config_file);

        util::Logger::init(config.log_file.string());
        util::Logger::Level level = util::Logger::Level::Info;
        if (util::Logger::parse_level(config.log_level, level)) {
            util::Logger::set_level(level);
        } else {
            util::Logger::warn("Main: Unknown log level '" + config.log_level + "', keeping default");
        }
        util::Logger::info("TESSERA starting (" + std::to_string(opts.urls.size()) + " URLs)");

        std::signal(SIGINT, signal_handler);
        std::signal(SIGTERM, signal_handler);

        util::SteadyClock clock;
        events::EventLoop loop(clock);

        backend::NetworkOptions network;
        network.user_agent = config.user_agent;
        network.max_redirects = config.max_redirects;
        network.connect_timeout = std::chrono::milliseconds(config.connect_timeout_ms);
        backend::CurlMediaSource source(loop, network);

        backend::MediaEngine engine(source, loop, clock, backend::EngineOptions::from_config(config));

        // Give the WebP probe a chance to settle so variants are stable for the whole run
        if (config.detect_next_gen_format && opts.use_variant) {
            engine.formats().wait();
        }

        const int priority = opts.priority.value_or(config.default_priority);
        std::vector<std::unique_ptr<backend::RetryController>> attempts;
        std::vector<std::string> requested;
        for (const auto& url : opts.urls) {
            std::string target = opts.use_variant ? engine.variant_url(url, opts.size) : url;
            if (target != url) {
                util::Logger::debug("Main: " + url + " -> " + target);
            }
            auto attempt = engine.create_attempt(priority);
            attempt->set_source(target);
            attempts.push_back(std::move(attempt));
            requested.push_back(target);
        }

        auto all_terminal = [&attempts] {
            return std::all_of(attempts.begin(), attempts.end(),
                               [](const auto& a) { return a->state().terminal(); });
        };

        while (!g_shutdown.load() && !all_terminal()) {
            loop.process();
            if (loop.has_posted()) continue;

            auto wait = 5ms;
            if (auto deadline = loop.next_deadline()) {
                auto until = std::chrono::duration_cast<std::chrono::milliseconds>(*deadline - clock.now());
                wait = std::clamp(until, 0ms, wait);
            }
            std::this_thread::sleep_for(wait);
        }

        if (g_shutdown.load()) {
            util::Logger::info("Main: Interrupted");
        }

        bool any_failed = false;
        for (size_t i = 0; i < attempts.size(); ++i) {
            const auto& state = attempts[i]->state();
            const char* status = outcome(state);
            if (std::string(status) == "FAILED") any_failed = true;

            std::cout << status << " " << requested[i];
            if (state.handle) {
                std::cout << " " << state.handle->data.size() << " "
                          << state.handle->width << "x" << state.handle->height;
            } else {
                std::cout << " 0 0x0";
            }
            std::cout << std::endl;
        }

        auto stats = engine.cache_stats();
        util::Logger::info("TESSERA shutdown (cache " + std::to_string(stats.size) + "/" +
                           std::to_string(stats.capacity) + ")");

        // Attempts reference the engine; release them first
        attempts.clear();
        return any_failed ? 1 : 0;
    } catch (const std::exception& e) {
        util::Logger::error("Fatal error: " + std::string(e.what()));
        std::cerr << "Fatal error: " << e.what() << std::endl;
        return 1;
    }
}
