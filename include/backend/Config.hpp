#pragma once

#include <filesystem>
#include <string>

namespace tessera::backend {

struct Config {
    // Bounded cache
    size_t cache_capacity = 500;
    long long cache_ttl_ms = 10 * 60 * 1000;
    long long cleanup_interval_ms = 2 * 60 * 1000;

    // Loaded-resource registry
    size_t registry_capacity = 2000;

    // Load scheduler
    size_t concurrency = 6;
    int default_priority = 5;
    long long fetch_timeout_ms = 0;  // 0 = wait forever

    // Retry controller
    int max_retries = 2;
    long long base_delay_ms = 500;
    std::string fallback_url = "/images/fallback.jpeg";

    // URL variants
    bool detect_next_gen_format = true;

    // Network
    std::string user_agent = "tessera/1.0";
    long max_redirects = 10;
    long long connect_timeout_ms = 10000;

    // Logging
    std::string log_level = "info";
    std::filesystem::path log_file = "/tmp/tessera_debug.log";
};

class ConfigLoader {
public:
    static Config load_config();
    static Config load_from_file(const std::filesystem::path& path);
    static bool save_config(const Config& cfg, const std::filesystem::path& path);
    static std::filesystem::path get_config_file();
};

}  // namespace tessera::backend
