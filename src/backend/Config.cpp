#include "backend/Config.hpp"
#include <cstdlib>
#include <fstream>
#include <stdexcept>
#include <string>
#include "util/Logger.hpp"

namespace tessera::backend {

namespace {

std::string trim(const std::string& s) {
    auto start = s.find_first_not_of(" \t\r");
    if (start == std::string::npos) return "";
    auto end = s.find_last_not_of(" \t\r");
    return s.substr(start, end - start + 1);
}

template <typename T>
void parse_number(const std::string& key, const std::string& value, T& out, bool allow_negative = false) {
    try {
        long long parsed = std::stoll(value);
        if (parsed < 0 && !allow_negative) {
            util::Logger::warn("Config: Negative value for " + key + " ignored");
            return;
        }
        out = static_cast<T>(parsed);
    } catch (const std::exception&) {
        util::Logger::warn("Config: Invalid number for " + key + ": " + value);
    }
}

bool parse_bool(const std::string& value) {
    return value == "true" || value == "1" || value == "yes";
}

}  // namespace

Config ConfigLoader::load_config() {
    util::Logger::info("Config: Loading configuration");

    auto config_file = get_config_file();
    if (std::filesystem::exists(config_file)) {
        return load_from_file(config_file);
    }
    util::Logger::info("Config: No config file at " + config_file.string() + ", using defaults");
    return Config{};
}

Config ConfigLoader::load_from_file(const std::filesystem::path& path) {
    util::Logger::debug("Config: Loading from " + path.string());

    Config cfg;

    std::ifstream file(path);
    if (!file) {
        util::Logger::warn("Config: Cannot open " + path.string() + ", using defaults");
        return cfg;
    }

    std::string line, current_section;
    while (std::getline(file, line)) {
        line = trim(line);

        // Skip comments and empty lines
        if (line.empty() || line[0] == '#') continue;

        // Section header
        if (line[0] == '[' && line.back() == ']') {
            current_section = line.substr(1, line.length() - 2);
            continue;
        }

        // Key = value
        auto eq_pos = line.find('=');
        if (eq_pos == std::string::npos) {
            util::Logger::warn("Config: Ignoring malformed line: " + line);
            continue;
        }

        std::string key = trim(line.substr(0, eq_pos));
        std::string value = trim(line.substr(eq_pos + 1));

        // Remove quotes from strings
        if (value.length() >= 2 && value.front() == '"' && value.back() == '"') {
            value = value.substr(1, value.length() - 2);
        }

        const std::string qualified = current_section + "." + key;

        if (current_section == "cache") {
            if (key == "capacity") parse_number(qualified, value, cfg.cache_capacity);
            else if (key == "ttl_ms") parse_number(qualified, value, cfg.cache_ttl_ms);
            else if (key == "cleanup_interval_ms") parse_number(qualified, value, cfg.cleanup_interval_ms);
        }
        else if (current_section == "registry") {
            if (key == "capacity") parse_number(qualified, value, cfg.registry_capacity);
        }
        else if (current_section == "scheduler") {
            if (key == "concurrency") parse_number(qualified, value, cfg.concurrency);
            else if (key == "default_priority") parse_number(qualified, value, cfg.default_priority, true);
            else if (key == "fetch_timeout_ms") parse_number(qualified, value, cfg.fetch_timeout_ms);
        }
        else if (current_section == "retry") {
            if (key == "max_retries") parse_number(qualified, value, cfg.max_retries);
            else if (key == "base_delay_ms") parse_number(qualified, value, cfg.base_delay_ms);
            else if (key == "fallback_url") cfg.fallback_url = value;
        }
        else if (current_section == "variants") {
            if (key == "detect_next_gen_format") cfg.detect_next_gen_format = parse_bool(value);
        }
        else if (current_section == "network") {
            if (key == "user_agent") cfg.user_agent = value;
            else if (key == "max_redirects") parse_number(qualified, value, cfg.max_redirects);
            else if (key == "connect_timeout_ms") parse_number(qualified, value, cfg.connect_timeout_ms);
        }
        else if (current_section == "logging") {
            if (key == "level") cfg.log_level = value;
            else if (key == "file") cfg.log_file = std::filesystem::path(value);
        }
    }

    return cfg;
}

bool ConfigLoader::save_config(const Config& cfg, const std::filesystem::path& path) {
    util::Logger::info("Config: Saving configuration to " + path.string());

    try {
        if (path.has_parent_path()) {
            std::filesystem::create_directories(path.parent_path());
        }
    } catch (const std::filesystem::filesystem_error& e) {
        util::Logger::error("Config: Cannot create config directory: " + std::string(e.what()));
        return false;
    }

    std::ofstream file(path);
    if (!file) {
        util::Logger::error("Config: Cannot write " + path.string());
        return false;
    }

    file << "# tessera media engine configuration\n\n";

    file << "[cache]\n";
    file << "# Maximum number of resolved media handles kept in memory\n";
    file << "capacity = " << cfg.cache_capacity << "\n";
    file << "# Entries older than this are treated as absent\n";
    file << "ttl_ms = " << cfg.cache_ttl_ms << "\n";
    file << "# Period of the expired-entry sweep\n";
    file << "cleanup_interval_ms = " << cfg.cleanup_interval_ms << "\n\n";

    file << "[registry]\n";
    file << "# URLs remembered as already rendered (oldest forgotten first)\n";
    file << "capacity = " << cfg.registry_capacity << "\n\n";

    file << "[scheduler]\n";
    file << "# Maximum concurrent fetches\n";
    file << "concurrency = " << cfg.concurrency << "\n";
    file << "# Priority used when callers do not pass one (lower = sooner)\n";
    file << "default_priority = " << cfg.default_priority << "\n";
    file << "# Fail a fetch still running after this long; 0 disables\n";
    file << "fetch_timeout_ms = " << cfg.fetch_timeout_ms << "\n\n";

    file << "[retry]\n";
    file << "max_retries = " << cfg.max_retries << "\n";
    file << "# Delay before retry n is base_delay_ms * 2^(n-1)\n";
    file << "base_delay_ms = " << cfg.base_delay_ms << "\n";
    file << "fallback_url = \"" << cfg.fallback_url << "\"\n\n";

    file << "[variants]\n";
    file << "# Ask CDNs for WebP when the runtime can decode it\n";
    file << "detect_next_gen_format = " << (cfg.detect_next_gen_format ? "true" : "false") << "\n\n";

    file << "[network]\n";
    file << "user_agent = \"" << cfg.user_agent << "\"\n";
    file << "max_redirects = " << cfg.max_redirects << "\n";
    file << "connect_timeout_ms = " << cfg.connect_timeout_ms << "\n\n";

    file << "[logging]\n";
    file << "# debug, info, warn, error\n";
    file << "level = \"" << cfg.log_level << "\"\n";
    file << "file = \"" << cfg.log_file.string() << "\"\n";

    return static_cast<bool>(file);
}

std::filesystem::path ConfigLoader::get_config_file() {
    auto home = std::getenv("HOME");
    if (home) {
        return std::filesystem::path(home) / ".config" / "tessera" / "config.toml";
    }
    return ".config/tessera/config.toml";
}

}  // namespace tessera::backend
