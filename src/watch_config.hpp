#pragma once

#include <cstddef>
#include <set>
#include <string>
#include <nlohmann/json.hpp>

namespace log_collector {

struct WatchConfig {
    std::string watch_dir;                           // Directory to monitor
    std::set<std::string> extensions{"log"};         // Empty = every file
    std::size_t tail_lines = 1;                      // Lines delivered once per file at startup
    std::size_t maxsize = 1048576;                   // Max bytes read per file per tick
    double interval = 0.1;                           // Seconds between ticks

    // Throws ConfigError on an unusable value
    void validate() const;

    nlohmann::json to_json() const;

    // Missing keys keep their defaults, unknown keys are ignored
    static WatchConfig from_json(const nlohmann::json& j);
};

// Parses a non-negative decimal count for `option`, throws ConfigError otherwise
std::size_t parse_count(const std::string& option, const std::string& text);

// Reads and validates a JSON config file
WatchConfig load_config(const std::string& path);

} // namespace log_collector
