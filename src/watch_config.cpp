#include "watch_config.hpp"
#include "errors.hpp"
#include <fstream>
#include <stdexcept>

namespace log_collector {

void WatchConfig::validate() const {
    if (watch_dir.empty()) {
        throw ConfigError("watch_dir is required");
    }
    if (maxsize == 0) {
        throw ConfigError("maxsize must be greater than zero");
    }
    if (!(interval >= 0.0)) {
        throw ConfigError("interval must be a non-negative number of seconds");
    }
}

nlohmann::json WatchConfig::to_json() const {
    nlohmann::json j;
    j["watch_dir"] = watch_dir;
    j["extensions"] = extensions;
    j["tail_lines"] = tail_lines;
    j["maxsize"] = maxsize;
    j["interval"] = interval;
    return j;
}

WatchConfig WatchConfig::from_json(const nlohmann::json& j) {
    if (!j.is_object()) {
        throw ConfigError("config must be a JSON object");
    }

    // Negative counts would otherwise wrap to huge unsigned values
    for (const char* key : {"tail_lines", "maxsize"}) {
        if (j.contains(key) && j[key].is_number_integer() && j[key].get<long long>() < 0) {
            throw ConfigError(std::string(key) + " must not be negative");
        }
    }

    WatchConfig config;
    try {
        if (j.contains("watch_dir")) config.watch_dir = j["watch_dir"].get<std::string>();
        if (j.contains("extensions")) {
            config.extensions = j["extensions"].get<std::set<std::string>>();
        }
        if (j.contains("tail_lines")) config.tail_lines = j["tail_lines"].get<std::size_t>();
        if (j.contains("maxsize")) config.maxsize = j["maxsize"].get<std::size_t>();
        if (j.contains("interval")) config.interval = j["interval"].get<double>();
    } catch (const nlohmann::json::exception& e) {
        throw ConfigError(std::string("Invalid config: ") + e.what());
    }

    return config;
}

std::size_t parse_count(const std::string& option, const std::string& text) {
    // std::stoull accepts "-1" and wraps it
    if (text.empty() || text[0] < '0' || text[0] > '9') {
        throw ConfigError(option + " expects a non-negative number, got '" + text + "'");
    }

    std::size_t used = 0;
    unsigned long long value = 0;
    try {
        value = std::stoull(text, &used);
    } catch (const std::out_of_range&) {
        throw ConfigError(option + " is out of range: " + text);
    }
    if (used != text.size()) {
        throw ConfigError(option + " expects a non-negative number, got '" + text + "'");
    }
    return static_cast<std::size_t>(value);
}

WatchConfig load_config(const std::string& path) {
    std::ifstream in(path);
    if (!in.is_open()) {
        throw ConfigError("Failed to open config file: " + path);
    }

    nlohmann::json j;
    try {
        in >> j;
    } catch (const nlohmann::json::parse_error& e) {
        throw ConfigError("Failed to parse config file " + path + ": " + e.what());
    }

    WatchConfig config = WatchConfig::from_json(j);
    config.validate();
    return config;
}

} // namespace log_collector
