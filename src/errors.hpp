#pragma once

#include <stdexcept>
#include <string>
#include <system_error>

namespace log_collector {

// Invalid construction parameters; never recovered
class ConfigError : public std::runtime_error {
public:
    explicit ConfigError(const std::string& what) : std::runtime_error(what) {}
};

class NotADirectoryError : public ConfigError {
public:
    explicit NotADirectoryError(const std::string& path)
        : ConfigError("Not a directory: " + path)
        , path_(path)
    {
    }

    const std::string& path() const { return path_; }

private:
    std::string path_;
};

// I/O failure for a path, carrying the errno it failed with
inline std::system_error io_error(int err, const std::string& what, const std::string& path) {
    return std::system_error(err, std::generic_category(), what + ": " + path);
}

inline bool is_not_found(const std::system_error& e) {
    return e.code() == std::errc::no_such_file_or_directory;
}

} // namespace log_collector
