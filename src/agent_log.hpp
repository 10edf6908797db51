#pragma once

#include <string>
#include <functional>
#include <mutex>

namespace log_collector {

// Process-wide diagnostic log for the agent itself (never the tailed content)
class AgentLog {
public:
    enum class Level { Info, Warning, Error };

    using Sink = std::function<void(Level level,
                                     const std::string& component,
                                     const std::string& message)>;

    // Passing an empty sink restores the console sink
    static void set_sink(Sink sink);

    static void log(const std::string& component, const std::string& message);
    static void warn(const std::string& component, const std::string& message);
    static void error(const std::string& component, const std::string& message);

    // Info to stdout, warnings and errors to stderr
    static void console_sink(Level level, const std::string& component,
                             const std::string& message);

    static const char* level_name(Level level);

private:
    static void write(Level level, const std::string& component, const std::string& message);

    static Sink sink_;
    static std::mutex mutex_;
};

} // namespace log_collector
