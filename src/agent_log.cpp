#include "agent_log.hpp"
#include <iostream>

namespace log_collector {

AgentLog::Sink AgentLog::sink_ = AgentLog::console_sink;
std::mutex AgentLog::mutex_;

void AgentLog::set_sink(Sink sink) {
    std::lock_guard<std::mutex> lock(mutex_);
    sink_ = sink ? std::move(sink) : console_sink;
}

void AgentLog::log(const std::string& component, const std::string& message) {
    write(Level::Info, component, message);
}

void AgentLog::warn(const std::string& component, const std::string& message) {
    write(Level::Warning, component, message);
}

void AgentLog::error(const std::string& component, const std::string& message) {
    write(Level::Error, component, message);
}

void AgentLog::write(Level level, const std::string& component, const std::string& message) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (sink_) {
        sink_(level, component, message);
    }
}

const char* AgentLog::level_name(Level level) {
    switch (level) {
        case Level::Info: return "info";
        case Level::Warning: return "warning";
        case Level::Error: return "error";
        default: return "unknown";
    }
}

void AgentLog::console_sink(Level level, const std::string& component,
                            const std::string& message) {
    if (level == Level::Info) {
        std::cout << "[" << component << "] " << message << std::endl;
    } else {
        std::cerr << "[" << component << "] " << level_name(level) << ": " << message << std::endl;
    }
}

} // namespace log_collector
