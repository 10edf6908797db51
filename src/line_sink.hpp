#pragma once

#include "errors.hpp"
#include <functional>
#include <string>
#include <vector>

namespace log_collector {

// Receives each batch of complete lines read from a watched file.
// Called synchronously from the tail loop.
class LineSink {
public:
    virtual ~LineSink() = default;
    virtual void accept(const std::string& path, const std::vector<std::string>& lines) = 0;
};

// Adapts a plain callable to LineSink
class FunctionSink : public LineSink {
public:
    using Callback = std::function<void(const std::string& path,
                                        const std::vector<std::string>& lines)>;

    explicit FunctionSink(Callback callback)
        : callback_(std::move(callback))
    {
        if (!callback_) {
            throw ConfigError("callback is not callable");
        }
    }

    void accept(const std::string& path, const std::vector<std::string>& lines) override {
        callback_(path, lines);
    }

private:
    Callback callback_;
};

} // namespace log_collector
