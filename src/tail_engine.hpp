#pragma once

#include "file_registry.hpp"
#include "line_sink.hpp"
#include "watch_config.hpp"
#include <cstddef>
#include <cstdint>
#include <memory>
#include <string>

namespace log_collector {

// Polls one directory and hands newly appended lines to a LineSink.
// Construction primes every matching file at EOF and delivers its last
// `tail_lines` lines once.
class TailEngine {
public:
    // `sink` must outlive the engine
    TailEngine(const WatchConfig& config, LineSink& sink);
    TailEngine(const WatchConfig& config, FunctionSink::Callback callback);
    ~TailEngine();

    // Non-copyable
    TailEngine(const TailEngine&) = delete;
    TailEngine& operator=(const TailEngine&) = delete;

    // Ticks every `interval` seconds forever, or once if not blocking
    void run(double interval, bool blocking = true);
    void run() { run(config_.interval, true); }

    // One tick over every tracked file, returns the number of lines delivered
    std::size_t run_once();

    // Releases all file handles; the engine cannot run afterwards
    void close();
    bool is_closed() const { return closed_; }

    const FileRegistry& registry() const { return registry_; }
    const WatchConfig& config() const { return config_; }

private:
    TailEngine(const WatchConfig& config, std::unique_ptr<LineSink> owned, LineSink* sink);

    void bootstrap();
    void prime_at_eof(WatchedFile& file);
    std::size_t read_and_dispatch(const std::string& name);

    // One bounded read of `file` up to `size`, dispatching complete lines
    std::size_t read_chunk(WatchedFile& file, std::uint64_t size);

    WatchConfig config_;
    std::unique_ptr<LineSink> owned_sink_;
    LineSink* sink_;
    FileRegistry registry_;
    bool closed_ = false;
};

} // namespace log_collector
