#include "tail_engine.hpp"
#include "agent_log.hpp"
#include "errors.hpp"

#include <algorithm>
#include <cerrno>
#include <chrono>
#include <stdexcept>
#include <sys/stat.h>
#include <thread>
#include <vector>

namespace log_collector {

namespace {

const WatchConfig& validated(const WatchConfig& config) {
    config.validate();
    return config;
}

} // namespace

TailEngine::TailEngine(const WatchConfig& config, LineSink& sink)
    : TailEngine(config, nullptr, &sink)
{
}

TailEngine::TailEngine(const WatchConfig& config, FunctionSink::Callback callback)
    : TailEngine(config, std::make_unique<FunctionSink>(std::move(callback)), nullptr)
{
}

TailEngine::TailEngine(const WatchConfig& config, std::unique_ptr<LineSink> owned, LineSink* sink)
    : config_(validated(config))
    , owned_sink_(std::move(owned))
    , sink_(owned_sink_ ? owned_sink_.get() : sink)
    , registry_(config_.watch_dir, config_.extensions)
{
    AgentLog::log("Tail", "Watching directory: " + registry_.directory());
    bootstrap();
}

TailEngine::~TailEngine() {
    close();
}

void TailEngine::bootstrap() {
    registry_.refresh();

    for (const auto& name : registry_.names()) {
        WatchedFile* file = registry_.find(name);
        prime_at_eof(*file);

        if (config_.tail_lines == 0) continue;

        std::vector<std::string> lines;
        try {
            lines = tail_file(file->path, config_.tail_lines);
        } catch (const std::system_error& e) {
            if (!is_not_found(e)) throw;
            AgentLog::warn("Tail", "File vanished before bootstrap: " + file->path);
            continue;
        }

        if (!lines.empty()) {
            sink_->accept(file->path, lines);
        }
    }
}

void TailEngine::prime_at_eof(WatchedFile& file) {
    std::uint64_t size = file_size(file.handle, file.path);

    // An unterminated last line stays pending so it is delivered whole once completed
    std::size_t partial = trailing_partial_size(file.handle, size, config_.maxsize - 1, file.path);
    file.offset = size - partial;
    file.pending = read_at(file.handle, file.offset, partial, file.path);
    file.last_size = size;
}

void TailEngine::run(double interval, bool blocking) {
    if (interval < 0.0) {
        throw ConfigError("interval must be a non-negative number of seconds");
    }

    while (true) {
        run_once();
        if (!blocking) return;
        std::this_thread::sleep_for(std::chrono::duration<double>(interval));
    }
}

std::size_t TailEngine::run_once() {
    if (closed_) {
        throw std::logic_error("TailEngine is closed");
    }

    registry_.refresh();

    std::size_t delivered = 0;
    for (const auto& name : registry_.names()) {
        try {
            delivered += read_and_dispatch(name);
        } catch (const std::system_error& e) {
            // Gone mid-read; the next refresh drops it
            if (!is_not_found(e)) throw;
            AgentLog::warn("Tail", std::string("File vanished: ") + e.what());
        }
    }
    return delivered;
}

std::size_t TailEngine::read_and_dispatch(const std::string& name) {
    WatchedFile* file = registry_.find(name);
    if (!file) return 0;

    struct stat st{};
    if (::stat(file->path.c_str(), &st) != 0) {
        if (errno == ENOENT) return 0;
        throw io_error(errno, "Failed to stat", file->path);
    }

    if (FileId{st.st_dev, st.st_ino} != file->id) {
        // Finish the rotated-away file before following the new one
        std::uint64_t old_size = file_size(file->handle, file->path);
        if (old_size > file->read_position()) {
            return read_chunk(*file, old_size);
        }

        AgentLog::warn("Tail", "File replaced, reading from start: " + file->path);
        if (!registry_.reopen(name)) return 0;
        file = registry_.find(name);
    }

    std::uint64_t size = file_size(file->handle, file->path);
    if (size < file->read_position()) {
        AgentLog::warn("Tail", "File truncated, reading from start: " + file->path);
        file->offset = 0;
        file->pending.clear();
    }
    file->last_size = size;

    if (size == file->read_position()) return 0;

    return read_chunk(*file, size);
}

std::size_t TailEngine::read_chunk(WatchedFile& file, std::uint64_t size) {
    std::size_t count = static_cast<std::size_t>(
        std::min<std::uint64_t>(config_.maxsize, size - file.read_position()));
    std::string chunk = read_at(file.handle, file.read_position(), count, file.path);

    std::vector<std::string> lines;
    file.offset += split_lines(file.pending, chunk, lines);

    // Pending data never reaches maxsize; an overlong line is delivered in fragments
    if (file.pending.size() >= config_.maxsize) {
        AgentLog::warn("Tail", "Line longer than maxsize, delivering a fragment: " + file.path);
        file.offset += file.pending.size();
        lines.push_back(std::move(file.pending));
        file.pending.clear();
    }

    if (lines.empty()) return 0;

    sink_->accept(file.path, lines);
    return lines.size();
}

void TailEngine::close() {
    if (closed_) return;
    closed_ = true;
    registry_.close();
    AgentLog::log("Tail", "Stopped watching: " + registry_.directory());
}

} // namespace log_collector
