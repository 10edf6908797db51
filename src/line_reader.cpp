#include "line_reader.hpp"
#include "errors.hpp"

#include <algorithm>
#include <cerrno>
#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>

namespace log_collector {

FileHandle& FileHandle::operator=(FileHandle&& other) noexcept {
    if (this != &other) {
        reset();
        fd_ = other.fd_;
        other.fd_ = -1;
    }
    return *this;
}

FileHandle FileHandle::open_read(const std::string& path) {
    int fd = ::open(path.c_str(), O_RDONLY | O_CLOEXEC);
    if (fd < 0) {
        if (errno == ENOENT) {
            return FileHandle();
        }
        throw io_error(errno, "Failed to open", path);
    }
    return FileHandle(fd);
}

void FileHandle::reset() {
    if (fd_ >= 0) {
        ::close(fd_);
        fd_ = -1;
    }
}

FileId file_id(const FileHandle& handle, const std::string& path) {
    struct stat st{};
    if (::fstat(handle.fd(), &st) != 0) {
        throw io_error(errno, "Failed to stat", path);
    }
    return FileId{st.st_dev, st.st_ino};
}

std::uint64_t file_size(const FileHandle& handle, const std::string& path) {
    struct stat st{};
    if (::fstat(handle.fd(), &st) != 0) {
        throw io_error(errno, "Failed to stat", path);
    }
    return static_cast<std::uint64_t>(st.st_size);
}

std::string read_at(const FileHandle& handle, std::uint64_t offset, std::size_t count,
                    const std::string& path) {
    std::string buf(count, '\0');
    std::size_t total = 0;

    while (total < count) {
        ssize_t n = ::pread(handle.fd(), &buf[total], count - total,
                            static_cast<off_t>(offset + total));
        if (n < 0) {
            if (errno == EINTR) continue;
            throw io_error(errno, "Failed to read", path);
        }
        if (n == 0) break;  // EOF
        total += static_cast<std::size_t>(n);
    }

    buf.resize(total);
    return buf;
}

std::size_t split_lines(std::string& pending, const std::string& data,
                        std::vector<std::string>& lines) {
    pending += data;

    std::size_t start = 0;
    std::size_t nl;
    while ((nl = pending.find('\n', start)) != std::string::npos) {
        std::size_t end = nl;
        if (end > start && pending[end - 1] == '\r') {
            --end;
        }
        lines.emplace_back(pending, start, end - start);
        start = nl + 1;
    }

    pending.erase(0, start);
    return start;
}

std::vector<std::string> tail_file(const std::string& path, std::size_t count,
                                   std::size_t block_size) {
    std::vector<std::string> lines;
    if (count == 0) {
        return lines;
    }

    FileHandle handle = FileHandle::open_read(path);
    if (!handle.is_open()) {
        throw io_error(ENOENT, "Failed to open", path);
    }

    const std::uint64_t size = file_size(handle, path);
    if (size == 0) {
        return lines;
    }

    // Collect blocks from the end until `count` + 1 terminators are seen,
    // the extra one marking where the first wanted line starts
    std::string data;
    std::uint64_t pos = size;
    std::size_t newlines = 0;
    while (pos > 0 && newlines <= count) {
        std::size_t len = static_cast<std::size_t>(std::min<std::uint64_t>(block_size, pos));
        pos -= len;
        std::string block = read_at(handle, pos, len, path);
        newlines += static_cast<std::size_t>(std::count(block.begin(), block.end(), '\n'));
        data.insert(0, block);
    }

    // Drop an unterminated final line
    std::size_t last_nl = data.rfind('\n');
    if (last_nl == std::string::npos) {
        return lines;
    }
    data.resize(last_nl + 1);

    std::string pending;
    split_lines(pending, data, lines);
    if (pos > 0 && !lines.empty()) {
        // The first entry may be cut at the block boundary
        lines.erase(lines.begin());
    }
    if (lines.size() > count) {
        lines.erase(lines.begin(), lines.end() - static_cast<std::ptrdiff_t>(count));
    }
    return lines;
}

std::size_t trailing_partial_size(const FileHandle& handle, std::uint64_t size,
                                  std::size_t limit, const std::string& path) {
    const std::size_t block_size = 4096;
    std::uint64_t pos = size;
    std::size_t scanned = 0;

    while (pos > 0 && scanned < limit) {
        std::size_t len = static_cast<std::size_t>(
            std::min<std::uint64_t>({block_size, pos, limit - scanned}));
        pos -= len;
        std::string block = read_at(handle, pos, len, path);
        std::size_t nl = block.rfind('\n');
        if (nl != std::string::npos) {
            return static_cast<std::size_t>(size - (pos + nl + 1));
        }
        scanned += len;
    }

    return pos == 0 ? static_cast<std::size_t>(size) : 0;
}

} // namespace log_collector
