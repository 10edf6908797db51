#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>
#include <sys/types.h>

namespace log_collector {

// Owning POSIX file descriptor, closed on destruction
class FileHandle {
public:
    FileHandle() = default;
    explicit FileHandle(int fd) : fd_(fd) {}
    ~FileHandle() { reset(); }

    FileHandle(const FileHandle&) = delete;
    FileHandle& operator=(const FileHandle&) = delete;

    FileHandle(FileHandle&& other) noexcept : fd_(other.fd_) { other.fd_ = -1; }
    FileHandle& operator=(FileHandle&& other) noexcept;

    // Opens read-only. Returns a closed handle if the path does not exist,
    // throws std::system_error for any other failure.
    static FileHandle open_read(const std::string& path);

    int fd() const { return fd_; }
    bool is_open() const { return fd_ >= 0; }
    void reset();

private:
    int fd_ = -1;
};

// Device + inode of an open file
struct FileId {
    dev_t dev = 0;
    ino_t ino = 0;

    bool operator==(const FileId& other) const { return dev == other.dev && ino == other.ino; }
    bool operator!=(const FileId& other) const { return !(*this == other); }
};

FileId file_id(const FileHandle& handle, const std::string& path);
std::uint64_t file_size(const FileHandle& handle, const std::string& path);

// Reads up to `count` bytes at `offset`, fewer only at end of file
std::string read_at(const FileHandle& handle, std::uint64_t offset, std::size_t count,
                    const std::string& path);

// Appends `data` to `pending`, moves every complete line into `lines`
// ('\n' and a preceding '\r' stripped) and leaves the unterminated tail in
// `pending`. Returns the number of bytes consumed by complete lines.
std::size_t split_lines(std::string& pending, const std::string& data,
                        std::vector<std::string>& lines);

// Last `count` complete lines of the file at `path`, scanning backwards from
// EOF in blocks. An unterminated final line is not included.
std::vector<std::string> tail_file(const std::string& path, std::size_t count,
                                   std::size_t block_size = 4096);

// Length of the unterminated data after the last '\n' in the first `size`
// bytes, looking back at most `limit` bytes. Returns 0 if no '\n' is found
// within the limit and the scan did not reach the start of the file.
std::size_t trailing_partial_size(const FileHandle& handle, std::uint64_t size,
                                  std::size_t limit, const std::string& path);

} // namespace log_collector
