#pragma once

#include "line_reader.hpp"
#include <cstdint>
#include <map>
#include <optional>
#include <set>
#include <string>
#include <vector>

namespace log_collector {

struct WatchedFile {
    std::string path;                // Absolute path
    FileHandle handle;
    FileId id;                       // Identity of the open handle
    std::uint64_t offset = 0;        // Bytes of complete lines already delivered
    std::string pending;             // Unterminated bytes read past `offset`
    std::uint64_t last_size = 0;     // Size seen by the last read step

    // Where the next read starts
    std::uint64_t read_position() const { return offset + pending.size(); }
};

struct RefreshResult {
    std::vector<std::string> added;
    std::vector<std::string> removed;
};

// Open read handles for the matching files of one directory, keyed by file name
class FileRegistry {
public:
    // Throws NotADirectoryError if `directory` is not an existing directory
    FileRegistry(const std::string& directory, std::set<std::string> extensions);
    ~FileRegistry();

    // Non-copyable
    FileRegistry(const FileRegistry&) = delete;
    FileRegistry& operator=(const FileRegistry&) = delete;

    // Opens newly listed matching files and drops the ones no longer listed
    RefreshResult refresh();

    // Replaces the handle of `name` with a fresh one for its current path,
    // resetting offset and pending data. Drops the entry and returns false
    // if the path no longer exists.
    bool reopen(const std::string& name);

    bool remove(const std::string& name);

    // Closes every handle
    void close();

    WatchedFile* find(const std::string& name);
    const WatchedFile* find(const std::string& name) const;
    bool contains(const std::string& name) const { return files_.count(name) > 0; }
    std::size_t size() const { return files_.size(); }
    std::vector<std::string> names() const;

    const std::string& directory() const { return directory_; }
    const std::set<std::string>& extensions() const { return extensions_; }

    bool matches(const std::string& filename) const;

    // Suffix after the last '.', empty for "name", ".hidden" and "..log"
    static std::string extension_of(const std::string& filename);

private:
    std::vector<std::string> list_matching() const;
    std::optional<WatchedFile> open_file(const std::string& name) const;

    std::string directory_;
    std::set<std::string> extensions_;
    std::map<std::string, WatchedFile> files_;
};

} // namespace log_collector
