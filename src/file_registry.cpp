#include "file_registry.hpp"
#include "agent_log.hpp"
#include "errors.hpp"

#include <algorithm>
#include <filesystem>
#include <system_error>

namespace fs = std::filesystem;

namespace log_collector {

FileRegistry::FileRegistry(const std::string& directory, std::set<std::string> extensions)
    : extensions_(std::move(extensions))
{
    std::error_code ec;
    fs::path canonical = fs::canonical(directory, ec);
    if (ec || !fs::is_directory(canonical, ec)) {
        throw NotADirectoryError(directory);
    }
    directory_ = canonical.string();
}

FileRegistry::~FileRegistry() {
    close();
}

std::string FileRegistry::extension_of(const std::string& filename) {
    // Leading dots belong to the name
    auto start = filename.find_first_not_of('.');
    auto dot = filename.rfind('.');
    if (start == std::string::npos || dot == std::string::npos || dot < start) {
        return "";
    }
    return filename.substr(dot + 1);
}

bool FileRegistry::matches(const std::string& filename) const {
    if (extensions_.empty()) return true;
    return extensions_.count(extension_of(filename)) > 0;
}

std::vector<std::string> FileRegistry::list_matching() const {
    std::vector<std::string> result;

    for (const auto& entry : fs::directory_iterator(directory_)) {
        std::string name = entry.path().filename().string();
        if (!matches(name)) continue;

        // Entries may vanish while listing; those simply do not match
        std::error_code ec;
        if (!entry.is_regular_file(ec)) continue;

        result.push_back(std::move(name));
    }

    return result;
}

std::optional<WatchedFile> FileRegistry::open_file(const std::string& name) const {
    WatchedFile file;
    file.path = (fs::path(directory_) / name).string();
    file.handle = FileHandle::open_read(file.path);
    if (!file.handle.is_open()) {
        return std::nullopt;
    }
    file.id = file_id(file.handle, file.path);
    return file;
}

RefreshResult FileRegistry::refresh() {
    RefreshResult result;
    std::vector<std::string> listed = list_matching();
    std::sort(listed.begin(), listed.end());

    for (auto it = files_.begin(); it != files_.end();) {
        if (!std::binary_search(listed.begin(), listed.end(), it->first)) {
            AgentLog::log("Registry", "Unwatching: " + it->second.path);
            result.removed.push_back(it->first);
            it = files_.erase(it);
        } else {
            ++it;
        }
    }

    for (const auto& name : listed) {
        if (files_.count(name)) continue;

        auto file = open_file(name);
        if (!file) {
            continue;  // Removed between listing and open
        }

        AgentLog::log("Registry", "Watching: " + file->path);
        files_.emplace(name, std::move(*file));
        result.added.push_back(name);
    }

    return result;
}

bool FileRegistry::reopen(const std::string& name) {
    auto it = files_.find(name);
    if (it == files_.end()) {
        return false;
    }

    auto file = open_file(name);
    if (!file) {
        AgentLog::log("Registry", "Unwatching: " + it->second.path);
        files_.erase(it);
        return false;
    }

    it->second = std::move(*file);
    return true;
}

bool FileRegistry::remove(const std::string& name) {
    auto it = files_.find(name);
    if (it == files_.end()) {
        return false;
    }

    AgentLog::log("Registry", "Unwatching: " + it->second.path);
    files_.erase(it);
    return true;
}

void FileRegistry::close() {
    files_.clear();
}

WatchedFile* FileRegistry::find(const std::string& name) {
    auto it = files_.find(name);
    return it == files_.end() ? nullptr : &it->second;
}

const WatchedFile* FileRegistry::find(const std::string& name) const {
    auto it = files_.find(name);
    return it == files_.end() ? nullptr : &it->second;
}

std::vector<std::string> FileRegistry::names() const {
    std::vector<std::string> result;
    result.reserve(files_.size());
    for (const auto& [name, file] : files_) {
        result.push_back(name);
    }
    return result;
}

} // namespace log_collector
