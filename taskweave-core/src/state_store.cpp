/**
 * @file state_store.cpp
 * @brief Implementation of the bundled state stores
 */

#include "state_store.hpp"
#include "errors.hpp"
#include <fstream>
#include <sstream>

namespace taskweave {

// ---------------------------------------------------------------------------
// InMemoryStateStore
// ---------------------------------------------------------------------------

InMemoryStateStore::InMemoryStateStore(size_t max_entries)
    : max_entries_(max_entries == 0 ? 1 : max_entries),
      hits_(0), misses_(0), writes_(0) {}

std::optional<nlohmann::json> InMemoryStateStore::get(const std::string& key) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = entries_.find(key);
    if (it == entries_.end()) {
        ++misses_;
        return std::nullopt;
    }
    ++hits_;
    touch(key);
    return it->second;
}

void InMemoryStateStore::put(const std::string& key, const nlohmann::json& value) {
    std::lock_guard<std::mutex> lock(mutex_);
    entries_[key] = value;
    ++writes_;
    touch(key);

    while (entries_.size() > max_entries_ && !lru_list_.empty()) {
        std::string victim = lru_list_.back();
        lru_list_.pop_back();
        lru_map_.erase(victim);
        entries_.erase(victim);
    }
}

void InMemoryStateStore::touch(const std::string& key) {
    auto it = lru_map_.find(key);
    if (it != lru_map_.end()) {
        lru_list_.erase(it->second);
    }
    lru_list_.push_front(key);
    lru_map_[key] = lru_list_.begin();
}

StoreStats InMemoryStateStore::get_stats() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return StoreStats{hits_, misses_, writes_, entries_.size()};
}

void InMemoryStateStore::clear() {
    std::lock_guard<std::mutex> lock(mutex_);
    entries_.clear();
    lru_list_.clear();
    lru_map_.clear();
}

// ---------------------------------------------------------------------------
// FileStateStore
// ---------------------------------------------------------------------------

FileStateStore::FileStateStore(const std::string& directory)
    : directory_(directory) {
    std::error_code ec;
    std::filesystem::create_directories(directory_, ec);
    if (ec) {
        throw ConfigurationError("Cannot create state directory " + directory + ": " + ec.message());
    }
}

std::filesystem::path FileStateStore::path_for(const std::string& key) const {
    // Keys contain ':' and '/' (e.g. "cost:conversation/42"); keep filenames flat
    std::string filename;
    filename.reserve(key.size());
    for (char c : key) {
        bool safe = (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') ||
                    (c >= '0' && c <= '9') || c == '-' || c == '.';
        filename += safe ? c : '_';
    }
    return directory_ / (filename + ".json");
}

std::optional<nlohmann::json> FileStateStore::get(const std::string& key) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto path = path_for(key);
    if (!std::filesystem::exists(path)) {
        return std::nullopt;
    }

    std::ifstream file(path);
    if (!file.is_open()) {
        throw DependencyError("io", "Failed to open state file: " + path.string());
    }

    try {
        return nlohmann::json::parse(file);
    } catch (const nlohmann::json::parse_error& e) {
        throw DependencyError("invalid_response",
                              "Corrupt state file " + path.string() + ": " + e.what());
    }
}

void FileStateStore::put(const std::string& key, const nlohmann::json& value) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto path = path_for(key);
    auto tmp_path = path;
    tmp_path += ".tmp";

    {
        std::ofstream file(tmp_path, std::ios::trunc);
        if (!file.is_open()) {
            throw DependencyError("io", "Failed to write state file: " + tmp_path.string());
        }
        file << value.dump();
        if (!file.good()) {
            throw DependencyError("io", "Short write to state file: " + tmp_path.string());
        }
    }

    std::error_code ec;
    std::filesystem::rename(tmp_path, path, ec);
    if (ec) {
        throw DependencyError("io", "Failed to commit state file " + path.string() + ": " + ec.message());
    }
}

} // namespace taskweave
