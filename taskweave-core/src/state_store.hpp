/**
 * @file state_store.hpp
 * @brief Key/value stores for conversation state and the cost ledger
 *
 * Stores are external dependencies: the middleware always reaches them through
 * the Resilience Pipeline, so implementations may block or throw freely.
 * Failures should be reported as DependencyError so the retry layer can
 * classify them.
 */

#ifndef TASKWEAVE_STATE_STORE_HPP
#define TASKWEAVE_STATE_STORE_HPP

#include <nlohmann/json.hpp>
#include <filesystem>
#include <list>
#include <map>
#include <mutex>
#include <optional>
#include <string>

namespace taskweave {

/**
 * @brief Abstract key/value store
 */
class IStateStore {
public:
    virtual ~IStateStore() = default;

    virtual std::optional<nlohmann::json> get(const std::string& key) = 0;
    virtual void put(const std::string& key, const nlohmann::json& value) = 0;
};

struct StoreStats {
    size_t hits;
    size_t misses;
    size_t writes;
    size_t entries;
};

/**
 * @brief Bounded in-process store with LRU eviction
 */
class InMemoryStateStore : public IStateStore {
public:
    explicit InMemoryStateStore(size_t max_entries = 10000);

    std::optional<nlohmann::json> get(const std::string& key) override;
    void put(const std::string& key, const nlohmann::json& value) override;

    StoreStats get_stats() const;
    void clear();

private:
    void touch(const std::string& key);   // caller holds mutex_

    size_t max_entries_;
    mutable std::mutex mutex_;
    std::list<std::string> lru_list_;
    std::map<std::string, std::list<std::string>::iterator> lru_map_;
    std::map<std::string, nlohmann::json> entries_;
    size_t hits_;
    size_t misses_;
    size_t writes_;
};

/**
 * @brief Store persisting one JSON document per key under a directory
 *
 * Survives restarts. I/O failures surface as DependencyError("io").
 */
class FileStateStore : public IStateStore {
public:
    explicit FileStateStore(const std::string& directory);

    std::optional<nlohmann::json> get(const std::string& key) override;
    void put(const std::string& key, const nlohmann::json& value) override;

    const std::filesystem::path& directory() const { return directory_; }

private:
    std::filesystem::path path_for(const std::string& key) const;

    std::filesystem::path directory_;
    std::mutex mutex_;
};

} // namespace taskweave

#endif // TASKWEAVE_STATE_STORE_HPP
