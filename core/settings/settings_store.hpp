#pragma once

#include <mutex>
#include <nlohmann/json.hpp>
#include <string>

#include "common/status.hpp"

namespace proxyvisor {
namespace settings {

/**
 * @brief Flat key-value JSON document persisted next to the app data
 *
 * Values are arbitrary JSON. Every set() writes the whole document back
 * atomically (temp file + rename, mode 0600). A missing or unreadable file
 * yields an empty store.
 *
 * Thread safety: all methods lock internally.
 */
class SettingsStore {
public:
    // Empty path keeps the store in memory only
    explicit SettingsStore(std::string path = "");

    // (Re)load from disk. A missing file is not an error.
    common::Status load();

    bool contains(const std::string &key) const;

    // Returns `fallback` if the key is missing
    nlohmann::json get(const std::string &key, const nlohmann::json &fallback = nullptr) const;

    // Typed read; returns `fallback` if missing or of the wrong type
    template <typename T>
    T get_as(const std::string &key, const T &fallback) const {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = data_.find(key);
        if (it == data_.end()) {
            return fallback;
        }
        try {
            return it->template get<T>();
        } catch (const nlohmann::json::exception &) {
            return fallback;
        }
    }

    common::Status set(const std::string &key, nlohmann::json value);
    common::Status remove(const std::string &key);

    const std::string &path() const { return path_; }

private:
    common::Status save_locked() const;

    std::string path_;
    mutable std::mutex mutex_;
    nlohmann::json data_ = nlohmann::json::object();
};

}  // namespace settings
}  // namespace proxyvisor
