#include "settings_store.hpp"

#include <filesystem>

#include "common/file_util.hpp"
#include "logging/logger.hpp"

namespace proxyvisor {
namespace settings {

SettingsStore::SettingsStore(std::string path) : path_(std::move(path)) {}

common::Status SettingsStore::load() {
    std::lock_guard<std::mutex> lock(mutex_);
    data_ = nlohmann::json::object();
    if (path_.empty() || !std::filesystem::exists(path_)) {
        return common::Status::ok();
    }

    std::string contents;
    if (!common::read_file(path_, contents)) {
        return common::Status::error(common::ErrorCode::IO_ERROR, "Cannot read settings file " + path_);
    }

    try {
        auto parsed = nlohmann::json::parse(contents);
        if (!parsed.is_object()) {
            LOG_WARN("[Settings] " << path_ << " is not a JSON object, starting empty");
            return common::Status::ok();
        }
        data_ = std::move(parsed);
    } catch (const nlohmann::json::parse_error &e) {
        LOG_WARN("[Settings] Cannot parse " << path_ << ": " << e.what() << ", starting empty");
    }
    LOG_DEBUG("[Settings] Loaded " << data_.size() << " key(s) from " << path_);
    return common::Status::ok();
}

bool SettingsStore::contains(const std::string &key) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return data_.contains(key);
}

nlohmann::json SettingsStore::get(const std::string &key, const nlohmann::json &fallback) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = data_.find(key);
    if (it == data_.end()) {
        return fallback;
    }
    return *it;
}

common::Status SettingsStore::set(const std::string &key, nlohmann::json value) {
    std::lock_guard<std::mutex> lock(mutex_);
    data_[key] = std::move(value);
    return save_locked();
}

common::Status SettingsStore::remove(const std::string &key) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (data_.erase(key) == 0) {
        return common::Status::ok();
    }
    return save_locked();
}

common::Status SettingsStore::save_locked() const {
    if (path_.empty()) {
        return common::Status::ok();
    }
    auto status = common::write_file_atomic(path_, data_.dump(2) + "\n", 0600);
    if (!status) {
        LOG_ERROR("[Settings] " << status.message());
    }
    return status;
}

}  // namespace settings
}  // namespace proxyvisor
