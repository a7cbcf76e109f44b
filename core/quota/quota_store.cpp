#include "quota_store.hpp"

namespace proxyvisor {
namespace quota {

QuotaStore::Snapshot QuotaStore::snapshot(Provider provider) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = entries_.find(provider);
    if (it == entries_.end()) {
        return nullptr;
    }
    return it->second;
}

std::map<Provider, QuotaStore::Snapshot> QuotaStore::snapshot_all() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return entries_;
}

void QuotaStore::replace(Provider provider, AccountQuotaMap accounts) {
    auto fresh = std::make_shared<const AccountQuotaMap>(std::move(accounts));
    std::lock_guard<std::mutex> lock(mutex_);
    entries_[provider] = std::move(fresh);
}

bool QuotaStore::remove(Provider provider) {
    std::lock_guard<std::mutex> lock(mutex_);
    return entries_.erase(provider) > 0;
}

bool QuotaStore::contains(Provider provider) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return entries_.count(provider) > 0;
}

size_t QuotaStore::provider_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return entries_.size();
}

}  // namespace quota
}  // namespace proxyvisor
