#pragma once

#include <map>
#include <memory>
#include <mutex>

#include "quota/quota_types.hpp"

namespace proxyvisor {
namespace quota {

/**
 * @brief Shared ProviderQuotaMap
 *
 * Each provider's account map is an immutable snapshot. Writers swap the
 * pointer, so a reader holding a snapshot never sees a partially replaced
 * entry. Written only from the EventLoop thread; readable from any thread.
 */
class QuotaStore {
public:
    using Snapshot = std::shared_ptr<const AccountQuotaMap>;

    // Null if the provider has no entry
    Snapshot snapshot(Provider provider) const;

    std::map<Provider, Snapshot> snapshot_all() const;

    void replace(Provider provider, AccountQuotaMap accounts);

    // Returns true if an entry was removed
    bool remove(Provider provider);

    bool contains(Provider provider) const;
    size_t provider_count() const;

private:
    mutable std::mutex mutex_;
    std::map<Provider, Snapshot> entries_;
};

}  // namespace quota
}  // namespace proxyvisor
