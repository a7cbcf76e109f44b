#pragma once

#include "proxy/management_api.hpp"
#include "quota/quota_types.hpp"

namespace proxyvisor {
namespace quota {

/**
 * @brief Pluggable per-provider quota source
 *
 * fetch_all_quotas() runs on a worker thread and may block on network or
 * disk. It may throw; the pipeline isolates the failure to this provider.
 * An empty result means the provider has no connected accounts.
 */
class IQuotaFetcher {
public:
    virtual ~IQuotaFetcher() = default;

    virtual Provider provider() const = 0;

    // `api` is null when the proxy is not running
    virtual AccountQuotaMap fetch_all_quotas(proxy::IManagementApi *api) = 0;
};

}  // namespace quota
}  // namespace proxyvisor
