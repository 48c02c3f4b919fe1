#pragma once

#include "proxykeeper/repository/ProxyRecordStore.hpp"

#include <map>
#include <mutex>
#include <string>

namespace proxykeeper::repository {

// Process-local arena of proxy records keyed by id. One mutex serialises
// every operation, which gives the per-proxy linearisation the contract asks
// for without holding the lock across calls.
class InMemoryProxyStore : public ProxyRecordStore {
public:
    InMemoryProxyStore() = default;

    // Name is unique; adding an existing name returns the stored row.
    model::Source addSource(const std::string& name);
    model::Provider addProvider(const std::string& name);

    // Assigns the next id when proxy.id is 0. Throws util::NotFoundError for
    // an unknown source or provider.
    model::Proxy addProxy(model::Proxy proxy);

    std::size_t proxyCount() const;

    std::optional<model::Proxy> get(int proxyId) override;
    std::vector<model::Proxy> listEligible(int sourceId) override;
    std::vector<model::Proxy> listBySource(int sourceId) override;
    AssignOutcome markAssigned(int proxyId, TimePoint now) override;
    bool setBlocked(int proxyId, bool blocked, TimePoint now) override;
    std::size_t unblockAllForSource(int sourceId) override;
    std::optional<TimePoint> latestTouch(int sourceId) override;
    std::optional<model::Source> findSource(int sourceId) override;
    std::vector<model::Source> listSources() override;
    std::optional<model::Provider> findProvider(int providerId) override;

private:
    std::vector<model::Proxy> collect(int sourceId, bool eligibleOnly) const;

    mutable std::mutex mutex_;
    std::map<int, model::Source> sources_;
    std::map<int, model::Provider> providers_;
    std::map<int, model::Proxy> proxies_;
    int nextSourceId_{1};
    int nextProviderId_{1};
    int nextProxyId_{1};
};

} // namespace proxykeeper::repository
