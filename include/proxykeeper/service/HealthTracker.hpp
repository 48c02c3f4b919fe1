#pragma once

#include "proxykeeper/proxy/BlockingPolicy.hpp"
#include "proxykeeper/proxy/StatusCatalog.hpp"
#include "proxykeeper/repository/ProxyRecordStore.hpp"
#include "proxykeeper/repository/UsageStatisticsStore.hpp"
#include "proxykeeper/util/Clock.hpp"

#include <chrono>
#include <cstdint>
#include <string>
#include <vector>

namespace proxykeeper::service {

struct ReportResult {
    int proxyId{};
    int statusCode{};
    std::int64_t counter{};
    bool blocked{};
    bool newlyBlocked{};
    std::string reason;
};

class HealthTracker {
public:
    HealthTracker(repository::ProxyRecordStore& proxies,
                  repository::UsageStatisticsStore& statistics,
                  const proxy::StatusCatalog& catalog,
                  proxy::BlockingPolicy policy,
                  const util::Clock& clock);

    // Throws util::UnknownStatusError before touching any state when the
    // status is not catalogued, util::NotFoundError for an unknown proxy.
    ReportResult report(int proxyId, int statusCode);

    // Share of outcomes reported within `window` that are failures (>= 400).
    double failureRatio(int proxyId, std::chrono::seconds window);

    std::vector<model::UsageStatistic> statistics(int proxyId);

    const proxy::BlockingPolicy& policy() const noexcept { return policy_; }

private:
    repository::ProxyRecordStore& proxies_;
    repository::UsageStatisticsStore& statistics_;
    const proxy::StatusCatalog& catalog_;
    proxy::BlockingPolicy policy_;
    const util::Clock& clock_;
};

} // namespace proxykeeper::service
