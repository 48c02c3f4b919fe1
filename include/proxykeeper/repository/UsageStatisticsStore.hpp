#pragma once

#include "proxykeeper/model/UsageStatistic.hpp"

#include <chrono>
#include <cstdint>
#include <vector>

namespace proxykeeper::repository {

class UsageStatisticsStore {
public:
    using TimePoint = std::chrono::system_clock::time_point;

    virtual ~UsageStatisticsStore() = default;

    // Increments the (proxy, status) counter and appends an outcome record.
    // Returns the counter value after the increment. Backends that can see the
    // proxy table throw util::NotFoundError when the proxy is gone.
    virtual std::int64_t recordOutcome(int proxyId, int statusCode, TimePoint reportedAt) = 0;

    virtual std::vector<model::UsageStatistic> listForProxy(int proxyId) = 0;

    // Outcomes reported at or after `since`, oldest first.
    virtual std::vector<model::OutcomeRecord> outcomesSince(int proxyId, TimePoint since) = 0;
};

} // namespace proxykeeper::repository
