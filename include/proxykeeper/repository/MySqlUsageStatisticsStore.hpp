#pragma once

#include "proxykeeper/repository/MySqlConnectionPool.hpp"
#include "proxykeeper/repository/UsageStatisticsStore.hpp"

namespace proxykeeper::repository {

// Counters live in `usage_statistics` (unique on proxy_id, status_id); the
// per-report log lives in `proxy_reports`.
class MySqlUsageStatisticsStore : public UsageStatisticsStore {
public:
    explicit MySqlUsageStatisticsStore(MySqlConnectionPool& pool);

    std::int64_t recordOutcome(int proxyId, int statusCode, TimePoint reportedAt) override;
    std::vector<model::UsageStatistic> listForProxy(int proxyId) override;
    std::vector<model::OutcomeRecord> outcomesSince(int proxyId, TimePoint since) override;

private:
    MySqlConnectionPool& pool_;
};

} // namespace proxykeeper::repository
