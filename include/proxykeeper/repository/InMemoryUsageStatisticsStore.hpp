#pragma once

#include "proxykeeper/repository/UsageStatisticsStore.hpp"

#include <cstddef>
#include <deque>
#include <map>
#include <mutex>
#include <unordered_map>
#include <utility>

namespace proxykeeper::repository {

class InMemoryUsageStatisticsStore : public UsageStatisticsStore {
public:
    // Oldest outcome records beyond this count are dropped per proxy.
    explicit InMemoryUsageStatisticsStore(std::size_t maxOutcomesPerProxy = 1024);

    std::int64_t recordOutcome(int proxyId, int statusCode, TimePoint reportedAt) override;
    std::vector<model::UsageStatistic> listForProxy(int proxyId) override;
    std::vector<model::OutcomeRecord> outcomesSince(int proxyId, TimePoint since) override;

private:
    std::size_t maxOutcomesPerProxy_;
    std::mutex mutex_;
    std::map<std::pair<int, int>, model::UsageStatistic> counters_;
    std::unordered_map<int, std::deque<model::OutcomeRecord>> outcomes_;
    int nextId_{1};
};

} // namespace proxykeeper::repository
