#include "proxykeeper/repository/InMemoryUsageStatisticsStore.hpp"

#include <algorithm>
#include <limits>

namespace proxykeeper::repository {

InMemoryUsageStatisticsStore::InMemoryUsageStatisticsStore(std::size_t maxOutcomesPerProxy)
    : maxOutcomesPerProxy_(std::max<std::size_t>(1, maxOutcomesPerProxy)) {}

std::int64_t InMemoryUsageStatisticsStore::recordOutcome(int proxyId, int statusCode, TimePoint reportedAt) {
    std::scoped_lock lock(mutex_);
    auto key = std::make_pair(proxyId, statusCode);
    auto it = counters_.find(key);
    if (it == counters_.end()) {
        model::UsageStatistic statistic;
        statistic.id = nextId_++;
        statistic.proxyId = proxyId;
        statistic.statusCode = statusCode;
        it = counters_.emplace(key, statistic).first;
    }
    it->second.counter += 1;

    auto& history = outcomes_[proxyId];
    // Reports can arrive slightly out of order from concurrent workers.
    model::OutcomeRecord record{proxyId, statusCode, reportedAt};
    auto pos = std::upper_bound(history.begin(), history.end(), record,
                                [](const model::OutcomeRecord& lhs, const model::OutcomeRecord& rhs) {
                                    return lhs.reportedAt < rhs.reportedAt;
                                });
    history.insert(pos, record);
    while (history.size() > maxOutcomesPerProxy_) {
        history.pop_front();
    }
    return it->second.counter;
}

std::vector<model::UsageStatistic> InMemoryUsageStatisticsStore::listForProxy(int proxyId) {
    std::scoped_lock lock(mutex_);
    std::vector<model::UsageStatistic> result;
    auto it = counters_.lower_bound(std::make_pair(proxyId, std::numeric_limits<int>::min()));
    for (; it != counters_.end() && it->first.first == proxyId; ++it) {
        result.push_back(it->second);
    }
    return result;
}

std::vector<model::OutcomeRecord> InMemoryUsageStatisticsStore::outcomesSince(int proxyId, TimePoint since) {
    std::scoped_lock lock(mutex_);
    std::vector<model::OutcomeRecord> result;
    auto it = outcomes_.find(proxyId);
    if (it == outcomes_.end()) {
        return result;
    }
    for (const auto& record : it->second) {
        if (record.reportedAt >= since) {
            result.push_back(record);
        }
    }
    return result;
}

} // namespace proxykeeper::repository
