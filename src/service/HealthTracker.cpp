#include "proxykeeper/service/HealthTracker.hpp"
#include "proxykeeper/util/Errors.hpp"
#include "proxykeeper/util/Logging.hpp"

#include <utility>

namespace proxykeeper::service {

HealthTracker::HealthTracker(repository::ProxyRecordStore& proxies,
                             repository::UsageStatisticsStore& statistics,
                             const proxy::StatusCatalog& catalog,
                             proxy::BlockingPolicy policy,
                             const util::Clock& clock)
    : proxies_(proxies)
    , statistics_(statistics)
    , catalog_(catalog)
    , policy_(std::move(policy))
    , clock_(clock) {}

ReportResult HealthTracker::report(int proxyId, int statusCode) {
    if (!catalog_.contains(statusCode)) {
        util::log(util::LogLevel::warn,
                  "Rejected report for proxy " + std::to_string(proxyId) + ": unknown status " +
                      std::to_string(statusCode));
        throw util::UnknownStatusError(statusCode);
    }
    auto proxy = proxies_.get(proxyId);
    if (!proxy) {
        throw util::NotFoundError("Proxy " + std::to_string(proxyId) + " does not exist");
    }

    const auto now = clock_.now();
    ReportResult result;
    result.proxyId = proxyId;
    result.statusCode = statusCode;
    result.counter = statistics_.recordOutcome(proxyId, statusCode, now);
    result.blocked = proxy->blocked;

    auto history = statistics_.outcomesSince(proxyId, now - policy_.config().window);
    auto decision = policy_.evaluate(history);
    if (decision.block && !proxy->blocked) {
        if (!proxies_.setBlocked(proxyId, true, now)) {
            throw util::NotFoundError("Proxy " + std::to_string(proxyId) + " disappeared while blocking");
        }
        result.blocked = true;
        result.newlyBlocked = true;
        util::log(util::LogLevel::warn,
                  "Proxy " + std::to_string(proxyId) + " (" + proxy->address + ") blocked: " + decision.reason);
    }
    result.reason = std::move(decision.reason);
    return result;
}

double HealthTracker::failureRatio(int proxyId, std::chrono::seconds window) {
    auto history = statistics_.outcomesSince(proxyId, clock_.now() - window);
    return proxy::BlockingPolicy::failureRatio(history);
}

std::vector<model::UsageStatistic> HealthTracker::statistics(int proxyId) {
    return statistics_.listForProxy(proxyId);
}

} // namespace proxykeeper::service
