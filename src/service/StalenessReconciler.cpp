#include "proxykeeper/service/StalenessReconciler.hpp"
#include "proxykeeper/util/Logging.hpp"

#include <exception>
#include <string>

namespace proxykeeper::service {

StalenessReconciler::StalenessReconciler(repository::ProxyRecordStore& store)
    : store_(store) {}

ReconcileOutcome StalenessReconciler::reconcileSource(int sourceId, TimePoint now, std::chrono::seconds staleAfter) {
    ReconcileOutcome outcome;
    outcome.sourceId = sourceId;

    auto latest = store_.latestTouch(sourceId);
    // A source whose proxies were never touched has had no activity at all.
    outcome.stale = !latest || now - *latest > staleAfter;
    if (!outcome.stale) {
        return outcome;
    }

    outcome.unblocked = store_.unblockAllForSource(sourceId);
    if (outcome.unblocked > 0) {
        util::log(util::LogLevel::info,
                  "Source " + std::to_string(sourceId) + " stale, unblocked " + std::to_string(outcome.unblocked) +
                      " proxies");
    }
    return outcome;
}

std::vector<ReconcileOutcome> StalenessReconciler::reconcileAll(TimePoint now, std::chrono::seconds staleAfter) {
    std::vector<ReconcileOutcome> outcomes;
    for (const auto& source : store_.listSources()) {
        try {
            outcomes.push_back(reconcileSource(source.id, now, staleAfter));
        } catch (const std::exception& ex) {
            util::log(util::LogLevel::error,
                      "Reconciliation of source " + std::to_string(source.id) + " failed: " + ex.what());
        }
    }
    return outcomes;
}

} // namespace proxykeeper::service
