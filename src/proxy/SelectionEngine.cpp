#include "proxykeeper/proxy/SelectionEngine.hpp"
#include "proxykeeper/util/Errors.hpp"
#include "proxykeeper/util/Logging.hpp"

#include <string>

namespace proxykeeper::proxy {

SelectionEngine::SelectionEngine(repository::ProxyRecordStore& store, const util::Clock& clock)
    : store_(store)
    , clock_(clock) {}

std::optional<ProxyHandle> SelectionEngine::acquire(int sourceId) {
    if (!store_.findSource(sourceId)) {
        throw util::NotFoundError("Source " + std::to_string(sourceId) + " does not exist");
    }

    auto candidates = store_.listEligible(sourceId);
    for (const auto& candidate : candidates) {
        const auto now = clock_.now();
        auto outcome = store_.markAssigned(candidate.id, now);
        if (outcome != repository::AssignOutcome::assigned) {
            util::log(util::LogLevel::trace,
                      "Proxy " + std::to_string(candidate.id) + " skipped: " + repository::toString(outcome));
            continue;
        }

        ProxyHandle handle;
        handle.proxyId = candidate.id;
        handle.address = candidate.address;
        handle.sourceId = candidate.sourceId;
        handle.providerId = candidate.providerId;
        handle.priority = candidate.priority;
        handle.usageCooldown = candidate.usageCooldown;
        handle.assignedAt = now;
        util::log(util::LogLevel::debug,
                  "Assigned proxy " + std::to_string(handle.proxyId) + " (" + handle.address + ") to source " +
                      std::to_string(sourceId));
        return handle;
    }

    util::log(util::LogLevel::debug,
              "Source " + std::to_string(sourceId) + " exhausted (" + std::to_string(candidates.size()) +
                  " eligible, all cooling down)");
    return std::nullopt;
}

} // namespace proxykeeper::proxy
