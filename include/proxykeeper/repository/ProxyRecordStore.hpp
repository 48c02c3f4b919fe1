#pragma once

#include "proxykeeper/model/Provider.hpp"
#include "proxykeeper/model/Proxy.hpp"
#include "proxykeeper/model/Source.hpp"

#include <chrono>
#include <cstddef>
#include <optional>
#include <vector>

namespace proxykeeper::repository {

enum class AssignOutcome {
    assigned,
    conflict,
    notFound
};

const char* toString(AssignOutcome outcome) noexcept;

// Table of proxy records plus the source/provider rows they reference.
// Each mutating call is atomic for one proxy, or for one source's batch in
// unblockAllForSource. Implementations throw util::UnavailableError when the
// backing storage cannot be reached.
class ProxyRecordStore {
public:
    using TimePoint = std::chrono::system_clock::time_point;

    virtual ~ProxyRecordStore() = default;

    virtual std::optional<model::Proxy> get(int proxyId) = 0;

    // Unblocked proxies of the source, priority descending then id ascending.
    virtual std::vector<model::Proxy> listEligible(int sourceId) = 0;

    // Every proxy of the source in the same order as listEligible.
    virtual std::vector<model::Proxy> listBySource(int sourceId) = 0;

    // Sets lastTouched to now when the proxy is unblocked and its cooldown
    // has elapsed since the previous lastTouched; conflict otherwise.
    virtual AssignOutcome markAssigned(int proxyId, TimePoint now) = 0;

    // Returns false when the proxy does not exist. Refreshes lastTouched.
    virtual bool setBlocked(int proxyId, bool blocked, TimePoint now) = 0;

    // Clears the blocked flag on every proxy of the source, leaving
    // lastTouched alone. Returns how many flags actually changed.
    virtual std::size_t unblockAllForSource(int sourceId) = 0;

    virtual std::optional<TimePoint> latestTouch(int sourceId) = 0;

    virtual std::optional<model::Source> findSource(int sourceId) = 0;
    virtual std::vector<model::Source> listSources() = 0;
    virtual std::optional<model::Provider> findProvider(int providerId) = 0;
};

} // namespace proxykeeper::repository
