#pragma once

#include "proxykeeper/repository/ProxyRecordStore.hpp"

#include <chrono>
#include <cstddef>
#include <vector>

namespace proxykeeper::service {

inline constexpr std::chrono::seconds kDefaultStaleAfter{std::chrono::minutes{5}};

struct ReconcileOutcome {
    int sourceId{};
    bool stale{};
    std::size_t unblocked{};
};

// Gives every proxy of a quiet source a fresh chance. A source is quiet when
// no proxy of it has been touched for longer than `staleAfter`, which usually
// means all of them got blocked and traffic stalled.
class StalenessReconciler {
public:
    using TimePoint = std::chrono::system_clock::time_point;

    explicit StalenessReconciler(repository::ProxyRecordStore& store);

    ReconcileOutcome reconcileSource(int sourceId, TimePoint now, std::chrono::seconds staleAfter);

    // Runs every known source; a failure on one is logged and skipped.
    std::vector<ReconcileOutcome> reconcileAll(TimePoint now, std::chrono::seconds staleAfter);

private:
    repository::ProxyRecordStore& store_;
};

} // namespace proxykeeper::service
