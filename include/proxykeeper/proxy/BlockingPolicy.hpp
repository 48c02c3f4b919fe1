#pragma once

#include "proxykeeper/model/UsageStatistic.hpp"
#include "proxykeeper/proxy/StatusCatalog.hpp"

#include <chrono>
#include <cstddef>
#include <set>
#include <string>
#include <vector>

namespace proxykeeper::proxy {

struct BlockDecision {
    bool block{};
    std::string reason;
};

// Decides whether a proxy should be excluded from selection given the
// outcomes reported for it inside the policy window. Never unblocks.
class BlockingPolicy {
public:
    struct Config {
        // A single report with this status blocks immediately.
        int transportFailureStatus{kTransportFailureStatus};
        // Statuses that implicate the proxy rather than the target site.
        std::set<int> blockingStatuses{403, 407, 429, 500, 502, 503, 504};
        std::size_t failureThreshold{3};
        double maxFailureRatio{0.8};
        std::size_t minSamples{10};
        std::chrono::seconds window{std::chrono::minutes{10}};
    };

    BlockingPolicy();
    explicit BlockingPolicy(Config config);

    // `history` is ordered oldest first and ends with the outcome that was
    // just reported.
    BlockDecision evaluate(const std::vector<model::OutcomeRecord>& history) const;

    const Config& config() const noexcept { return config_; }

    static double failureRatio(const std::vector<model::OutcomeRecord>& history);

private:
    bool isBlockingStatus(int code) const;

    Config config_;
};

} // namespace proxykeeper::proxy
