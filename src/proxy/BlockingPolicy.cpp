#include "proxykeeper/proxy/BlockingPolicy.hpp"

#include <algorithm>
#include <iomanip>
#include <sstream>
#include <utility>

namespace proxykeeper::proxy {

BlockingPolicy::BlockingPolicy()
    : BlockingPolicy(Config{}) {}

BlockingPolicy::BlockingPolicy(Config config)
    : config_(std::move(config)) {
    config_.failureThreshold = std::max<std::size_t>(1, config_.failureThreshold);
    config_.minSamples = std::max<std::size_t>(1, config_.minSamples);
}

bool BlockingPolicy::isBlockingStatus(int code) const {
    return config_.blockingStatuses.count(code) > 0;
}

double BlockingPolicy::failureRatio(const std::vector<model::OutcomeRecord>& history) {
    if (history.empty()) {
        return 0.0;
    }
    auto failures = std::count_if(history.begin(), history.end(), [](const model::OutcomeRecord& record) {
        return StatusCatalog::isFailure(record.statusCode);
    });
    return static_cast<double>(failures) / static_cast<double>(history.size());
}

BlockDecision BlockingPolicy::evaluate(const std::vector<model::OutcomeRecord>& history) const {
    if (history.empty()) {
        return {};
    }
    const int latest = history.back().statusCode;

    if (latest == config_.transportFailureStatus) {
        return {true, "transport failure reported (" + std::to_string(latest) + ")"};
    }
    if (!StatusCatalog::isFailure(latest)) {
        return {};
    }

    if (isBlockingStatus(latest)) {
        auto blocking = static_cast<std::size_t>(
            std::count_if(history.begin(), history.end(),
                          [this](const model::OutcomeRecord& record) { return isBlockingStatus(record.statusCode); }));
        if (blocking >= config_.failureThreshold) {
            return {true, std::to_string(blocking) + " proxy-implicating failures in window, latest " +
                              std::to_string(latest)};
        }
    }

    if (history.size() >= config_.minSamples) {
        double ratio = failureRatio(history);
        if (ratio >= config_.maxFailureRatio) {
            std::ostringstream reason;
            reason << "failure ratio " << std::fixed << std::setprecision(2) << ratio << " over "
                   << history.size() << " outcomes";
            return {true, reason.str()};
        }
    }
    return {};
}

} // namespace proxykeeper::proxy
