#pragma once

#include "proxykeeper/model/StatusOutcome.hpp"

#include <map>
#include <optional>
#include <string>
#include <vector>

namespace proxykeeper::proxy {

// Reported when the caller could not reach the target through the proxy at all.
inline constexpr int kTransportFailureStatus = 599;

// Immutable set of known status outcomes. Safe to share between threads.
class StatusCatalog {
public:
    // Standard HTTP codes 100..511 plus kTransportFailureStatus.
    static StatusCatalog defaults();

    explicit StatusCatalog(const std::vector<model::StatusOutcome>& outcomes);

    bool contains(int code) const;
    std::optional<std::string> describe(int code) const;
    std::size_t size() const noexcept { return outcomes_.size(); }

    static bool isFailure(int code) noexcept { return code >= 400; }

private:
    std::map<int, std::string> outcomes_;
};

} // namespace proxykeeper::proxy
