#pragma once

#include <chrono>
#include <optional>
#include <string>

namespace proxykeeper::model {

inline constexpr std::chrono::seconds kDefaultUsageCooldown{30};

struct Proxy {
    int id{};
    std::string address;
    int sourceId{};
    int providerId{};
    int priority{};
    bool blocked{};
    std::chrono::seconds usageCooldown{kDefaultUsageCooldown};
    // Empty until the first assignment or block-state change.
    std::optional<std::chrono::system_clock::time_point> lastTouched;
};

// Selection order: priority descending, then lowest id first.
inline bool preferredOver(const Proxy& lhs, const Proxy& rhs) {
    if (lhs.priority != rhs.priority) {
        return lhs.priority > rhs.priority;
    }
    return lhs.id < rhs.id;
}

} // namespace proxykeeper::model
