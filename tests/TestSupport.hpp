#pragma once

#include "proxykeeper/repository/InMemoryProxyStore.hpp"
#include "proxykeeper/util/Clock.hpp"

#include <chrono>
#include <mutex>
#include <optional>
#include <string>

namespace proxykeeper::test {

// Clock the test moves by hand.
class ManualClock : public util::Clock {
public:
    ManualClock()
        : now_(std::chrono::system_clock::time_point{} + std::chrono::hours(24 * 365 * 50)) {}

    util::TimePoint now() const override {
        std::scoped_lock lock(mutex_);
        return now_;
    }

    void advance(std::chrono::system_clock::duration delta) {
        std::scoped_lock lock(mutex_);
        now_ += delta;
    }

    void set(util::TimePoint value) {
        std::scoped_lock lock(mutex_);
        now_ = value;
    }

private:
    mutable std::mutex mutex_;
    util::TimePoint now_;
};

inline model::Proxy makeProxy(int sourceId,
                              int providerId,
                              int priority,
                              std::optional<util::TimePoint> lastTouched = std::nullopt,
                              bool blocked = false,
                              std::chrono::seconds cooldown = std::chrono::seconds(30)) {
    static int counter = 0;
    model::Proxy proxy;
    proxy.address = "10.0.0." + std::to_string(++counter) + ":3128";
    proxy.sourceId = sourceId;
    proxy.providerId = providerId;
    proxy.priority = priority;
    proxy.blocked = blocked;
    proxy.usageCooldown = cooldown;
    proxy.lastTouched = lastTouched;
    return proxy;
}

} // namespace proxykeeper::test
