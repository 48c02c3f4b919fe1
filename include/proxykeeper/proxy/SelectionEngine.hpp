#pragma once

#include "proxykeeper/repository/ProxyRecordStore.hpp"
#include "proxykeeper/util/Clock.hpp"

#include <chrono>
#include <optional>
#include <string>

namespace proxykeeper::proxy {

struct ProxyHandle {
    int proxyId{};
    std::string address;
    int sourceId{};
    int providerId{};
    int priority{};
    std::chrono::seconds usageCooldown{};
    std::chrono::system_clock::time_point assignedAt{};
};

class SelectionEngine {
public:
    SelectionEngine(repository::ProxyRecordStore& store, const util::Clock& clock);

    // Highest-priority unblocked proxy of the source whose cooldown has
    // elapsed, claimed through ProxyRecordStore::markAssigned. std::nullopt
    // means the source is exhausted for now; the call never waits.
    // Throws util::NotFoundError for an unknown source.
    std::optional<ProxyHandle> acquire(int sourceId);

private:
    repository::ProxyRecordStore& store_;
    const util::Clock& clock_;
};

} // namespace proxykeeper::proxy
