#pragma once

#include "proxykeeper/repository/InMemoryProxyStore.hpp"

#include <boost/json.hpp>

#include <cstddef>
#include <string>

namespace proxykeeper::repository {

struct SeedSummary {
    std::size_t sources{};
    std::size_t providers{};
    std::size_t proxies{};
    std::size_t skipped{};
};

// Seed layout:
// {
//   "sources":   ["shop-a", ...],
//   "providers": ["vendor-x", ...],
//   "proxies":   [{"address": "10.0.0.1:8080", "source": "shop-a",
//                  "provider": "vendor-x", "priority": 100,
//                  "blocked": false, "usageCooldownSeconds": 30}, ...]
// }
// Proxies naming an unknown source or provider register that name first.
// Malformed proxy entries are skipped with a warning.
SeedSummary loadSeed(const boost::json::value& seed, InMemoryProxyStore& store);

// Missing file yields an empty summary.
SeedSummary loadSeedFile(const std::string& path, InMemoryProxyStore& store);

} // namespace proxykeeper::repository
