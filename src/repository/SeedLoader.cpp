#include "proxykeeper/repository/SeedLoader.hpp"
#include "proxykeeper/util/JsonUtil.hpp"
#include "proxykeeper/util/Logging.hpp"

#include <chrono>
#include <exception>
#include <optional>
#include <string>
#include <utility>

namespace proxykeeper::repository {
namespace {

std::optional<int> resolveSource(const boost::json::object& entry, InMemoryProxyStore& store) {
    if (auto id = util::readInt(entry, "sourceId")) {
        if (store.findSource(static_cast<int>(*id))) {
            return static_cast<int>(*id);
        }
        return std::nullopt;
    }
    if (auto name = util::readString(entry, "source"); name && !name->empty()) {
        return store.addSource(*name).id;
    }
    return std::nullopt;
}

std::optional<int> resolveProvider(const boost::json::object& entry, InMemoryProxyStore& store) {
    if (auto id = util::readInt(entry, "providerId")) {
        if (store.findProvider(static_cast<int>(*id))) {
            return static_cast<int>(*id);
        }
        return std::nullopt;
    }
    if (auto name = util::readString(entry, "provider"); name && !name->empty()) {
        return store.addProvider(*name).id;
    }
    return std::nullopt;
}

} // namespace

SeedSummary loadSeed(const boost::json::value& seed, InMemoryProxyStore& store) {
    SeedSummary summary;
    if (!seed.is_object()) {
        util::log(util::LogLevel::warn, "Seed document is not a JSON object");
        return summary;
    }
    const auto& root = seed.as_object();

    if (auto it = root.if_contains("sources"); it && it->is_array()) {
        for (const auto& item : it->as_array()) {
            if (item.is_string()) {
                store.addSource(std::string(item.as_string()));
                ++summary.sources;
            }
        }
    }
    if (auto it = root.if_contains("providers"); it && it->is_array()) {
        for (const auto& item : it->as_array()) {
            if (item.is_string()) {
                store.addProvider(std::string(item.as_string()));
                ++summary.providers;
            }
        }
    }

    auto proxiesIt = root.if_contains("proxies");
    if (!proxiesIt || !proxiesIt->is_array()) {
        return summary;
    }
    for (const auto& item : proxiesIt->as_array()) {
        if (!item.is_object()) {
            ++summary.skipped;
            continue;
        }
        const auto& entry = item.as_object();
        auto address = util::readString(entry, "address");
        auto sourceId = resolveSource(entry, store);
        auto providerId = resolveProvider(entry, store);
        if (!address || address->empty() || !sourceId || !providerId) {
            util::log(util::LogLevel::warn, "Skipping seed proxy entry: " + util::stringifyJson(item));
            ++summary.skipped;
            continue;
        }

        model::Proxy proxy;
        proxy.id = static_cast<int>(util::readInt(entry, "id").value_or(0));
        proxy.address = *address;
        proxy.sourceId = *sourceId;
        proxy.providerId = *providerId;
        proxy.priority = static_cast<int>(util::readInt(entry, "priority").value_or(0));
        proxy.blocked = util::readBool(entry, "blocked").value_or(false);
        if (auto cooldown = util::readInt(entry, "usageCooldownSeconds"); cooldown && *cooldown >= 0) {
            proxy.usageCooldown = std::chrono::seconds{*cooldown};
        }
        store.addProxy(std::move(proxy));
        ++summary.proxies;
    }
    return summary;
}

SeedSummary loadSeedFile(const std::string& path, InMemoryProxyStore& store) {
    std::optional<boost::json::value> seed;
    try {
        seed = util::readJsonFile(path);
    } catch (const std::exception& ex) {
        util::log(util::LogLevel::warn, "Failed to parse seed file " + path + ": " + ex.what());
        return {};
    }
    if (!seed) {
        util::log(util::LogLevel::info, "No seed file at " + path);
        return {};
    }
    auto summary = loadSeed(*seed, store);
    util::log(util::LogLevel::info,
              "Seeded " + std::to_string(summary.sources) + " sources, " + std::to_string(summary.providers) +
                  " providers, " + std::to_string(summary.proxies) + " proxies (" +
                  std::to_string(summary.skipped) + " skipped) from " + path);
    return summary;
}

} // namespace proxykeeper::repository
