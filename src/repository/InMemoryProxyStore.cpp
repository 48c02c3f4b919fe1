#include "proxykeeper/repository/InMemoryProxyStore.hpp"
#include "proxykeeper/util/Errors.hpp"

#include <algorithm>
#include <string>
#include <utility>

namespace proxykeeper::repository {
namespace {

bool cooldownElapsed(const model::Proxy& proxy, ProxyRecordStore::TimePoint now) {
    if (!proxy.lastTouched) {
        return true;
    }
    return now - *proxy.lastTouched >= proxy.usageCooldown;
}

} // namespace

model::Source InMemoryProxyStore::addSource(const std::string& name) {
    std::scoped_lock lock(mutex_);
    auto existing = std::find_if(sources_.begin(), sources_.end(),
                                 [&](const auto& entry) { return entry.second.name == name; });
    if (existing != sources_.end()) {
        return existing->second;
    }
    model::Source source{nextSourceId_++, name};
    sources_.emplace(source.id, source);
    return source;
}

model::Provider InMemoryProxyStore::addProvider(const std::string& name) {
    std::scoped_lock lock(mutex_);
    auto existing = std::find_if(providers_.begin(), providers_.end(),
                                 [&](const auto& entry) { return entry.second.name == name; });
    if (existing != providers_.end()) {
        return existing->second;
    }
    model::Provider provider{nextProviderId_++, name};
    providers_.emplace(provider.id, provider);
    return provider;
}

model::Proxy InMemoryProxyStore::addProxy(model::Proxy proxy) {
    std::scoped_lock lock(mutex_);
    if (sources_.find(proxy.sourceId) == sources_.end()) {
        throw util::NotFoundError("Source " + std::to_string(proxy.sourceId) + " does not exist");
    }
    if (providers_.find(proxy.providerId) == providers_.end()) {
        throw util::NotFoundError("Provider " + std::to_string(proxy.providerId) + " does not exist");
    }
    if (proxy.id == 0) {
        proxy.id = nextProxyId_;
    }
    nextProxyId_ = std::max(nextProxyId_, proxy.id + 1);
    proxies_[proxy.id] = proxy;
    return proxy;
}

std::size_t InMemoryProxyStore::proxyCount() const {
    std::scoped_lock lock(mutex_);
    return proxies_.size();
}

std::optional<model::Proxy> InMemoryProxyStore::get(int proxyId) {
    std::scoped_lock lock(mutex_);
    auto it = proxies_.find(proxyId);
    if (it == proxies_.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::vector<model::Proxy> InMemoryProxyStore::collect(int sourceId, bool eligibleOnly) const {
    std::vector<model::Proxy> result;
    for (const auto& [id, proxy] : proxies_) {
        if (proxy.sourceId != sourceId) {
            continue;
        }
        if (eligibleOnly && proxy.blocked) {
            continue;
        }
        result.push_back(proxy);
    }
    std::stable_sort(result.begin(), result.end(), model::preferredOver);
    return result;
}

std::vector<model::Proxy> InMemoryProxyStore::listEligible(int sourceId) {
    std::scoped_lock lock(mutex_);
    return collect(sourceId, true);
}

std::vector<model::Proxy> InMemoryProxyStore::listBySource(int sourceId) {
    std::scoped_lock lock(mutex_);
    return collect(sourceId, false);
}

AssignOutcome InMemoryProxyStore::markAssigned(int proxyId, TimePoint now) {
    std::scoped_lock lock(mutex_);
    auto it = proxies_.find(proxyId);
    if (it == proxies_.end()) {
        return AssignOutcome::notFound;
    }
    auto& proxy = it->second;
    if (proxy.blocked || !cooldownElapsed(proxy, now)) {
        return AssignOutcome::conflict;
    }
    proxy.lastTouched = now;
    return AssignOutcome::assigned;
}

bool InMemoryProxyStore::setBlocked(int proxyId, bool blocked, TimePoint now) {
    std::scoped_lock lock(mutex_);
    auto it = proxies_.find(proxyId);
    if (it == proxies_.end()) {
        return false;
    }
    it->second.blocked = blocked;
    it->second.lastTouched = now;
    return true;
}

std::size_t InMemoryProxyStore::unblockAllForSource(int sourceId) {
    std::scoped_lock lock(mutex_);
    std::size_t changed = 0;
    for (auto& [id, proxy] : proxies_) {
        if (proxy.sourceId == sourceId && proxy.blocked) {
            proxy.blocked = false;
            ++changed;
        }
    }
    return changed;
}

std::optional<ProxyRecordStore::TimePoint> InMemoryProxyStore::latestTouch(int sourceId) {
    std::scoped_lock lock(mutex_);
    std::optional<TimePoint> latest;
    for (const auto& [id, proxy] : proxies_) {
        if (proxy.sourceId != sourceId || !proxy.lastTouched) {
            continue;
        }
        if (!latest || *proxy.lastTouched > *latest) {
            latest = proxy.lastTouched;
        }
    }
    return latest;
}

std::optional<model::Source> InMemoryProxyStore::findSource(int sourceId) {
    std::scoped_lock lock(mutex_);
    auto it = sources_.find(sourceId);
    if (it == sources_.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::vector<model::Source> InMemoryProxyStore::listSources() {
    std::scoped_lock lock(mutex_);
    std::vector<model::Source> result;
    result.reserve(sources_.size());
    for (const auto& [id, source] : sources_) {
        result.push_back(source);
    }
    return result;
}

std::optional<model::Provider> InMemoryProxyStore::findProvider(int providerId) {
    std::scoped_lock lock(mutex_);
    auto it = providers_.find(providerId);
    if (it == providers_.end()) {
        return std::nullopt;
    }
    return it->second;
}

} // namespace proxykeeper::repository
