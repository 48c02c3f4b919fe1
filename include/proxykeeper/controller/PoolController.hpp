#pragma once

#include "proxykeeper/proxy/SelectionEngine.hpp"
#include "proxykeeper/proxy/StatusCatalog.hpp"
#include "proxykeeper/repository/ProxyRecordStore.hpp"
#include "proxykeeper/server/Router.hpp"
#include "proxykeeper/service/HealthTracker.hpp"
#include "proxykeeper/service/TaskScheduler.hpp"
#include "proxykeeper/util/Clock.hpp"

namespace proxykeeper::controller {

class PoolController {
public:
    PoolController(proxy::SelectionEngine& engine,
                   service::HealthTracker& tracker,
                   service::TaskScheduler& scheduler,
                   repository::ProxyRecordStore& store,
                   const proxy::StatusCatalog& catalog,
                   const util::Clock& clock);

    void registerRoutes(proxykeeper::server::Router& router);

private:
    void handleHealth(proxykeeper::server::RequestContext& ctx);
    void handleListSources(proxykeeper::server::RequestContext& ctx);
    void handleNextProxy(proxykeeper::server::RequestContext& ctx);
    void handleListProxies(proxykeeper::server::RequestContext& ctx);
    void handleReport(proxykeeper::server::RequestContext& ctx);
    void handleStatistics(proxykeeper::server::RequestContext& ctx);
    void handleSetBlocked(proxykeeper::server::RequestContext& ctx);
    void handleReconcile(proxykeeper::server::RequestContext& ctx);

    proxy::SelectionEngine& engine_;
    service::HealthTracker& tracker_;
    service::TaskScheduler& scheduler_;
    repository::ProxyRecordStore& store_;
    const proxy::StatusCatalog& catalog_;
    const util::Clock& clock_;
};

} // namespace proxykeeper::controller
