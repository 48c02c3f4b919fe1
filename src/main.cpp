#include "proxykeeper/config/AppConfig.hpp"
#include "proxykeeper/controller/PoolController.hpp"
#include "proxykeeper/proxy/BlockingPolicy.hpp"
#include "proxykeeper/proxy/SelectionEngine.hpp"
#include "proxykeeper/proxy/StatusCatalog.hpp"
#include "proxykeeper/repository/InMemoryProxyStore.hpp"
#include "proxykeeper/repository/InMemoryUsageStatisticsStore.hpp"
#include "proxykeeper/repository/MySqlConnectionPool.hpp"
#include "proxykeeper/repository/MySqlProxyStore.hpp"
#include "proxykeeper/repository/MySqlUsageStatisticsStore.hpp"
#include "proxykeeper/repository/SeedLoader.hpp"
#include "proxykeeper/repository/StatusRepository.hpp"
#include "proxykeeper/server/HttpServer.hpp"
#include "proxykeeper/server/Router.hpp"
#include "proxykeeper/service/HealthTracker.hpp"
#include "proxykeeper/service/StalenessReconciler.hpp"
#include "proxykeeper/service/TaskScheduler.hpp"
#include "proxykeeper/util/Clock.hpp"
#include "proxykeeper/util/Logging.hpp"

#include <boost/asio/io_context.hpp>
#include <boost/asio/signal_set.hpp>
#include <boost/asio/thread_pool.hpp>

#include <algorithm>
#include <csignal>
#include <exception>
#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <thread>
#include <vector>

namespace {
using namespace proxykeeper;

struct Stores {
    std::unique_ptr<repository::MySqlConnectionPool> connectionPool;
    std::unique_ptr<repository::ProxyRecordStore> proxies;
    std::unique_ptr<repository::UsageStatisticsStore> statistics;
    std::optional<proxy::StatusCatalog> catalog;
};

Stores openMySqlStores(const repository::DatabaseConfig& dbConfig) {
    util::log(util::LogLevel::info,
              "Connecting to MySQL " + dbConfig.host + ":" + std::to_string(dbConfig.port) + "/" + dbConfig.database);
    Stores stores;
    stores.connectionPool = std::make_unique<repository::MySqlConnectionPool>(dbConfig);
    stores.proxies = std::make_unique<repository::MySqlProxyStore>(*stores.connectionPool);
    stores.statistics = std::make_unique<repository::MySqlUsageStatisticsStore>(*stores.connectionPool);

    repository::StatusRepository statuses{*stores.connectionPool};
    auto outcomes = statuses.findAll();
    if (outcomes.empty()) {
        util::log(util::LogLevel::warn, "statuses table is empty, using the built-in catalog");
        stores.catalog = proxy::StatusCatalog::defaults();
    } else {
        stores.catalog.emplace(outcomes);
    }
    return stores;
}

Stores openMemoryStores(const std::string& seedFile) {
    Stores stores;
    auto proxies = std::make_unique<repository::InMemoryProxyStore>();
    if (!seedFile.empty()) {
        auto summary = repository::loadSeedFile(seedFile, *proxies);
        util::log(util::LogLevel::info,
                  "Seeded " + std::to_string(summary.proxies) + " proxies across " +
                      std::to_string(summary.sources) + " sources from " + seedFile +
                      (summary.skipped ? " (" + std::to_string(summary.skipped) + " skipped)" : std::string{}));
    } else {
        util::log(util::LogLevel::warn, "No seed file configured, in-memory pool starts empty");
    }
    stores.proxies = std::move(proxies);
    stores.statistics = std::make_unique<repository::InMemoryUsageStatisticsStore>();
    stores.catalog = proxy::StatusCatalog::defaults();
    return stores;
}

} // namespace

int main(int argc, char** argv) {
    using namespace proxykeeper;
    util::initLogging(util::LogLevel::info);

    std::filesystem::path configPath = argc > 1 ? argv[1] : "data/config.json";
    auto appConfig = config::loadAppConfig(configPath);
    util::initLogging(appConfig.logLevel);
    util::log(util::LogLevel::info,
              std::string("Starting proxykeeper with ") + config::toString(appConfig.store) + " store");

    Stores stores;
    try {
        stores = appConfig.store == config::StoreKind::mysql ? openMySqlStores(appConfig.database)
                                                             : openMemoryStores(appConfig.seedFile);
    } catch (const std::exception& ex) {
        util::log(util::LogLevel::error, std::string("Failed to open stores: ") + ex.what());
        return 1;
    }

    boost::asio::io_context io;
    boost::asio::thread_pool workerPool(std::max(1u, appConfig.scheduler.workerThreads));
    util::SystemClock clock;

    proxy::SelectionEngine engine{*stores.proxies, clock};
    service::HealthTracker tracker{*stores.proxies, *stores.statistics, *stores.catalog,
                                   proxy::BlockingPolicy{appConfig.policy}, clock};
    service::StalenessReconciler reconciler{*stores.proxies};
    service::TaskScheduler scheduler{io, workerPool, reconciler, *stores.proxies, clock, appConfig.scheduler.cycles};

    auto router = std::make_shared<server::Router>();
    controller::PoolController poolController{engine, tracker, scheduler, *stores.proxies, *stores.catalog, clock};
    poolController.registerRoutes(*router);

    auto server = std::make_shared<server::HttpServer>(io, router, appConfig.server.host, appConfig.server.port);
    try {
        server->start();
    } catch (const std::exception& ex) {
        util::log(util::LogLevel::error, std::string("Failed to start HTTP server: ") + ex.what());
        return 1;
    }
    scheduler.start();

    boost::asio::signal_set signals(io, SIGINT, SIGTERM);
    signals.async_wait([&](const boost::system::error_code& ec, int signalNumber) {
        if (ec) {
            return;
        }
        util::log(util::LogLevel::info, "Received signal " + std::to_string(signalNumber) + ", shutting down");
        scheduler.stop();
        server->stop();
        io.stop();
    });

    unsigned int ioThreadsCount = std::max(1u, appConfig.server.ioThreads);
    std::vector<std::thread> ioThreads;
    ioThreads.reserve(ioThreadsCount - 1);
    for (unsigned int i = 0; i + 1 < ioThreadsCount; ++i) {
        ioThreads.emplace_back([&io]() { io.run(); });
    }

    io.run();

    for (auto& thread : ioThreads) {
        if (thread.joinable()) {
            thread.join();
        }
    }

    workerPool.join();
    util::log(util::LogLevel::info, "proxykeeper stopped");
    return 0;
}
