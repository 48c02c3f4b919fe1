#pragma once

#include "proxykeeper/proxy/BlockingPolicy.hpp"
#include "proxykeeper/repository/DatabaseConfig.hpp"
#include "proxykeeper/service/TaskScheduler.hpp"
#include "proxykeeper/util/Logging.hpp"

#include <boost/json.hpp>

#include <cstdint>
#include <filesystem>
#include <string>

namespace proxykeeper::config {

enum class StoreKind {
    memory,
    mysql
};

struct ServerConfig {
    std::string host{"0.0.0.0"};
    std::uint16_t port{8080};
    unsigned int ioThreads{2};
};

struct SchedulerConfig {
    service::TaskScheduler::Config cycles;
    unsigned int workerThreads{2};
};

struct AppConfig {
    ServerConfig server;
    repository::DatabaseConfig database;
    StoreKind store{StoreKind::memory};
    std::string seedFile;
    proxy::BlockingPolicy::Config policy;
    SchedulerConfig scheduler;
    util::LogLevel logLevel{util::LogLevel::info};
};

const char* toString(StoreKind kind);
// "mysql" selects the MySQL stores, anything else the in-memory ones.
StoreKind parseStoreKind(const std::string& text);

// Fields absent from `json` keep their defaults.
AppConfig parseAppConfig(const boost::json::object& json);

// Applies PROXYKEEPER_* environment variables on top of `config`.
void applyEnvironmentOverrides(AppConfig& config);

// File values, then environment. A missing or malformed file is logged and
// yields the defaults.
AppConfig loadAppConfig(const std::filesystem::path& path);

} // namespace proxykeeper::config
