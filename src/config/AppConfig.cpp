#include "proxykeeper/config/AppConfig.hpp"
#include "proxykeeper/util/JsonUtil.hpp"

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <exception>

namespace proxykeeper::config {
namespace {

std::optional<long long> readEnvNumber(const char* name) {
    const char* value = std::getenv(name);
    if (!value || *value == '\0') {
        return std::nullopt;
    }
    char* end = nullptr;
    long long parsed = std::strtoll(value, &end, 10);
    if (end == value || *end != '\0') {
        util::log(util::LogLevel::warn, std::string("Ignoring non-numeric ") + name + "=" + value);
        return std::nullopt;
    }
    return parsed;
}

void applyPolicy(const boost::json::object& json, proxy::BlockingPolicy::Config& policy) {
    if (auto value = util::readInt(json, "transportFailureStatus")) {
        policy.transportFailureStatus = static_cast<int>(*value);
    }
    if (auto it = json.find("blockingStatuses"); it != json.end() && it->value().is_array()) {
        policy.blockingStatuses.clear();
        for (const auto& item : it->value().as_array()) {
            if (item.is_int64()) {
                policy.blockingStatuses.insert(static_cast<int>(item.as_int64()));
            }
        }
    }
    if (auto value = util::readInt(json, "failureThreshold"); value && *value > 0) {
        policy.failureThreshold = static_cast<std::size_t>(*value);
    }
    if (auto value = util::readDouble(json, "maxFailureRatio"); value && *value > 0.0 && *value <= 1.0) {
        policy.maxFailureRatio = *value;
    }
    if (auto value = util::readInt(json, "minSamples"); value && *value > 0) {
        policy.minSamples = static_cast<std::size_t>(*value);
    }
    if (auto value = util::readInt(json, "windowSeconds"); value && *value > 0) {
        policy.window = std::chrono::seconds(*value);
    }
}

void applyScheduler(const boost::json::object& json, SchedulerConfig& scheduler) {
    if (auto value = util::readInt(json, "intervalSeconds"); value && *value > 0) {
        scheduler.cycles.interval = std::chrono::seconds(*value);
    }
    if (auto value = util::readInt(json, "staleAfterSeconds"); value && *value > 0) {
        scheduler.cycles.staleAfter = std::chrono::seconds(*value);
    }
    if (auto value = util::readInt(json, "maxConcurrentCycles"); value && *value > 0) {
        scheduler.cycles.maxConcurrentCycles = static_cast<std::size_t>(*value);
    }
    if (auto value = util::readInt(json, "workerThreads"); value && *value > 0) {
        scheduler.workerThreads = static_cast<unsigned int>(*value);
    }
}

} // namespace

const char* toString(StoreKind kind) {
    switch (kind) {
    case StoreKind::memory:
        return "memory";
    case StoreKind::mysql:
        return "mysql";
    }
    return "memory";
}

StoreKind parseStoreKind(const std::string& text) {
    std::string lowered(text);
    std::transform(lowered.begin(), lowered.end(), lowered.begin(),
                   [](unsigned char ch) { return static_cast<char>(std::tolower(ch)); });
    return lowered == "mysql" ? StoreKind::mysql : StoreKind::memory;
}

AppConfig parseAppConfig(const boost::json::object& json) {
    AppConfig config;
    if (auto it = json.find("server"); it != json.end() && it->value().is_object()) {
        const auto& server = it->value().as_object();
        if (auto value = util::readString(server, "host")) config.server.host = *value;
        if (auto value = util::readInt(server, "port"); value && *value > 0 && *value <= 65535) {
            config.server.port = static_cast<std::uint16_t>(*value);
        }
        if (auto value = util::readInt(server, "ioThreads"); value && *value > 0) {
            config.server.ioThreads = static_cast<unsigned int>(*value);
        }
    }
    if (auto it = json.find("database"); it != json.end() && it->value().is_object()) {
        config.database = repository::loadConfig(it->value().as_object(), config.database);
    }
    if (auto value = util::readString(json, "store")) config.store = parseStoreKind(*value);
    if (auto value = util::readString(json, "seedFile")) config.seedFile = *value;
    if (auto it = json.find("policy"); it != json.end() && it->value().is_object()) {
        applyPolicy(it->value().as_object(), config.policy);
    }
    if (auto it = json.find("scheduler"); it != json.end() && it->value().is_object()) {
        applyScheduler(it->value().as_object(), config.scheduler);
    }
    if (auto value = util::readString(json, "logLevel")) config.logLevel = util::parseLogLevel(*value);
    return config;
}

void applyEnvironmentOverrides(AppConfig& config) {
    if (const char* value = std::getenv("PROXYKEEPER_HOST")) config.server.host = value;
    if (auto value = readEnvNumber("PROXYKEEPER_PORT"); value && *value > 0 && *value <= 65535) {
        config.server.port = static_cast<std::uint16_t>(*value);
    }
    if (auto value = readEnvNumber("PROXYKEEPER_IO_THREADS"); value && *value > 0) {
        config.server.ioThreads = static_cast<unsigned int>(*value);
    }

    if (const char* value = std::getenv("PROXYKEEPER_DB_HOST")) config.database.host = value;
    if (auto value = readEnvNumber("PROXYKEEPER_DB_PORT"); value && *value > 0 && *value <= 65535) {
        config.database.port = static_cast<std::uint16_t>(*value);
    }
    if (const char* value = std::getenv("PROXYKEEPER_DB_USER")) config.database.user = value;
    if (const char* value = std::getenv("PROXYKEEPER_DB_PASSWORD")) config.database.password = value;
    if (const char* value = std::getenv("PROXYKEEPER_DB_NAME")) config.database.database = value;
    if (const char* value = std::getenv("PROXYKEEPER_DB_CHARSET")) config.database.charset = value;
    if (auto value = readEnvNumber("PROXYKEEPER_DB_POOL"); value && *value > 0) {
        config.database.poolSize = static_cast<unsigned int>(*value);
    }

    if (const char* value = std::getenv("PROXYKEEPER_STORE")) config.store = parseStoreKind(value);
    if (const char* value = std::getenv("PROXYKEEPER_SEED_FILE")) config.seedFile = value;
    if (const char* value = std::getenv("PROXYKEEPER_LOG_LEVEL")) config.logLevel = util::parseLogLevel(value);

    if (auto value = readEnvNumber("PROXYKEEPER_RECONCILE_INTERVAL"); value && *value > 0) {
        config.scheduler.cycles.interval = std::chrono::seconds(*value);
    }
    if (auto value = readEnvNumber("PROXYKEEPER_STALE_AFTER"); value && *value > 0) {
        config.scheduler.cycles.staleAfter = std::chrono::seconds(*value);
    }
}

AppConfig loadAppConfig(const std::filesystem::path& path) {
    AppConfig config;
    try {
        if (auto json = util::readJsonFile(path.string())) {
            if (json->is_object()) {
                config = parseAppConfig(json->as_object());
            } else {
                util::log(util::LogLevel::warn, "Config " + path.string() + " is not a JSON object, using defaults");
            }
        } else {
            util::log(util::LogLevel::warn, "Config " + path.string() + " not found, using defaults");
        }
    } catch (const std::exception& ex) {
        util::log(util::LogLevel::warn, "Failed to parse config " + path.string() + ": " + ex.what());
        config = AppConfig{};
    }
    applyEnvironmentOverrides(config);
    return config;
}

} // namespace proxykeeper::config
