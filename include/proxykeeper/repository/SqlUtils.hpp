#pragma once

#include "proxykeeper/util/Errors.hpp"
#include "proxykeeper/util/Logging.hpp"

#include <mysqlx/xdevapi.h>

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <utility>

namespace proxykeeper::repository {

inline std::int64_t toUnixSeconds(std::chrono::system_clock::time_point tp) {
    return std::chrono::duration_cast<std::chrono::seconds>(tp.time_since_epoch()).count();
}

inline std::chrono::system_clock::time_point fromUnixSeconds(std::int64_t seconds) {
    return std::chrono::system_clock::time_point{std::chrono::seconds{seconds}};
}

inline int readIntColumn(const mysqlx::Value& value, int defaultValue = 0) {
    if (value.isNull()) {
        return defaultValue;
    }
    return static_cast<int>(value.get<std::int64_t>());
}

inline std::int64_t readInt64Column(const mysqlx::Value& value, std::int64_t defaultValue = 0) {
    if (value.isNull()) {
        return defaultValue;
    }
    return value.get<std::int64_t>();
}

inline std::string readStringColumn(const mysqlx::Value& value) {
    if (value.isNull()) {
        return {};
    }
    return value.get<std::string>();
}

// Expects the column selected as CAST(UNIX_TIMESTAMP(col) AS SIGNED).
inline std::optional<std::chrono::system_clock::time_point> readUnixTimeColumn(const mysqlx::Value& value) {
    if (value.isNull()) {
        return std::nullopt;
    }
    return fromUnixSeconds(value.get<std::int64_t>());
}

// Checks out a session, runs `fn(session)` and converts driver errors into
// util::UnavailableError after logging them under `operation`. A session that
// raised a driver error is discarded rather than returned to the pool.
template <typename Pool, typename Fn>
auto runWithSession(Pool& pool, const char* operation, Fn&& fn) {
    auto session = pool.acquire();
    try {
        return std::forward<Fn>(fn)(*session);
    } catch (const mysqlx::Error& err) {
        pool.discard(session);
        util::log(util::LogLevel::error, std::string{operation} + " failed: " + err.what());
        throw util::UnavailableError(std::string{operation} + " failed: " + err.what());
    }
}

} // namespace proxykeeper::repository
