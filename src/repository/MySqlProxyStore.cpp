#include "proxykeeper/repository/MySqlProxyStore.hpp"
#include "proxykeeper/repository/SqlUtils.hpp"

#include <mysqlx/xdevapi.h>

#include <string>
#include <vector>

namespace proxykeeper::repository {
namespace {

constexpr const char* kProxyColumns =
    "SELECT id, address, source_id, provider_id, priority, blocked, usage_cooldown, "
    "CAST(UNIX_TIMESTAMP(last_touched) AS SIGNED) AS last_touched FROM proxies";

constexpr const char* kSelectionOrder = " ORDER BY priority DESC, id ASC";

} // namespace

MySqlProxyStore::MySqlProxyStore(MySqlConnectionPool& pool)
    : pool_(pool) {}

model::Proxy MySqlProxyStore::mapRow(mysqlx::Row row) {
    model::Proxy proxy;
    proxy.id = readIntColumn(row[0]);
    proxy.address = readStringColumn(row[1]);
    proxy.sourceId = readIntColumn(row[2]);
    proxy.providerId = readIntColumn(row[3]);
    proxy.priority = readIntColumn(row[4]);
    proxy.blocked = readIntColumn(row[5]) != 0;
    proxy.usageCooldown = std::chrono::seconds{
        readIntColumn(row[6], static_cast<int>(model::kDefaultUsageCooldown.count()))};
    proxy.lastTouched = readUnixTimeColumn(row[7]);
    return proxy;
}

bool MySqlProxyStore::exists(mysqlx::Session& session, int proxyId) {
    auto rows = session.sql("SELECT 1 FROM proxies WHERE id = ?").bind(proxyId).execute();
    return rows.count() > 0;
}

std::optional<model::Proxy> MySqlProxyStore::get(int proxyId) {
    return runWithSession(pool_, "Load proxy", [&](mysqlx::Session& session) -> std::optional<model::Proxy> {
        auto rows = session.sql(std::string{kProxyColumns} + " WHERE id = ?").bind(proxyId).execute();
        for (mysqlx::Row row : rows) {
            return mapRow(row);
        }
        return std::nullopt;
    });
}

std::vector<model::Proxy> MySqlProxyStore::listEligible(int sourceId) {
    return runWithSession(pool_, "List eligible proxies", [&](mysqlx::Session& session) {
        std::vector<model::Proxy> proxies;
        auto rows = session.sql(std::string{kProxyColumns} + " WHERE source_id = ? AND blocked = FALSE" + kSelectionOrder)
                        .bind(sourceId)
                        .execute();
        for (mysqlx::Row row : rows) {
            proxies.push_back(mapRow(row));
        }
        return proxies;
    });
}

std::vector<model::Proxy> MySqlProxyStore::listBySource(int sourceId) {
    return runWithSession(pool_, "List source proxies", [&](mysqlx::Session& session) {
        std::vector<model::Proxy> proxies;
        auto rows = session.sql(std::string{kProxyColumns} + " WHERE source_id = ?" + kSelectionOrder)
                        .bind(sourceId)
                        .execute();
        for (mysqlx::Row row : rows) {
            proxies.push_back(mapRow(row));
        }
        return proxies;
    });
}

AssignOutcome MySqlProxyStore::markAssigned(int proxyId, TimePoint now) {
    const auto nowSeconds = toUnixSeconds(now);
    return runWithSession(pool_, "Mark proxy assigned", [&](mysqlx::Session& session) {
        auto result = session
                          .sql("UPDATE proxies SET last_touched = FROM_UNIXTIME(?) "
                               "WHERE id = ? AND blocked = FALSE AND (last_touched IS NULL OR "
                               "TIMESTAMPDIFF(SECOND, last_touched, FROM_UNIXTIME(?)) >= usage_cooldown)")
                          .bind(nowSeconds)
                          .bind(proxyId)
                          .bind(nowSeconds)
                          .execute();
        if (result.getAffectedItemsCount() == 1) {
            return AssignOutcome::assigned;
        }
        return exists(session, proxyId) ? AssignOutcome::conflict : AssignOutcome::notFound;
    });
}

bool MySqlProxyStore::setBlocked(int proxyId, bool blocked, TimePoint now) {
    return runWithSession(pool_, "Set proxy blocked", [&](mysqlx::Session& session) {
        auto result = session.sql("UPDATE proxies SET blocked = ?, last_touched = FROM_UNIXTIME(?) WHERE id = ?")
                          .bind(blocked ? 1 : 0)
                          .bind(toUnixSeconds(now))
                          .bind(proxyId)
                          .execute();
        // MySQL reports zero affected rows when nothing changed.
        return result.getAffectedItemsCount() > 0 || exists(session, proxyId);
    });
}

std::size_t MySqlProxyStore::unblockAllForSource(int sourceId) {
    return runWithSession(pool_, "Unblock source proxies", [&](mysqlx::Session& session) {
        auto result = session.sql("UPDATE proxies SET blocked = FALSE WHERE source_id = ? AND blocked = TRUE")
                          .bind(sourceId)
                          .execute();
        return static_cast<std::size_t>(result.getAffectedItemsCount());
    });
}

std::optional<ProxyRecordStore::TimePoint> MySqlProxyStore::latestTouch(int sourceId) {
    return runWithSession(pool_, "Load latest touch", [&](mysqlx::Session& session) -> std::optional<TimePoint> {
        auto rows = session
                        .sql("SELECT CAST(UNIX_TIMESTAMP(MAX(last_touched)) AS SIGNED) FROM proxies WHERE source_id = ?")
                        .bind(sourceId)
                        .execute();
        for (mysqlx::Row row : rows) {
            return readUnixTimeColumn(row[0]);
        }
        return std::nullopt;
    });
}

std::optional<model::Source> MySqlProxyStore::findSource(int sourceId) {
    return runWithSession(pool_, "Load source", [&](mysqlx::Session& session) -> std::optional<model::Source> {
        auto rows = session.sql("SELECT id, name FROM sources WHERE id = ?").bind(sourceId).execute();
        for (mysqlx::Row row : rows) {
            return model::Source{readIntColumn(row[0]), readStringColumn(row[1])};
        }
        return std::nullopt;
    });
}

std::vector<model::Source> MySqlProxyStore::listSources() {
    return runWithSession(pool_, "List sources", [&](mysqlx::Session& session) {
        std::vector<model::Source> sources;
        auto rows = session.sql("SELECT id, name FROM sources ORDER BY id").execute();
        for (mysqlx::Row row : rows) {
            sources.push_back(model::Source{readIntColumn(row[0]), readStringColumn(row[1])});
        }
        return sources;
    });
}

std::optional<model::Provider> MySqlProxyStore::findProvider(int providerId) {
    return runWithSession(pool_, "Load provider", [&](mysqlx::Session& session) -> std::optional<model::Provider> {
        auto rows = session.sql("SELECT id, name FROM providers WHERE id = ?").bind(providerId).execute();
        for (mysqlx::Row row : rows) {
            return model::Provider{readIntColumn(row[0]), readStringColumn(row[1])};
        }
        return std::nullopt;
    });
}

} // namespace proxykeeper::repository
