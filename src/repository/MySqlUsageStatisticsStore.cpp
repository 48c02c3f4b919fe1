#include "proxykeeper/repository/MySqlUsageStatisticsStore.hpp"
#include "proxykeeper/repository/SqlUtils.hpp"

#include <mysqlx/xdevapi.h>

#include <string>

namespace proxykeeper::repository {

MySqlUsageStatisticsStore::MySqlUsageStatisticsStore(MySqlConnectionPool& pool)
    : pool_(pool) {}

std::int64_t MySqlUsageStatisticsStore::recordOutcome(int proxyId, int statusCode, TimePoint reportedAt) {
    return runWithSession(pool_, "Record proxy outcome", [&](mysqlx::Session& session) {
        session.startTransaction();
        try {
            // Holding the proxy row keeps a concurrent delete from racing the inserts.
            auto owner = session.sql("SELECT id FROM proxies WHERE id = ? FOR UPDATE").bind(proxyId).execute();
            if (owner.count() == 0) {
                session.rollback();
                throw util::NotFoundError("Proxy " + std::to_string(proxyId) + " does not exist");
            }
            session.sql("INSERT INTO usage_statistics (proxy_id, status_id, counter) VALUES (?, ?, 1) "
                        "ON DUPLICATE KEY UPDATE counter = counter + 1")
                .bind(proxyId)
                .bind(statusCode)
                .execute();
            session.sql("INSERT INTO proxy_reports (proxy_id, status_code, reported_at) VALUES (?, ?, FROM_UNIXTIME(?))")
                .bind(proxyId)
                .bind(statusCode)
                .bind(toUnixSeconds(reportedAt))
                .execute();
            auto rows = session.sql("SELECT counter FROM usage_statistics WHERE proxy_id = ? AND status_id = ?")
                            .bind(proxyId)
                            .bind(statusCode)
                            .execute();
            std::int64_t counter = 0;
            for (mysqlx::Row row : rows) {
                counter = readInt64Column(row[0]);
            }
            session.commit();
            return counter;
        } catch (const mysqlx::Error&) {
            session.rollback();
            throw;
        }
    });
}

std::vector<model::UsageStatistic> MySqlUsageStatisticsStore::listForProxy(int proxyId) {
    return runWithSession(pool_, "List usage statistics", [&](mysqlx::Session& session) {
        std::vector<model::UsageStatistic> statistics;
        auto rows = session.sql("SELECT id, proxy_id, status_id, counter FROM usage_statistics "
                                "WHERE proxy_id = ? ORDER BY status_id")
                        .bind(proxyId)
                        .execute();
        for (mysqlx::Row row : rows) {
            model::UsageStatistic statistic;
            statistic.id = readIntColumn(row[0]);
            statistic.proxyId = readIntColumn(row[1]);
            statistic.statusCode = readIntColumn(row[2]);
            statistic.counter = readInt64Column(row[3]);
            statistics.push_back(statistic);
        }
        return statistics;
    });
}

std::vector<model::OutcomeRecord> MySqlUsageStatisticsStore::outcomesSince(int proxyId, TimePoint since) {
    return runWithSession(pool_, "Load recent outcomes", [&](mysqlx::Session& session) {
        std::vector<model::OutcomeRecord> outcomes;
        auto rows = session.sql("SELECT proxy_id, status_code, CAST(UNIX_TIMESTAMP(reported_at) AS SIGNED) "
                                "FROM proxy_reports WHERE proxy_id = ? AND reported_at >= FROM_UNIXTIME(?) "
                                "ORDER BY reported_at ASC, id ASC")
                        .bind(proxyId)
                        .bind(toUnixSeconds(since))
                        .execute();
        for (mysqlx::Row row : rows) {
            model::OutcomeRecord record;
            record.proxyId = readIntColumn(row[0]);
            record.statusCode = readIntColumn(row[1]);
            record.reportedAt = fromUnixSeconds(readInt64Column(row[2]));
            outcomes.push_back(record);
        }
        return outcomes;
    });
}

} // namespace proxykeeper::repository
