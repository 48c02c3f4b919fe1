#pragma once

#include "proxykeeper/repository/MySqlConnectionPool.hpp"
#include "proxykeeper/repository/ProxyRecordStore.hpp"

#include <mysqlx/xdevapi.h>

namespace proxykeeper::repository {

// ProxyRecordStore over the `proxies`, `sources` and `providers` tables.
// Every mutation is a single conditional statement, so row-level atomicity
// comes from the server.
class MySqlProxyStore : public ProxyRecordStore {
public:
    explicit MySqlProxyStore(MySqlConnectionPool& pool);

    std::optional<model::Proxy> get(int proxyId) override;
    std::vector<model::Proxy> listEligible(int sourceId) override;
    std::vector<model::Proxy> listBySource(int sourceId) override;
    AssignOutcome markAssigned(int proxyId, TimePoint now) override;
    bool setBlocked(int proxyId, bool blocked, TimePoint now) override;
    std::size_t unblockAllForSource(int sourceId) override;
    std::optional<TimePoint> latestTouch(int sourceId) override;
    std::optional<model::Source> findSource(int sourceId) override;
    std::vector<model::Source> listSources() override;
    std::optional<model::Provider> findProvider(int providerId) override;

private:
    static model::Proxy mapRow(mysqlx::Row row);
    static bool exists(mysqlx::Session& session, int proxyId);

    MySqlConnectionPool& pool_;
};

} // namespace proxykeeper::repository
