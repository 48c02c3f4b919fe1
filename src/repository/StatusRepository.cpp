#include "proxykeeper/repository/StatusRepository.hpp"
#include "proxykeeper/repository/SqlUtils.hpp"

#include <mysqlx/xdevapi.h>

namespace proxykeeper::repository {

StatusRepository::StatusRepository(MySqlConnectionPool& pool)
    : pool_(pool) {}

std::vector<model::StatusOutcome> StatusRepository::findAll() {
    return runWithSession(pool_, "Load status catalog", [](mysqlx::Session& session) {
        std::vector<model::StatusOutcome> statuses;
        auto rows = session.sql("SELECT status_code, short_description FROM statuses ORDER BY status_code").execute();
        for (mysqlx::Row row : rows) {
            statuses.push_back(model::StatusOutcome{readIntColumn(row[0]), readStringColumn(row[1])});
        }
        return statuses;
    });
}

} // namespace proxykeeper::repository
