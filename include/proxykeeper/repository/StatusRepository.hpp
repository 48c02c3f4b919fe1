#pragma once

#include "proxykeeper/model/StatusOutcome.hpp"
#include "proxykeeper/repository/MySqlConnectionPool.hpp"

#include <vector>

namespace proxykeeper::repository {

// Read-only access to the `statuses` reference table.
class StatusRepository {
public:
    explicit StatusRepository(MySqlConnectionPool& pool);

    std::vector<model::StatusOutcome> findAll();

private:
    MySqlConnectionPool& pool_;
};

} // namespace proxykeeper::repository
