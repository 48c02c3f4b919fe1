#pragma once

#include "proxykeeper/repository/DatabaseConfig.hpp"

#include <mysqlx/xdevapi.h>

#include <condition_variable>
#include <memory>
#include <mutex>
#include <set>
#include <vector>

namespace proxykeeper::repository {

// Bounded pool of X DevAPI sessions. acquire() blocks while every session is
// checked out; the returned shared_ptr hands the session back on release.
// A session passed to discard() is closed on release and its slot freed.
class MySqlConnectionPool {
public:
    explicit MySqlConnectionPool(DatabaseConfig config);

    std::shared_ptr<mysqlx::Session> acquire();
    void discard(const std::shared_ptr<mysqlx::Session>& session);

    const std::string& schemaName() const noexcept { return config_.database; }

private:
    struct SessionDeleter {
        MySqlConnectionPool* pool;
        void operator()(mysqlx::Session* session) const noexcept;
    };

    std::unique_ptr<mysqlx::Session> createSession();
    void release(mysqlx::Session* session);

    DatabaseConfig config_;
    std::mutex mutex_;
    std::condition_variable cv_;
    std::vector<std::unique_ptr<mysqlx::Session>> idle_;
    std::set<const mysqlx::Session*> broken_;
    unsigned int currentSize_{};
};

} // namespace proxykeeper::repository
