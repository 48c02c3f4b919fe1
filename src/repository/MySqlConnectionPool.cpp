#include "proxykeeper/repository/MySqlConnectionPool.hpp"
#include "proxykeeper/util/Errors.hpp"
#include "proxykeeper/util/Logging.hpp"

#include <mysqlx/xdevapi.h>

#include <memory>
#include <stdexcept>
#include <utility>

namespace proxykeeper::repository {

MySqlConnectionPool::MySqlConnectionPool(DatabaseConfig config)
    : config_(std::move(config)) {
    if (config_.host.empty()) {
        config_.host = "127.0.0.1";
    }
    if (config_.database.empty()) {
        throw std::invalid_argument("Database name must be provided in configuration");
    }
    if (config_.poolSize == 0) {
        config_.poolSize = 4;
    }
}

std::unique_ptr<mysqlx::Session> MySqlConnectionPool::createSession() {
    try {
        auto session = std::make_unique<mysqlx::Session>(
            mysqlx::SessionOption::HOST, config_.host,
            mysqlx::SessionOption::PORT, static_cast<unsigned int>(config_.port),
            mysqlx::SessionOption::USER, config_.user,
            mysqlx::SessionOption::PWD, config_.password);
        if (!config_.charset.empty()) {
            session->sql("SET NAMES '" + config_.charset + "'").execute();
        }
        // Timestamps cross the wire as unix seconds; keep the session in UTC.
        session->sql("SET time_zone = '+00:00'").execute();
        session->sql("USE `" + config_.database + "`").execute();
        return session;
    } catch (const mysqlx::Error& err) {
        util::log(util::LogLevel::error, std::string{"Create MySQL session failed: "} + err.what());
        throw util::UnavailableError(std::string{"MySQL unavailable: "} + err.what());
    }
}

void MySqlConnectionPool::SessionDeleter::operator()(mysqlx::Session* session) const noexcept {
    if (pool && session) {
        pool->release(session);
    }
}

std::shared_ptr<mysqlx::Session> MySqlConnectionPool::acquire() {
    std::unique_lock<std::mutex> lock(mutex_);
    cv_.wait(lock, [this]() { return !idle_.empty() || currentSize_ < config_.poolSize; });

    if (!idle_.empty()) {
        std::unique_ptr<mysqlx::Session> session = std::move(idle_.back());
        idle_.pop_back();
        return std::shared_ptr<mysqlx::Session>(session.release(), SessionDeleter{this});
    }

    // Reserve the slot before connecting so the lock is not held across I/O.
    ++currentSize_;
    lock.unlock();
    try {
        std::unique_ptr<mysqlx::Session> session = createSession();
        return std::shared_ptr<mysqlx::Session>(session.release(), SessionDeleter{this});
    } catch (...) {
        {
            std::scoped_lock relock(mutex_);
            --currentSize_;
        }
        cv_.notify_one();
        throw;
    }
}

void MySqlConnectionPool::discard(const std::shared_ptr<mysqlx::Session>& session) {
    if (!session) {
        return;
    }
    std::scoped_lock lock(mutex_);
    broken_.insert(session.get());
}

void MySqlConnectionPool::release(mysqlx::Session* session) {
    std::unique_ptr<mysqlx::Session> holder(session);
    bool healthy = true;
    {
        std::scoped_lock lock(mutex_);
        healthy = broken_.erase(session) == 0;
        if (healthy) {
            idle_.push_back(std::move(holder));
        } else if (currentSize_ > 0) {
            --currentSize_;
        }
    }
    if (!healthy) {
        util::log(util::LogLevel::warn, "Dropping broken MySQL session");
        try {
            holder->close();
        } catch (const mysqlx::Error& err) {
            util::log(util::LogLevel::debug, std::string{"Closing broken session failed: "} + err.what());
        }
    }
    cv_.notify_one();
}

} // namespace proxykeeper::repository
