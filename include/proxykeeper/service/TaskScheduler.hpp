#pragma once

#include "proxykeeper/repository/ProxyRecordStore.hpp"
#include "proxykeeper/service/StalenessReconciler.hpp"
#include "proxykeeper/util/Clock.hpp"

#include <boost/asio/io_context.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/asio/thread_pool.hpp>

#include <atomic>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <deque>
#include <memory>
#include <mutex>
#include <set>

namespace proxykeeper::service {

// Periodically hands one reconciliation cycle per source to the worker pool.
// A source never has two cycles in flight; a tick that finds its previous
// cycle still running (or still queued) skips it. At most maxConcurrentCycles
// run at once; sources over the cap are queued and start as running cycles
// finish, so every source is reconciled once per tick.
class TaskScheduler {
public:
    struct Config {
        std::chrono::seconds interval{std::chrono::minutes{5}};
        std::chrono::seconds staleAfter{kDefaultStaleAfter};
        std::size_t maxConcurrentCycles{4};
    };

    TaskScheduler(boost::asio::io_context& io,
                  boost::asio::thread_pool& worker,
                  StalenessReconciler& reconciler,
                  repository::ProxyRecordStore& store,
                  const util::Clock& clock,
                  Config config);
    ~TaskScheduler();

    TaskScheduler(const TaskScheduler&) = delete;
    TaskScheduler& operator=(const TaskScheduler&) = delete;

    void start();
    void stop();

    // Dispatches or queues a cycle for every idle source; returns how many were
    // posted immediately.
    std::size_t runReconciliationTick();

    bool isCycleRunning(int sourceId) const;
    std::size_t inFlightCount() const;
    std::size_t queuedCount() const;
    std::uint64_t completedCycles() const noexcept { return completed_.load(); }
    std::uint64_t failedCycles() const noexcept { return failed_.load(); }

    const Config& config() const noexcept { return config_; }

private:
    void scheduleNext();
    void runCycle(int sourceId);
    // Caller holds inFlightMutex_ and has already marked the source in flight.
    void dispatchLocked(int sourceId);

    boost::asio::io_context& io_;
    boost::asio::thread_pool& worker_;
    StalenessReconciler& reconciler_;
    repository::ProxyRecordStore& store_;
    const util::Clock& clock_;
    Config config_;
    std::unique_ptr<boost::asio::steady_timer> timer_;
    std::atomic<bool> running_{false};

    mutable std::mutex inFlightMutex_;
    std::set<int> inFlight_;
    std::deque<int> queue_;
    std::set<int> queuedIds_;
    std::atomic<std::uint64_t> completed_{0};
    std::atomic<std::uint64_t> failed_{0};
};

} // namespace proxykeeper::service
