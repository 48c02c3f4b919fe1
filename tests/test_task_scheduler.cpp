#include <gtest/gtest.h>
#include "TestSupport.hpp"

#include "proxykeeper/repository/InMemoryProxyStore.hpp"
#include "proxykeeper/service/StalenessReconciler.hpp"
#include "proxykeeper/service/TaskScheduler.hpp"
#include "proxykeeper/util/Errors.hpp"

#include <boost/asio/io_context.hpp>
#include <boost/asio/thread_pool.hpp>

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <map>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

using namespace proxykeeper;
using namespace std::chrono_literals;

namespace {

// Holds every latestTouch call until release() so cycles stay in flight.
class GatedStore : public repository::InMemoryProxyStore {
public:
    std::optional<TimePoint> latestTouch(int sourceId) override {
        {
            std::unique_lock lock(gateMutex_);
            ++waiting_;
            arrived_.notify_all();
            opened_.wait(lock, [this] { return open_; });
        }
        return InMemoryProxyStore::latestTouch(sourceId);
    }

    void waitForArrivals(int count) {
        std::unique_lock lock(gateMutex_);
        arrived_.wait(lock, [&] { return waiting_ >= count; });
    }

    void release() {
        std::scoped_lock lock(gateMutex_);
        open_ = true;
        opened_.notify_all();
    }

private:
    std::mutex gateMutex_;
    std::condition_variable arrived_;
    std::condition_variable opened_;
    int waiting_{};
    bool open_{};
};

class FailingStore : public repository::InMemoryProxyStore {
public:
    int failingSource{};

    std::optional<TimePoint> latestTouch(int sourceId) override {
        if (sourceId == failingSource) {
            throw util::UnavailableError("storage offline");
        }
        return InMemoryProxyStore::latestTouch(sourceId);
    }
};

// Simulates a storage round trip and records per-source calls and peak overlap.
class SlowStore : public repository::InMemoryProxyStore {
public:
    std::optional<TimePoint> latestTouch(int sourceId) override {
        int running = ++active_;
        int seen = peak_.load();
        while (running > seen && !peak_.compare_exchange_weak(seen, running)) {
        }
        std::this_thread::sleep_for(20ms);
        {
            std::scoped_lock lock(callsMutex_);
            ++calls_[sourceId];
        }
        --active_;
        return InMemoryProxyStore::latestTouch(sourceId);
    }

    int peak() const { return peak_.load(); }

    int callsFor(int sourceId) {
        std::scoped_lock lock(callsMutex_);
        return calls_[sourceId];
    }

private:
    std::atomic<int> active_{0};
    std::atomic<int> peak_{0};
    std::mutex callsMutex_;
    std::map<int, int> calls_;
};

bool waitUntilIdle(const service::TaskScheduler& scheduler) {
    auto deadline = std::chrono::steady_clock::now() + 5s;
    while (scheduler.inFlightCount() > 0 || scheduler.queuedCount() > 0) {
        if (std::chrono::steady_clock::now() > deadline) {
            return false;
        }
        std::this_thread::sleep_for(5ms);
    }
    return true;
}

} // namespace

class TaskSchedulerTest : public ::testing::Test {
protected:
    service::TaskScheduler::Config config(std::size_t maxConcurrent = 4) {
        service::TaskScheduler::Config cfg;
        cfg.interval = 1s;
        cfg.staleAfter = 5min;
        cfg.maxConcurrentCycles = maxConcurrent;
        return cfg;
    }

    boost::asio::io_context io;
    boost::asio::thread_pool worker{2};
    test::ManualClock clock;
};

TEST_F(TaskSchedulerTest, TickReconcilesEverySource) {
    repository::InMemoryProxyStore store;
    auto provider = store.addProvider("vendor").id;
    auto a = store.addSource("a").id;
    auto b = store.addSource("b").id;
    auto pa = store.addProxy(test::makeProxy(a, provider, 1, clock.now() - 1h, true));
    auto pb = store.addProxy(test::makeProxy(b, provider, 1, clock.now() - 1h, true));

    service::StalenessReconciler reconciler{store};
    service::TaskScheduler scheduler{io, worker, reconciler, store, clock, config()};

    EXPECT_EQ(scheduler.runReconciliationTick(), 2u);
    worker.join();

    EXPECT_EQ(scheduler.completedCycles(), 2u);
    EXPECT_EQ(scheduler.inFlightCount(), 0u);
    EXPECT_FALSE(store.get(pa.id)->blocked);
    EXPECT_FALSE(store.get(pb.id)->blocked);
}

TEST_F(TaskSchedulerTest, SourceWithCycleInFlightIsSkipped) {
    GatedStore store;
    auto source = store.addSource("a").id;

    service::StalenessReconciler reconciler{store};
    service::TaskScheduler scheduler{io, worker, reconciler, store, clock, config()};

    EXPECT_EQ(scheduler.runReconciliationTick(), 1u);
    store.waitForArrivals(1);
    EXPECT_TRUE(scheduler.isCycleRunning(source));

    EXPECT_EQ(scheduler.runReconciliationTick(), 0u);
    EXPECT_EQ(scheduler.inFlightCount(), 1u);

    store.release();
    worker.join();
    EXPECT_FALSE(scheduler.isCycleRunning(source));
    EXPECT_EQ(scheduler.completedCycles(), 1u);
}

TEST_F(TaskSchedulerTest, ConcurrentCyclesAreBounded) {
    GatedStore store;
    store.addSource("a");
    store.addSource("b");
    auto c = store.addSource("c").id;

    service::StalenessReconciler reconciler{store};
    service::TaskScheduler scheduler{io, worker, reconciler, store, clock, config(2)};

    EXPECT_EQ(scheduler.runReconciliationTick(), 2u);
    store.waitForArrivals(2);
    EXPECT_EQ(scheduler.inFlightCount(), 2u);
    EXPECT_EQ(scheduler.queuedCount(), 1u);
    EXPECT_FALSE(scheduler.isCycleRunning(c));

    // A queued source is not queued twice.
    EXPECT_EQ(scheduler.runReconciliationTick(), 0u);
    EXPECT_EQ(scheduler.queuedCount(), 1u);

    store.release();
    worker.join();
    EXPECT_EQ(scheduler.inFlightCount(), 0u);
    EXPECT_EQ(scheduler.queuedCount(), 0u);
    EXPECT_EQ(scheduler.completedCycles(), 3u);
}

TEST_F(TaskSchedulerTest, SourcesPastTheCapAreRescuedInTheSameTick) {
    SlowStore store;
    auto provider = store.addProvider("vendor").id;
    std::vector<int> proxies;
    for (int i = 0; i < 6; ++i) {
        auto source = store.addSource("source-" + std::to_string(i)).id;
        proxies.push_back(store.addProxy(test::makeProxy(source, provider, 1, clock.now() - 1h, true)).id);
    }

    boost::asio::thread_pool wide{6};
    service::StalenessReconciler reconciler{store};
    service::TaskScheduler scheduler{io, wide, reconciler, store, clock, config(4)};

    EXPECT_EQ(scheduler.runReconciliationTick(), 4u);
    wide.join();

    EXPECT_EQ(scheduler.completedCycles(), 6u);
    EXPECT_EQ(scheduler.queuedCount(), 0u);
    EXPECT_LE(store.peak(), 4);
    for (int id : proxies) {
        EXPECT_FALSE(store.get(id)->blocked) << "proxy " << id;
    }
}

TEST_F(TaskSchedulerTest, EveryTickCoversEverySource) {
    boost::asio::thread_pool wide{4};
    SlowStore store;
    std::vector<int> sources;
    for (int i = 0; i < 5; ++i) {
        sources.push_back(store.addSource("source-" + std::to_string(i)).id);
    }

    service::StalenessReconciler reconciler{store};
    service::TaskScheduler scheduler{io, wide, reconciler, store, clock, config(2)};

    constexpr int kTicks = 3;
    for (int tick = 0; tick < kTicks; ++tick) {
        EXPECT_EQ(scheduler.runReconciliationTick(), 2u);
        ASSERT_TRUE(waitUntilIdle(scheduler));
    }
    wide.join();

    for (int source : sources) {
        EXPECT_EQ(store.callsFor(source), kTicks) << "source " << source;
    }
    EXPECT_LE(store.peak(), 2);
    EXPECT_EQ(scheduler.completedCycles(), static_cast<std::uint64_t>(kTicks * sources.size()));
}

TEST_F(TaskSchedulerTest, FailingCycleDoesNotAffectOthers) {
    FailingStore store;
    auto provider = store.addProvider("vendor").id;
    auto broken = store.addSource("broken").id;
    auto healthy = store.addSource("healthy").id;
    store.failingSource = broken;
    auto proxy = store.addProxy(test::makeProxy(healthy, provider, 1, clock.now() - 1h, true));

    service::StalenessReconciler reconciler{store};
    service::TaskScheduler scheduler{io, worker, reconciler, store, clock, config()};

    EXPECT_EQ(scheduler.runReconciliationTick(), 2u);
    worker.join();

    EXPECT_EQ(scheduler.failedCycles(), 1u);
    EXPECT_EQ(scheduler.completedCycles(), 1u);
    EXPECT_FALSE(scheduler.isCycleRunning(broken));
    EXPECT_FALSE(store.get(proxy.id)->blocked);
}

TEST_F(TaskSchedulerTest, TimerDrivesTicks) {
    repository::InMemoryProxyStore store;
    auto provider = store.addProvider("vendor").id;
    auto source = store.addSource("a").id;
    auto proxy = store.addProxy(test::makeProxy(source, provider, 1, clock.now() - 1h, true));

    service::StalenessReconciler reconciler{store};
    service::TaskScheduler scheduler{io, worker, reconciler, store, clock, config()};

    scheduler.start();
    io.run_for(1500ms);
    scheduler.stop();
    worker.join();

    EXPECT_GE(scheduler.completedCycles(), 1u);
    EXPECT_FALSE(store.get(proxy.id)->blocked);
}
