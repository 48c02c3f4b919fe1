#include <gtest/gtest.h>
#include "TestSupport.hpp"

#include "proxykeeper/proxy/SelectionEngine.hpp"
#include "proxykeeper/repository/InMemoryProxyStore.hpp"
#include "proxykeeper/util/Errors.hpp"

#include <algorithm>
#include <atomic>
#include <memory>
#include <mutex>
#include <set>
#include <thread>
#include <vector>

using namespace proxykeeper;
using namespace std::chrono_literals;

class SelectionEngineTest : public ::testing::Test {
protected:
    void SetUp() override {
        sourceId = store.addSource("crawler").id;
        providerId = store.addProvider("vendor").id;
        engine = std::make_unique<proxy::SelectionEngine>(store, clock);
    }

    repository::InMemoryProxyStore store;
    test::ManualClock clock;
    std::unique_ptr<proxy::SelectionEngine> engine;
    int sourceId{};
    int providerId{};
};

TEST_F(SelectionEngineTest, HandsOutByPriorityThenExhausts) {
    auto p1 = store.addProxy(test::makeProxy(sourceId, providerId, 100, clock.now() - 60s));
    auto p2 = store.addProxy(test::makeProxy(sourceId, providerId, 90, clock.now() - 60s));

    auto first = engine->acquire(sourceId);
    ASSERT_TRUE(first.has_value());
    EXPECT_EQ(first->proxyId, p1.id);
    EXPECT_EQ(first->address, p1.address);
    EXPECT_EQ(first->assignedAt, clock.now());

    auto second = engine->acquire(sourceId);
    ASSERT_TRUE(second.has_value());
    EXPECT_EQ(second->proxyId, p2.id);

    EXPECT_FALSE(engine->acquire(sourceId).has_value());
}

TEST_F(SelectionEngineTest, SkipsBlockedProxies) {
    store.addProxy(test::makeProxy(sourceId, providerId, 100, std::nullopt, true));
    auto p2 = store.addProxy(test::makeProxy(sourceId, providerId, 10));

    auto handle = engine->acquire(sourceId);
    ASSERT_TRUE(handle.has_value());
    EXPECT_EQ(handle->proxyId, p2.id);
}

TEST_F(SelectionEngineTest, TiesBreakOnLowestId) {
    auto a = store.addProxy(test::makeProxy(sourceId, providerId, 50));
    store.addProxy(test::makeProxy(sourceId, providerId, 50));

    auto handle = engine->acquire(sourceId);
    ASSERT_TRUE(handle.has_value());
    EXPECT_EQ(handle->proxyId, a.id);
}

TEST_F(SelectionEngineTest, ProxyReturnsAfterCooldown) {
    auto only = store.addProxy(test::makeProxy(sourceId, providerId, 1, std::nullopt, false, 30s));

    ASSERT_TRUE(engine->acquire(sourceId).has_value());
    clock.advance(10s);
    EXPECT_FALSE(engine->acquire(sourceId).has_value());
    clock.advance(20s);
    auto again = engine->acquire(sourceId);
    ASSERT_TRUE(again.has_value());
    EXPECT_EQ(again->proxyId, only.id);
}

TEST_F(SelectionEngineTest, UnknownSourceThrows) {
    EXPECT_THROW(engine->acquire(4242), util::NotFoundError);
}

TEST_F(SelectionEngineTest, SourceWithoutProxiesIsExhausted) {
    EXPECT_FALSE(engine->acquire(sourceId).has_value());
}

TEST_F(SelectionEngineTest, ConcurrentCallersNeverShareAProxy) {
    constexpr int kProxies = 8;
    constexpr int kThreads = 32;
    for (int i = 0; i < kProxies; ++i) {
        store.addProxy(test::makeProxy(sourceId, providerId, i % 3));
    }

    std::mutex resultsMutex;
    std::vector<int> assigned;
    std::atomic<int> exhausted{0};
    std::atomic<bool> go{false};

    std::vector<std::thread> threads;
    for (int t = 0; t < kThreads; ++t) {
        threads.emplace_back([&]() {
            while (!go.load()) {
                std::this_thread::yield();
            }
            auto handle = engine->acquire(sourceId);
            if (!handle) {
                ++exhausted;
                return;
            }
            std::scoped_lock lock(resultsMutex);
            assigned.push_back(handle->proxyId);
        });
    }
    go = true;
    for (auto& thread : threads) {
        thread.join();
    }

    std::set<int> distinct(assigned.begin(), assigned.end());
    EXPECT_EQ(distinct.size(), assigned.size());
    EXPECT_EQ(assigned.size(), static_cast<std::size_t>(kProxies));
    EXPECT_EQ(exhausted.load(), kThreads - kProxies);
}
