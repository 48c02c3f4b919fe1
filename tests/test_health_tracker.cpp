#include <gtest/gtest.h>
#include "TestSupport.hpp"

#include "proxykeeper/proxy/StatusCatalog.hpp"
#include "proxykeeper/repository/InMemoryProxyStore.hpp"
#include "proxykeeper/repository/InMemoryUsageStatisticsStore.hpp"
#include "proxykeeper/service/HealthTracker.hpp"
#include "proxykeeper/util/Errors.hpp"

#include <memory>

using namespace proxykeeper;
using namespace std::chrono_literals;

class HealthTrackerTest : public ::testing::Test {
protected:
    void SetUp() override {
        sourceId = proxies.addSource("crawler").id;
        providerId = proxies.addProvider("vendor").id;
        target = proxies.addProxy(test::makeProxy(sourceId, providerId, 100)).id;
        backup = proxies.addProxy(test::makeProxy(sourceId, providerId, 10)).id;
        tracker = std::make_unique<service::HealthTracker>(proxies, statistics, catalog,
                                                           proxy::BlockingPolicy{}, clock);
    }

    repository::InMemoryProxyStore proxies;
    repository::InMemoryUsageStatisticsStore statistics;
    proxy::StatusCatalog catalog = proxy::StatusCatalog::defaults();
    test::ManualClock clock;
    std::unique_ptr<service::HealthTracker> tracker;
    int sourceId{};
    int providerId{};
    int target{};
    int backup{};
};

TEST_F(HealthTrackerTest, SuccessIncrementsCounter) {
    auto first = tracker->report(target, 200);
    auto second = tracker->report(target, 200);
    EXPECT_EQ(first.counter, 1);
    EXPECT_EQ(second.counter, 2);
    EXPECT_FALSE(second.blocked);
    EXPECT_FALSE(second.newlyBlocked);

    auto stats = tracker->statistics(target);
    ASSERT_EQ(stats.size(), 1u);
    EXPECT_EQ(stats[0].statusCode, 200);
    EXPECT_EQ(stats[0].counter, 2);
}

TEST_F(HealthTrackerTest, RepeatedBlockingStatusesExcludeProxy) {
    tracker->report(target, 403);
    tracker->report(target, 429);
    EXPECT_FALSE(proxies.get(target)->blocked);

    auto result = tracker->report(target, 403);
    EXPECT_TRUE(result.blocked);
    EXPECT_TRUE(result.newlyBlocked);
    EXPECT_FALSE(result.reason.empty());

    auto eligible = proxies.listEligible(sourceId);
    ASSERT_EQ(eligible.size(), 1u);
    EXPECT_EQ(eligible[0].id, backup);
}

TEST_F(HealthTrackerTest, TransportFailureBlocksAndTouches) {
    auto result = tracker->report(target, proxy::kTransportFailureStatus);
    EXPECT_TRUE(result.newlyBlocked);
    auto stored = proxies.get(target);
    EXPECT_TRUE(stored->blocked);
    EXPECT_EQ(stored->lastTouched, clock.now());

    auto again = tracker->report(target, proxy::kTransportFailureStatus);
    EXPECT_TRUE(again.blocked);
    EXPECT_FALSE(again.newlyBlocked);
}

TEST_F(HealthTrackerTest, OldFailuresFallOutOfWindow) {
    tracker->report(target, 403);
    tracker->report(target, 403);
    clock.advance(11min);
    auto result = tracker->report(target, 403);
    EXPECT_FALSE(result.blocked);
    EXPECT_EQ(result.counter, 3);
}

TEST_F(HealthTrackerTest, SuccessDoesNotUnblock) {
    proxies.setBlocked(target, true, clock.now());
    auto result = tracker->report(target, 200);
    EXPECT_TRUE(result.blocked);
    EXPECT_TRUE(proxies.get(target)->blocked);
}

TEST_F(HealthTrackerTest, UnknownStatusLeavesStateUntouched) {
    EXPECT_THROW(tracker->report(target, 299), util::UnknownStatusError);
    EXPECT_TRUE(tracker->statistics(target).empty());
    EXPECT_FALSE(proxies.get(target)->blocked);
}

TEST_F(HealthTrackerTest, UnknownProxyThrowsNotFound) {
    EXPECT_THROW(tracker->report(4242, 200), util::NotFoundError);
    EXPECT_TRUE(tracker->statistics(4242).empty());
}

TEST_F(HealthTrackerTest, FailureRatioUsesWindow) {
    tracker->report(target, 404);
    clock.advance(2min);
    tracker->report(target, 200);
    tracker->report(target, 500);
    tracker->report(target, 200);

    EXPECT_DOUBLE_EQ(tracker->failureRatio(target, 10min), 0.5);
    EXPECT_NEAR(tracker->failureRatio(target, 1min), 1.0 / 3.0, 1e-9);
    EXPECT_DOUBLE_EQ(tracker->failureRatio(backup, 10min), 0.0);
}
