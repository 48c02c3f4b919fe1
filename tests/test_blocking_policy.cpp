#include <gtest/gtest.h>

#include "proxykeeper/proxy/BlockingPolicy.hpp"
#include "proxykeeper/proxy/StatusCatalog.hpp"

#include <vector>

using namespace proxykeeper;

namespace {

std::vector<model::OutcomeRecord> history(std::initializer_list<int> codes) {
    std::vector<model::OutcomeRecord> records;
    auto at = std::chrono::system_clock::time_point{};
    for (int code : codes) {
        records.push_back(model::OutcomeRecord{1, code, at});
        at += std::chrono::seconds(1);
    }
    return records;
}

} // namespace

TEST(BlockingPolicyTest, EmptyHistoryNeverBlocks) {
    proxy::BlockingPolicy policy;
    EXPECT_FALSE(policy.evaluate({}).block);
}

TEST(BlockingPolicyTest, TransportFailureBlocksImmediately) {
    proxy::BlockingPolicy policy;
    auto decision = policy.evaluate(history({200, 200, proxy::kTransportFailureStatus}));
    EXPECT_TRUE(decision.block);
    EXPECT_FALSE(decision.reason.empty());
}

TEST(BlockingPolicyTest, BlockingStatusesNeedThreshold) {
    proxy::BlockingPolicy policy;
    EXPECT_FALSE(policy.evaluate(history({403})).block);
    EXPECT_FALSE(policy.evaluate(history({403, 429})).block);
    EXPECT_TRUE(policy.evaluate(history({403, 200, 429, 502})).block);
}

TEST(BlockingPolicyTest, SuccessNeverBlocksEvenAfterFailures) {
    proxy::BlockingPolicy policy;
    EXPECT_FALSE(policy.evaluate(history({403, 403, 403, 200})).block);
}

TEST(BlockingPolicyTest, SiteSideErrorsDoNotCountTowardThreshold) {
    proxy::BlockingPolicy policy;
    EXPECT_FALSE(policy.evaluate(history({404, 404, 404, 404})).block);
}

TEST(BlockingPolicyTest, HighFailureRatioBlocksOnceEnoughSamples) {
    proxy::BlockingPolicy::Config config;
    config.minSamples = 5;
    config.maxFailureRatio = 0.8;
    proxy::BlockingPolicy policy(config);

    EXPECT_FALSE(policy.evaluate(history({404, 404, 404, 404})).block);
    EXPECT_TRUE(policy.evaluate(history({200, 404, 404, 404, 404})).block);
    EXPECT_FALSE(policy.evaluate(history({200, 200, 404, 404, 404})).block);
}

TEST(BlockingPolicyTest, CustomBlockingStatuses) {
    proxy::BlockingPolicy::Config config;
    config.blockingStatuses = {418};
    config.failureThreshold = 1;
    proxy::BlockingPolicy policy(config);

    EXPECT_TRUE(policy.evaluate(history({418})).block);
    EXPECT_FALSE(policy.evaluate(history({403})).block);
}

TEST(BlockingPolicyTest, FailureRatio) {
    EXPECT_DOUBLE_EQ(proxy::BlockingPolicy::failureRatio({}), 0.0);
    EXPECT_DOUBLE_EQ(proxy::BlockingPolicy::failureRatio(history({200, 500, 404, 301})), 0.5);
}

TEST(StatusCatalogTest, DefaultsCoverHttpAndTransportFailure) {
    auto catalog = proxy::StatusCatalog::defaults();
    EXPECT_TRUE(catalog.contains(200));
    EXPECT_TRUE(catalog.contains(407));
    EXPECT_TRUE(catalog.contains(proxy::kTransportFailureStatus));
    EXPECT_FALSE(catalog.contains(299));
    EXPECT_EQ(catalog.describe(404).value_or(""), "Not Found");
    EXPECT_FALSE(catalog.describe(999).has_value());
}

TEST(StatusCatalogTest, FailureClassification) {
    EXPECT_FALSE(proxy::StatusCatalog::isFailure(200));
    EXPECT_FALSE(proxy::StatusCatalog::isFailure(399));
    EXPECT_TRUE(proxy::StatusCatalog::isFailure(400));
    EXPECT_TRUE(proxy::StatusCatalog::isFailure(proxy::kTransportFailureStatus));
}

TEST(StatusCatalogTest, CustomCatalogReplacesDefaults) {
    proxy::StatusCatalog catalog({{200, "OK"}, {503, "Down"}});
    EXPECT_EQ(catalog.size(), 2u);
    EXPECT_FALSE(catalog.contains(404));
}
