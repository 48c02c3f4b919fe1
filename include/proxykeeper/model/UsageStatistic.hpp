#pragma once

#include <chrono>
#include <cstdint>

namespace proxykeeper::model {

struct UsageStatistic {
    int id{};
    int proxyId{};
    int statusCode{};
    std::int64_t counter{};
};

struct OutcomeRecord {
    int proxyId{};
    int statusCode{};
    std::chrono::system_clock::time_point reportedAt{};
};

} // namespace proxykeeper::model
