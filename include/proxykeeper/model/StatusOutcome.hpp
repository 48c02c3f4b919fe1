#pragma once

#include <string>

namespace proxykeeper::model {

struct StatusOutcome {
    int code{};
    std::string description;
};

} // namespace proxykeeper::model
