#pragma once

#include <string>

namespace proxykeeper::model {

struct Provider {
    int id{};
    std::string name;
};

} // namespace proxykeeper::model
