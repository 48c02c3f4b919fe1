#pragma once

#include <string>

namespace proxykeeper::model {

struct Source {
    int id{};
    std::string name;
};

} // namespace proxykeeper::model
