#pragma once

#include <boost/json.hpp>

#include <cstdint>
#include <string>

namespace proxykeeper::repository {

struct DatabaseConfig {
    std::string host{"127.0.0.1"};
    std::uint16_t port{33060};
    std::string user{"root"};
    std::string password;
    std::string database{"proxykeeper"};
    std::string charset{"utf8mb4"};
    unsigned int poolSize{8};
};

// Fields absent from the object keep the values already in `base`.
DatabaseConfig loadConfig(const boost::json::object& json, DatabaseConfig base = {});

} // namespace proxykeeper::repository
