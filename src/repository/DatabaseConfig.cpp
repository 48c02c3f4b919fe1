#include "proxykeeper/repository/DatabaseConfig.hpp"
#include "proxykeeper/util/JsonUtil.hpp"

#include <utility>

namespace proxykeeper::repository {

DatabaseConfig loadConfig(const boost::json::object& json, DatabaseConfig base) {
    DatabaseConfig cfg = std::move(base);
    if (auto value = util::readString(json, "host")) cfg.host = *value;
    if (auto value = util::readInt(json, "port"); value && *value > 0) cfg.port = static_cast<std::uint16_t>(*value);
    if (auto value = util::readString(json, "user")) cfg.user = *value;
    if (auto value = util::readString(json, "password")) cfg.password = *value;
    if (auto value = util::readString(json, "database")) cfg.database = *value;
    if (auto value = util::readString(json, "charset")) cfg.charset = *value;
    if (auto value = util::readInt(json, "poolSize"); value && *value > 0) cfg.poolSize = static_cast<unsigned int>(*value);
    return cfg;
}

} // namespace proxykeeper::repository
