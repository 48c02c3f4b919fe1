#pragma once

#include <boost/json.hpp>

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace proxykeeper::util {

boost::json::value parseJson(const std::string& payload);
std::string stringifyJson(const boost::json::value& value);

// Reads the whole file; std::nullopt when it does not exist or cannot be opened.
std::optional<boost::json::value> readJsonFile(const std::string& path);

std::optional<std::string> readString(const boost::json::object& obj, std::string_view key);
std::optional<std::int64_t> readInt(const boost::json::object& obj, std::string_view key);
std::optional<double> readDouble(const boost::json::object& obj, std::string_view key);
std::optional<bool> readBool(const boost::json::object& obj, std::string_view key);

} // namespace proxykeeper::util
