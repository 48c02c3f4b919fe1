#include "proxykeeper/util/JsonUtil.hpp"

#include <filesystem>
#include <fstream>
#include <iterator>

namespace proxykeeper::util {

boost::json::value parseJson(const std::string& payload) {
    return boost::json::parse(payload);
}

std::string stringifyJson(const boost::json::value& value) {
    return boost::json::serialize(value);
}

std::optional<boost::json::value> readJsonFile(const std::string& path) {
    if (path.empty() || !std::filesystem::exists(path)) {
        return std::nullopt;
    }
    std::ifstream ifs(path);
    if (!ifs.is_open()) {
        return std::nullopt;
    }
    std::string content((std::istreambuf_iterator<char>(ifs)), std::istreambuf_iterator<char>());
    if (content.empty()) {
        return std::nullopt;
    }
    return parseJson(content);
}

std::optional<std::string> readString(const boost::json::object& obj, std::string_view key) {
    if (auto it = obj.if_contains(key); it && it->is_string()) {
        return std::string(it->as_string());
    }
    return std::nullopt;
}

std::optional<std::int64_t> readInt(const boost::json::object& obj, std::string_view key) {
    if (auto it = obj.if_contains(key)) {
        if (it->is_int64()) {
            return it->as_int64();
        }
        if (it->is_uint64()) {
            return static_cast<std::int64_t>(it->as_uint64());
        }
    }
    return std::nullopt;
}

std::optional<double> readDouble(const boost::json::object& obj, std::string_view key) {
    if (auto it = obj.if_contains(key)) {
        if (it->is_double()) {
            return it->as_double();
        }
        if (it->is_int64()) {
            return static_cast<double>(it->as_int64());
        }
    }
    return std::nullopt;
}

std::optional<bool> readBool(const boost::json::object& obj, std::string_view key) {
    if (auto it = obj.if_contains(key)) {
        if (it->is_bool()) {
            return it->as_bool();
        }
        if (it->is_int64()) {
            return it->as_int64() != 0;
        }
    }
    return std::nullopt;
}

} // namespace proxykeeper::util
