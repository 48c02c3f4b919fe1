#pragma once

#include <boost/json.hpp>

#include <chrono>
#include <ctime>
#include <iomanip>
#include <optional>
#include <sstream>
#include <string>
#include <string_view>

namespace proxykeeper::util {

inline std::string formatIsoTimestamp(std::chrono::system_clock::time_point timePoint) {
    const std::time_t time = std::chrono::system_clock::to_time_t(timePoint);
    std::tm tm{};
#if defined(_WIN32)
    gmtime_s(&tm, &time);
#else
    gmtime_r(&time, &tm);
#endif
    std::ostringstream oss;
    oss << std::put_time(&tm, "%Y-%m-%dT%H:%M:%SZ");
    return oss.str();
}

inline boost::json::value optionalTimestamp(const std::optional<std::chrono::system_clock::time_point>& timePoint) {
    if (!timePoint) {
        return nullptr;
    }
    return boost::json::value(formatIsoTimestamp(*timePoint));
}

// Envelope: {"success":true,"timestamp":...,"path":...,"data":...}
inline boost::json::object makeSuccessEnvelope(const boost::json::value& data, std::string_view endpoint) {
    boost::json::object envelope;
    envelope["success"] = true;
    envelope["timestamp"] = formatIsoTimestamp(std::chrono::system_clock::now());
    if (!endpoint.empty()) {
        envelope["path"] = std::string(endpoint);
    }
    envelope["data"] = data;
    return envelope;
}

// Envelope: {"success":false,"timestamp":...,"path":...,"error":{"code":...,"message":...}}
inline boost::json::object makeErrorEnvelope(std::string_view code,
                                             std::string_view message,
                                             std::string_view endpoint) {
    boost::json::object errorObj;
    errorObj["code"] = code.empty() ? std::string("error") : std::string(code);
    if (!message.empty()) {
        errorObj["message"] = std::string(message);
    }

    boost::json::object envelope;
    envelope["success"] = false;
    envelope["timestamp"] = formatIsoTimestamp(std::chrono::system_clock::now());
    if (!endpoint.empty()) {
        envelope["path"] = std::string(endpoint);
    }
    envelope["error"] = std::move(errorObj);
    return envelope;
}

} // namespace proxykeeper::util
