#include "proxykeeper/server/Router.hpp"

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <sstream>

namespace proxykeeper::server {
namespace {
std::string normalizeMethod(std::string method) {
    std::transform(method.begin(), method.end(), method.begin(), [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    return method;
}

std::string stripQuery(const std::string& target) {
    auto queryPos = target.find('?');
    if (queryPos == std::string::npos) {
        return target;
    }
    auto path = target.substr(0, queryPos);
    return path.empty() ? std::string("/") : path;
}

std::string urlDecode(const std::string& value) {
    std::string result;
    result.reserve(value.size());
    for (std::size_t i = 0; i < value.size(); ++i) {
        char c = value[i];
        if (c == '+') {
            result.push_back(' ');
        } else if (c == '%' && i + 2 < value.size()) {
            auto hex = value.substr(i + 1, 2);
            result.push_back(static_cast<char>(std::strtol(hex.c_str(), nullptr, 16)));
            i += 2;
        } else {
            result.push_back(c);
        }
    }
    return result;
}
}

void Router::addRoute(std::string method, std::string path, Handler handler) {
    RouteEntry entry;
    entry.method = normalizeMethod(std::move(method));
    entry.path = std::move(path);
    entry.handler = std::move(handler);

    std::string token;
    std::ostringstream regexBuilder;
    regexBuilder << '^';

    std::istringstream iss(entry.path);
    while (std::getline(iss, token, '/')) {
        if (token.empty()) {
            continue;
        }
        regexBuilder << '/';
        if (token.front() == ':') {
            entry.tokens.push_back(token.substr(1));
            regexBuilder << "([^/]+)";
        } else {
            regexBuilder << token;
        }
    }

    regexBuilder << "/?$";
    entry.pattern = std::regex(regexBuilder.str());

    routes_.push_back(std::move(entry));
}

Router::Resolution Router::resolve(const std::string& method,
                                   const std::string& target,
                                   std::unordered_map<std::string, std::string>& params) const {
    auto normalized = normalizeMethod(method);
    auto path = stripQuery(target);

    Resolution resolution;
    for (const auto& entry : routes_) {
        std::smatch match;
        if (!std::regex_match(path, match, entry.pattern)) {
            continue;
        }
        if (entry.method != normalized) {
            resolution.result = MatchResult::methodNotAllowed;
            continue;
        }
        params.clear();
        for (std::size_t i = 0; i < entry.tokens.size() && i + 1 < match.size(); ++i) {
            params.emplace(entry.tokens[i], urlDecode(match[i + 1].str()));
        }
        resolution.result = MatchResult::matched;
        resolution.handler = entry.handler;
        return resolution;
    }
    return resolution;
}

std::unordered_map<std::string, std::string> Router::parseQuery(const std::string& target) {
    std::unordered_map<std::string, std::string> params;
    auto pos = target.find('?');
    if (pos == std::string::npos) {
        return params;
    }
    auto query = target.substr(pos + 1);
    std::size_t start = 0;
    while (start < query.size()) {
        auto end = query.find('&', start);
        if (end == std::string::npos) {
            end = query.size();
        }
        auto token = query.substr(start, end - start);
        if (!token.empty()) {
            auto eq = token.find('=');
            if (eq != std::string::npos) {
                params.emplace(urlDecode(token.substr(0, eq)), urlDecode(token.substr(eq + 1)));
            } else {
                params.emplace(urlDecode(token), "");
            }
        }
        start = end + 1;
    }
    return params;
}

} // namespace proxykeeper::server
