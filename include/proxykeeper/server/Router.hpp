#pragma once

#include "proxykeeper/server/RequestContext.hpp"

#include <functional>
#include <regex>
#include <string>
#include <unordered_map>
#include <vector>

namespace proxykeeper::server {

// Matches "METHOD /path/:param" routes. Query strings are ignored for
// matching and exposed separately through parseQuery().
class Router {
public:
    using Handler = std::function<void(RequestContext&)>;

    enum class MatchResult {
        matched,
        methodNotAllowed,
        notFound
    };

    struct Resolution {
        MatchResult result{MatchResult::notFound};
        Handler handler;
    };

    void addRoute(std::string method, std::string path, Handler handler);

    Resolution resolve(const std::string& method,
                       const std::string& target,
                       std::unordered_map<std::string, std::string>& params) const;

    std::size_t routeCount() const noexcept { return routes_.size(); }

    static std::unordered_map<std::string, std::string> parseQuery(const std::string& target);

private:
    struct RouteEntry {
        std::string method;
        std::string path;
        std::regex pattern;
        std::vector<std::string> tokens;
        Handler handler;
    };

    std::vector<RouteEntry> routes_;
};

} // namespace proxykeeper::server
