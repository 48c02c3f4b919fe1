#include "proxykeeper/controller/PoolController.hpp"
#include "proxykeeper/util/Errors.hpp"
#include "proxykeeper/util/JsonResponse.hpp"
#include "proxykeeper/util/JsonUtil.hpp"
#include "proxykeeper/util/Logging.hpp"

#include <boost/beast/http.hpp>
#include <boost/json.hpp>

#include <chrono>
#include <cstdint>
#include <cstdlib>
#include <exception>
#include <optional>
#include <string>

namespace proxykeeper::controller {

namespace {

namespace http = boost::beast::http;

void sendJson(proxykeeper::server::RequestContext& ctx, const boost::json::value& value,
              http::status status = http::status::ok) {
    ctx.response.result(status);
    ctx.response.set(http::field::content_type, "application/json; charset=utf-8");
    ctx.response.body() = util::stringifyJson(value);
    ctx.response.prepare_payload();
}

void sendError(proxykeeper::server::RequestContext& ctx, http::status status, const std::string& code,
               const std::string& message) {
    boost::json::object body;
    body["error"] = code;
    body["message"] = message;
    sendJson(ctx, body, status);
}

void sendPoolError(proxykeeper::server::RequestContext& ctx, const util::PoolError& error) {
    switch (error.code()) {
    case util::ErrorCode::notFound:
        sendError(ctx, http::status::not_found, "not_found", error.what());
        return;
    case util::ErrorCode::unknownStatus:
        sendError(ctx, http::status::unprocessable_entity, "unknown_status", error.what());
        return;
    case util::ErrorCode::unavailable:
        sendError(ctx, http::status::service_unavailable, "unavailable", error.what());
        return;
    }
    sendError(ctx, http::status::internal_server_error, "internal", error.what());
}

std::optional<int> parseId(const std::string& text) {
    if (text.empty()) {
        return std::nullopt;
    }
    char* end = nullptr;
    long value = std::strtol(text.c_str(), &end, 10);
    if (*end != '\0' || value <= 0 || value > 2147483647L) {
        return std::nullopt;
    }
    return static_cast<int>(value);
}

std::optional<int> pathId(proxykeeper::server::RequestContext& ctx, const std::string& name) {
    auto it = ctx.pathParameters.find(name);
    if (it == ctx.pathParameters.end()) {
        return std::nullopt;
    }
    return parseId(it->second);
}

std::optional<boost::json::object> parseBody(proxykeeper::server::RequestContext& ctx) {
    try {
        auto json = util::parseJson(ctx.request.body());
        if (json.is_object()) {
            return json.as_object();
        }
    } catch (const std::exception& ex) {
        util::log(util::LogLevel::debug, std::string("Rejected request body: ") + ex.what());
    }
    return std::nullopt;
}

boost::json::object proxyToJson(const model::Proxy& proxy) {
    boost::json::object json;
    json["id"] = proxy.id;
    json["address"] = proxy.address;
    json["sourceId"] = proxy.sourceId;
    json["providerId"] = proxy.providerId;
    json["priority"] = proxy.priority;
    json["blocked"] = proxy.blocked;
    json["usageCooldownSeconds"] = static_cast<std::int64_t>(proxy.usageCooldown.count());
    json["lastTouched"] = util::optionalTimestamp(proxy.lastTouched);
    return json;
}

} // namespace

PoolController::PoolController(proxy::SelectionEngine& engine,
                               service::HealthTracker& tracker,
                               service::TaskScheduler& scheduler,
                               repository::ProxyRecordStore& store,
                               const proxy::StatusCatalog& catalog,
                               const util::Clock& clock)
    : engine_(engine)
    , tracker_(tracker)
    , scheduler_(scheduler)
    , store_(store)
    , catalog_(catalog)
    , clock_(clock) {}

void PoolController::registerRoutes(proxykeeper::server::Router& router) {
    router.addRoute("GET", "/health", [this](auto& ctx) { handleHealth(ctx); });
    router.addRoute("GET", "/api/sources", [this](auto& ctx) { handleListSources(ctx); });
    router.addRoute("GET", "/api/sources/:sourceId/next", [this](auto& ctx) { handleNextProxy(ctx); });
    router.addRoute("GET", "/api/sources/:sourceId/proxies", [this](auto& ctx) { handleListProxies(ctx); });
    router.addRoute("POST", "/api/proxies/:proxyId/reports", [this](auto& ctx) { handleReport(ctx); });
    router.addRoute("GET", "/api/proxies/:proxyId/statistics", [this](auto& ctx) { handleStatistics(ctx); });
    router.addRoute("PUT", "/api/proxies/:proxyId/blocked", [this](auto& ctx) { handleSetBlocked(ctx); });
    router.addRoute("POST", "/api/admin/reconcile", [this](auto& ctx) { handleReconcile(ctx); });
}

void PoolController::handleHealth(proxykeeper::server::RequestContext& ctx) {
    boost::json::object body;
    body["status"] = "ok";
    body["reconcilingSources"] = scheduler_.inFlightCount();
    sendJson(ctx, body);
}

void PoolController::handleListSources(proxykeeper::server::RequestContext& ctx) {
    try {
        boost::json::array sources;
        for (const auto& source : store_.listSources()) {
            boost::json::object item;
            item["id"] = source.id;
            item["name"] = source.name;
            sources.push_back(std::move(item));
        }
        sendJson(ctx, sources);
    } catch (const util::PoolError& ex) {
        sendPoolError(ctx, ex);
    }
}

void PoolController::handleNextProxy(proxykeeper::server::RequestContext& ctx) {
    auto sourceId = pathId(ctx, "sourceId");
    if (!sourceId) {
        sendError(ctx, http::status::bad_request, "bad_request", "sourceId must be a positive integer");
        return;
    }
    try {
        auto handle = engine_.acquire(*sourceId);
        if (!handle) {
            sendError(ctx, http::status::service_unavailable, "exhausted",
                      "No proxy of source " + std::to_string(*sourceId) + " is available right now");
            return;
        }
        boost::json::object body;
        body["proxyId"] = handle->proxyId;
        body["address"] = handle->address;
        body["sourceId"] = handle->sourceId;
        body["providerId"] = handle->providerId;
        body["priority"] = handle->priority;
        body["usageCooldownSeconds"] = static_cast<std::int64_t>(handle->usageCooldown.count());
        body["assignedAt"] = util::formatIsoTimestamp(handle->assignedAt);
        sendJson(ctx, body);
    } catch (const util::PoolError& ex) {
        sendPoolError(ctx, ex);
    }
}

void PoolController::handleListProxies(proxykeeper::server::RequestContext& ctx) {
    auto sourceId = pathId(ctx, "sourceId");
    if (!sourceId) {
        sendError(ctx, http::status::bad_request, "bad_request", "sourceId must be a positive integer");
        return;
    }
    try {
        if (!store_.findSource(*sourceId)) {
            throw util::NotFoundError("Source " + std::to_string(*sourceId) + " does not exist");
        }
        boost::json::array proxies;
        for (const auto& proxy : store_.listBySource(*sourceId)) {
            proxies.push_back(proxyToJson(proxy));
        }
        sendJson(ctx, proxies);
    } catch (const util::PoolError& ex) {
        sendPoolError(ctx, ex);
    }
}

void PoolController::handleReport(proxykeeper::server::RequestContext& ctx) {
    auto proxyId = pathId(ctx, "proxyId");
    if (!proxyId) {
        sendError(ctx, http::status::bad_request, "bad_request", "proxyId must be a positive integer");
        return;
    }
    auto body = parseBody(ctx);
    auto statusCode = body ? util::readInt(*body, "statusCode") : std::nullopt;
    if (!statusCode) {
        sendError(ctx, http::status::bad_request, "bad_request", "Body must be {\"statusCode\": <int>}");
        return;
    }
    try {
        auto result = tracker_.report(*proxyId, static_cast<int>(*statusCode));
        boost::json::object json;
        json["proxyId"] = result.proxyId;
        json["statusCode"] = result.statusCode;
        json["counter"] = result.counter;
        json["blocked"] = result.blocked;
        json["newlyBlocked"] = result.newlyBlocked;
        if (!result.reason.empty()) {
            json["reason"] = result.reason;
        }
        sendJson(ctx, json);
    } catch (const util::PoolError& ex) {
        sendPoolError(ctx, ex);
    }
}

void PoolController::handleStatistics(proxykeeper::server::RequestContext& ctx) {
    auto proxyId = pathId(ctx, "proxyId");
    if (!proxyId) {
        sendError(ctx, http::status::bad_request, "bad_request", "proxyId must be a positive integer");
        return;
    }
    auto window = tracker_.policy().config().window;
    if (auto it = ctx.queryParameters.find("windowSeconds"); it != ctx.queryParameters.end()) {
        auto seconds = parseId(it->second);
        if (!seconds) {
            sendError(ctx, http::status::bad_request, "bad_request", "windowSeconds must be a positive integer");
            return;
        }
        window = std::chrono::seconds(*seconds);
    }
    try {
        auto proxy = store_.get(*proxyId);
        if (!proxy) {
            throw util::NotFoundError("Proxy " + std::to_string(*proxyId) + " does not exist");
        }
        boost::json::array counters;
        for (const auto& stat : tracker_.statistics(*proxyId)) {
            boost::json::object item;
            item["statusCode"] = stat.statusCode;
            item["description"] = catalog_.describe(stat.statusCode).value_or("");
            item["counter"] = stat.counter;
            counters.push_back(std::move(item));
        }
        boost::json::object json;
        json["proxy"] = proxyToJson(*proxy);
        json["counters"] = std::move(counters);
        json["windowSeconds"] = static_cast<std::int64_t>(window.count());
        json["failureRatio"] = tracker_.failureRatio(*proxyId, window);
        sendJson(ctx, json);
    } catch (const util::PoolError& ex) {
        sendPoolError(ctx, ex);
    }
}

void PoolController::handleSetBlocked(proxykeeper::server::RequestContext& ctx) {
    auto proxyId = pathId(ctx, "proxyId");
    if (!proxyId) {
        sendError(ctx, http::status::bad_request, "bad_request", "proxyId must be a positive integer");
        return;
    }
    auto body = parseBody(ctx);
    auto blocked = body ? util::readBool(*body, "blocked") : std::nullopt;
    if (!blocked) {
        sendError(ctx, http::status::bad_request, "bad_request", "Body must be {\"blocked\": <bool>}");
        return;
    }
    try {
        // Refreshes lastTouched, so an unblocked proxy waits out its usage cooldown.
        if (!store_.setBlocked(*proxyId, *blocked, clock_.now())) {
            throw util::NotFoundError("Proxy " + std::to_string(*proxyId) + " does not exist");
        }
        util::log(util::LogLevel::info,
                  "Proxy " + std::to_string(*proxyId) + (*blocked ? " blocked" : " unblocked") + " by operator");
        auto proxy = store_.get(*proxyId);
        if (!proxy) {
            throw util::NotFoundError("Proxy " + std::to_string(*proxyId) + " does not exist");
        }
        sendJson(ctx, proxyToJson(*proxy));
    } catch (const util::PoolError& ex) {
        sendPoolError(ctx, ex);
    }
}

void PoolController::handleReconcile(proxykeeper::server::RequestContext& ctx) {
    boost::json::object json;
    json["dispatched"] = scheduler_.runReconciliationTick();
    json["inFlight"] = scheduler_.inFlightCount();
    json["queued"] = scheduler_.queuedCount();
    sendJson(ctx, json, http::status::accepted);
}

} // namespace proxykeeper::controller
