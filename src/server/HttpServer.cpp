#include "proxykeeper/server/HttpServer.hpp"
#include "proxykeeper/server/Router.hpp"
#include "proxykeeper/server/RequestContext.hpp"
#include "proxykeeper/util/JsonResponse.hpp"
#include "proxykeeper/util/Logging.hpp"

#include <boost/asio/strand.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <boost/json.hpp>

#include <chrono>
#include <exception>
#include <memory>
#include <string>
#include <unordered_map>
#include <utility>

namespace proxykeeper::server {
namespace {

void writeErrorBody(RequestContext& ctx, boost::beast::http::status status, std::string_view code, std::string_view message) {
    boost::json::object body;
    body["error"] = std::string(code);
    body["message"] = std::string(message);
    ctx.response.result(status);
    ctx.response.set(boost::beast::http::field::content_type, "application/json");
    ctx.response.body() = boost::json::serialize(body);
    ctx.response.prepare_payload();
}

class HttpSession : public std::enable_shared_from_this<HttpSession> {
public:
    HttpSession(boost::asio::ip::tcp::socket socket, std::shared_ptr<Router> router)
        : stream_(std::move(socket)), router_(std::move(router)) {}

    void start() { readRequest(); }

private:
    void readRequest() {
        request_ = {};
        boost::beast::http::async_read(stream_, buffer_, request_,
            boost::asio::bind_executor(stream_.get_executor(),
            [self = shared_from_this()](boost::system::error_code ec, std::size_t) {
                if (ec) {
                    self->doClose();
                    return;
                }
                self->dispatch();
            }));
    }

    void dispatch() {
        RequestContext ctx;
        ctx.startedAt = std::chrono::steady_clock::now();
        ctx.request = std::move(request_);
        ctx.response.version(ctx.request.version());
        ctx.response.keep_alive(ctx.request.keep_alive());

        std::string method(ctx.request.method_string());
        std::string target(ctx.request.target());
        ctx.queryParameters = Router::parseQuery(target);

        std::unordered_map<std::string, std::string> params;
        auto resolution = router_->resolve(method, target, params);
        ctx.pathParameters = std::move(params);

        switch (resolution.result) {
        case Router::MatchResult::notFound:
            writeErrorBody(ctx, boost::beast::http::status::not_found, "not_found", "No route for " + target);
            break;
        case Router::MatchResult::methodNotAllowed:
            writeErrorBody(ctx, boost::beast::http::status::method_not_allowed, "method_not_allowed",
                           method + " is not supported on this path");
            break;
        case Router::MatchResult::matched:
            try {
                resolution.handler(ctx);
            } catch (const std::exception& ex) {
                util::log(util::LogLevel::error, method + " " + target + " failed: " + ex.what());
                writeErrorBody(ctx, boost::beast::http::status::internal_server_error, "internal", ex.what());
            }
            if (ctx.response.body().empty() && ctx.response.result() == boost::beast::http::status::ok) {
                ctx.response.result(boost::beast::http::status::no_content);
                ctx.response.prepare_payload();
            }
            break;
        }

        wrapJsonEnvelope(ctx, target);

        auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - ctx.startedAt);
        util::log(util::LogLevel::debug,
                  method + " " + target + " -> " + std::to_string(ctx.response.result_int()) + " in " +
                      std::to_string(elapsed.count()) + "ms");

        auto response = std::make_shared<RequestContext::HttpResponse>(std::move(ctx.response));
        boost::beast::http::async_write(stream_, *response,
            boost::asio::bind_executor(stream_.get_executor(),
            [self = shared_from_this(), response](boost::system::error_code ec, std::size_t) {
                if (ec || !response->keep_alive()) {
                    self->doClose();
                    return;
                }
                self->readRequest();
            }));
    }

    void doClose() {
        boost::system::error_code ec;
        stream_.socket().shutdown(boost::asio::ip::tcp::socket::shutdown_both, ec);
        stream_.socket().close(ec);
    }

    // Handlers write bare JSON; successful bodies become "data", failed ones
    // carry {"error":code,"message":text} and become "error".
    void wrapJsonEnvelope(RequestContext& ctx, const std::string& target) {
        auto& response = ctx.response;
        if (response.body().empty()) {
            return;
        }
        auto contentType = response.find(boost::beast::http::field::content_type);
        if (contentType == response.end() ||
            std::string(contentType->value()).find("application/json") == std::string::npos) {
            return;
        }

        auto path = target.substr(0, target.find('?'));
        bool success = response.result_int() >= 200 && response.result_int() < 400;

        boost::json::value parsed;
        try {
            parsed = boost::json::parse(response.body());
        } catch (const std::exception&) {
            parsed = boost::json::string(response.body());
        }

        boost::json::object envelope;
        if (success) {
            envelope = util::makeSuccessEnvelope(parsed, path);
        } else {
            std::string code = "error";
            std::string message;
            if (parsed.is_object()) {
                const auto& object = parsed.as_object();
                if (auto it = object.if_contains("error"); it && it->is_string()) code = std::string(it->as_string());
                if (auto it = object.if_contains("message"); it && it->is_string()) message = std::string(it->as_string());
            }
            envelope = util::makeErrorEnvelope(code, message, path);
        }

        response.body() = boost::json::serialize(envelope);
        response.set(boost::beast::http::field::content_type, "application/json; charset=utf-8");
        response.prepare_payload();
    }

    boost::beast::tcp_stream stream_;
    boost::beast::flat_buffer buffer_;
    RequestContext::HttpRequest request_;
    std::shared_ptr<Router> router_;
};

} // namespace

HttpServer::HttpServer(boost::asio::io_context& io,
                       std::shared_ptr<Router> router,
                       std::string host,
                       unsigned short port)
    : io_(io)
    , acceptor_(io)
    , router_(std::move(router))
    , host_(std::move(host))
    , port_(port) {}

void HttpServer::start() {
    if (running_.exchange(true)) {
        return;
    }

    boost::asio::ip::tcp::endpoint endpoint{
        boost::asio::ip::make_address(host_), port_};

    acceptor_.open(endpoint.protocol());
    acceptor_.set_option(boost::asio::socket_base::reuse_address(true));
    acceptor_.bind(endpoint);
    acceptor_.listen();
    port_ = acceptor_.local_endpoint().port();

    util::log(util::LogLevel::info, "HTTP server listening on " + host_ + ":" + std::to_string(port_));
    doAccept();
}

void HttpServer::stop() {
    if (!running_.exchange(false)) {
        return;
    }
    boost::system::error_code ec;
    acceptor_.cancel(ec);
    acceptor_.close(ec);
}

void HttpServer::doAccept() {
    acceptor_.async_accept(
        boost::asio::make_strand(io_),
        [self = shared_from_this()](boost::system::error_code ec, boost::asio::ip::tcp::socket socket) {
            if (!self->running_) {
                return;
            }

            if (!ec) {
                std::make_shared<HttpSession>(std::move(socket), self->router_)->start();
            }

            self->doAccept();
        });
}

} // namespace proxykeeper::server
