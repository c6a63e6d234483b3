#include "http_directory.hpp"

#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>

#include "messages.hpp"

namespace clouddrop {

namespace beast = boost::beast;
namespace http = boost::beast::http;
using tcp = boost::asio::ip::tcp;

bool parse_ice_servers_json(const std::string& body, std::vector<TraversalServer>& out, std::string& err) {
    Json::Value root;
    if (!parse_json(body, root, &err)) return false;

    if (!root.isObject() || !root["iceServers"].isArray()) {
        err = "missing iceServers";
        return false;
    }

    out.clear();
    for (const auto& entry : root["iceServers"]) {
        if (!entry.isObject()) continue;
        TraversalServer s;
        const Json::Value& urls = entry.isMember("urls") ? entry["urls"] : entry["url"];
        if (urls.isString()) {
            s.urls.push_back(urls.asString());
        } else if (urls.isArray()) {
            for (const auto& u : urls) {
                if (u.isString()) s.urls.push_back(u.asString());
            }
        }
        auto kind = classify(s.urls);
        if (!kind) continue;
        s.kind = *kind;
        s.username = entry.get("username", "").asString();
        s.credential = entry.get("credential", "").asString();
        out.push_back(std::move(s));
    }
    return true;
}

// One GET in flight; owns the socket, buffers and the handler until it completes.
struct HttpServerDirectory::Request : std::enable_shared_from_this<HttpServerDirectory::Request> {
    Request(boost::asio::io_context& io, Url u, Logger& l, FetchHandler h)
        : resolver(io), stream(io), deadline(io), url(std::move(u)), logger(l), handler(std::move(h)) {}

    tcp::resolver resolver;
    beast::tcp_stream stream;
    boost::asio::steady_timer deadline;
    Url url;
    Logger& logger;
    FetchHandler handler;
    beast::flat_buffer buffer;
    http::request<http::empty_body> req;
    http::response<http::string_body> res;
    bool done = false;

    void fail(const boost::system::error_code& ec, const std::string& where) {
        if (done) return;
        logger.warn("directory " + where + " failed: " + ec.message());
        finish(ec, {});
    }

    void finish(const boost::system::error_code& ec, std::vector<TraversalServer> servers) {
        if (done) return;
        done = true;
        deadline.cancel();
        resolver.cancel();
        beast::error_code ignored;
        stream.socket().shutdown(tcp::socket::shutdown_both, ignored);
        stream.close();
        auto h = std::move(handler);
        h(ec, std::move(servers));
    }

    void start(std::chrono::milliseconds timeout) {
        req.version(11);
        req.method(http::verb::get);
        req.target(url.target);
        req.set(http::field::host, url.host);
        req.set(http::field::user_agent, "clouddrop/1.0");
        req.set(http::field::accept, "application/json");

        auto self = shared_from_this();
        deadline.expires_after(timeout);
        deadline.async_wait([self](const boost::system::error_code& ec) {
            if (ec == boost::asio::error::operation_aborted || self->done) return;
            self->fail(boost::asio::error::timed_out, "request");
        });
        resolver.async_resolve(url.host, std::to_string(url.port),
                               [self](const beast::error_code& ec, tcp::resolver::results_type results) {
            if (ec) return self->fail(ec, "resolve");
            self->stream.async_connect(results, [self](const beast::error_code& ec, const tcp::endpoint&) {
                if (ec) return self->fail(ec, "connect");
                http::async_write(self->stream, self->req, [self](const beast::error_code& ec, std::size_t) {
                    if (ec) return self->fail(ec, "write");
                    http::async_read(self->stream, self->buffer, self->res,
                                     [self](const beast::error_code& ec, std::size_t) {
                        if (ec) return self->fail(ec, "read");
                        self->on_response();
                    });
                });
            });
        });
    }

    void on_response() {
        if (res.result() != http::status::ok) {
            logger.warn("directory HTTP status " + std::to_string(res.result_int()));
            finish(boost::system::errc::make_error_code(boost::system::errc::protocol_error), {});
            return;
        }
        std::vector<TraversalServer> servers;
        std::string err;
        if (!parse_ice_servers_json(res.body(), servers, err)) {
            logger.warn("directory bad response: " + err);
            finish(boost::system::errc::make_error_code(boost::system::errc::bad_message), {});
            return;
        }
        logger.info("directory fetched " + std::to_string(servers.size()) + " servers");
        finish({}, std::move(servers));
    }
};

HttpServerDirectory::HttpServerDirectory(boost::asio::io_context& io, Url url, Logger& logger)
    : io_(io), url_(std::move(url)), logger_(logger) {}

void HttpServerDirectory::fetch(std::chrono::milliseconds timeout, FetchHandler handler) {
    auto req = std::make_shared<Request>(io_, url_, logger_, std::move(handler));
    req->start(timeout);
}

} // namespace clouddrop
