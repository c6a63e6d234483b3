#include "ws_signaling.hpp"

#include "messages.hpp"

namespace clouddrop {

namespace beast = boost::beast;
namespace websocket = boost::beast::websocket;
using tcp = boost::asio::ip::tcp;

WebSocketSignaling::WebSocketSignaling(boost::asio::io_context& io,
                                       Url url,
                                       std::string room,
                                       Options opts,
                                       Logger& logger)
    : io_(io),
      url_(std::move(url)),
      room_(std::move(room)),
      opts_(opts),
      logger_(logger),
      resolver_(io),
      reconnect_timer_(io) {}

WebSocketSignaling::~WebSocketSignaling() {
    stopped_ = true;
    reconnect_timer_.cancel();
    if (ws_) {
        beast::error_code ec;
        beast::get_lowest_layer(*ws_).socket().close(ec);
    }
}

void WebSocketSignaling::start() {
    stopped_ = false;
    do_connect();
}

void WebSocketSignaling::stop() {
    if (stopped_) return;
    stopped_ = true;
    ++conn_gen_;
    reconnect_timer_.cancel();
    resolver_.cancel();
    bool was_open = open_;
    open_ = false;
    write_queue_.clear();
    writing_ = false;
    if (ws_) {
        beast::error_code ec;
        if (was_open) ws_->close(websocket::close_code::normal, ec);
        beast::get_lowest_layer(*ws_).socket().close(ec);
    }
    logger_.info("signal carrier stopped");
    if (was_open && on_state_) on_state_(false);
}

void WebSocketSignaling::do_connect() {
    if (stopped_) return;
    uint64_t gen = ++conn_gen_;
    logger_.info("signal connecting to " + url_.host + ":" + std::to_string(url_.port) + url_.target);

    resolver_.async_resolve(url_.host, std::to_string(url_.port),
                            [self = shared_from_this(), gen](const beast::error_code& ec,
                                                             tcp::resolver::results_type results) {
        if (gen != self->conn_gen_) return;
        self->on_resolve(ec, results);
    });
}

void WebSocketSignaling::on_resolve(const beast::error_code& ec, tcp::resolver::results_type results) {
    if (ec) {
        logger_.warn("signal resolve failed for " + url_.host + ": " + ec.message());
        schedule_reconnect();
        return;
    }

    ws_ = std::make_unique<WsStream>(io_);
    read_buffer_.clear();
    beast::get_lowest_layer(*ws_).expires_after(opts_.connect_timeout);

    uint64_t gen = conn_gen_;
    beast::get_lowest_layer(*ws_).async_connect(
        results,
        [self = shared_from_this(), gen](const beast::error_code& ec, const tcp::endpoint&) {
            if (gen != self->conn_gen_) return;
            self->on_connect(ec);
        });
}

void WebSocketSignaling::on_connect(const beast::error_code& ec) {
    if (ec) {
        logger_.warn("signal tcp connect failed: " + ec.message());
        schedule_reconnect();
        return;
    }

    beast::get_lowest_layer(*ws_).expires_never();
    ws_->set_option(websocket::stream_base::timeout::suggested(beast::role_type::client));
    ws_->set_option(websocket::stream_base::decorator([](websocket::request_type& req) {
        req.set(beast::http::field::user_agent, "clouddrop/1.0");
    }));

    std::string host = url_.host;
    if (url_.port != 80) host += ":" + std::to_string(url_.port);

    uint64_t gen = conn_gen_;
    ws_->async_handshake(host, url_.target, [self = shared_from_this(), gen](const beast::error_code& ec) {
        if (gen != self->conn_gen_) return;
        self->on_handshake(ec);
    });
}

void WebSocketSignaling::on_handshake(const beast::error_code& ec) {
    if (ec) {
        logger_.warn("signal websocket handshake failed: " + ec.message());
        schedule_reconnect();
        return;
    }

    ws_->text(true);
    open_ = true;
    logger_.info("signal carrier open, joining room '" + room_ + "'");

    do_read();
    // The join request goes out ahead of anything queued while disconnected.
    write_queue_.push_front(join_json(room_));
    if (!writing_) do_write();

    if (on_state_) on_state_(true);
}

bool WebSocketSignaling::send_text(const std::string& json) {
    if (!open_) return false;
    write_queue_.push_back(json);
    if (!writing_) do_write();
    return true;
}

void WebSocketSignaling::do_write() {
    if (write_queue_.empty() || !open_) {
        writing_ = false;
        return;
    }
    writing_ = true;
    auto msg = std::make_shared<std::string>(std::move(write_queue_.front()));
    write_queue_.pop_front();

    uint64_t gen = conn_gen_;
    ws_->async_write(boost::asio::buffer(*msg),
                     [self = shared_from_this(), msg, gen](const beast::error_code& ec, std::size_t) {
        if (gen != self->conn_gen_) return;
        if (ec) {
            self->writing_ = false;
            self->on_lost(ec, "write");
            return;
        }
        self->do_write();
    });
}

void WebSocketSignaling::do_read() {
    uint64_t gen = conn_gen_;
    ws_->async_read(read_buffer_, [self = shared_from_this(), gen](const beast::error_code& ec, std::size_t n) {
        if (gen != self->conn_gen_) return;
        if (ec) {
            self->on_lost(ec, "read");
            return;
        }
        std::string text = beast::buffers_to_string(self->read_buffer_.data());
        self->read_buffer_.consume(n);
        if (self->on_message_) self->on_message_(text);
        if (gen == self->conn_gen_) self->do_read();
    });
}

void WebSocketSignaling::on_lost(const beast::error_code& ec, const char* where) {
    if (ec == websocket::error::closed) {
        logger_.info("signal carrier closed by server");
    } else {
        logger_.warn(std::string("signal carrier ") + where + " error: " + ec.message());
    }
    bool was_open = open_;
    open_ = false;
    writing_ = false;
    write_queue_.clear();
    ++conn_gen_;
    if (ws_) {
        beast::error_code ignored;
        beast::get_lowest_layer(*ws_).socket().close(ignored);
    }
    if (was_open && on_state_) on_state_(false);
    schedule_reconnect();
}

void WebSocketSignaling::schedule_reconnect() {
    if (stopped_) return;
    logger_.info("signal reconnecting in " + std::to_string(opts_.reconnect_delay.count()) + " ms");
    reconnect_timer_.expires_after(opts_.reconnect_delay);
    reconnect_timer_.async_wait([self = shared_from_this()](const boost::system::error_code& ec) {
        if (ec == boost::asio::error::operation_aborted) return;
        self->do_connect();
    });
}

} // namespace clouddrop
