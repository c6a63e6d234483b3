#pragma once

#include <boost/asio.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/websocket.hpp>

#include <chrono>
#include <deque>
#include <memory>
#include <string>

#include "logger.hpp"
#include "signaling.hpp"
#include "url.hpp"

namespace clouddrop {

// WebSocket client for the signaling relay. Joins the configured room on every
// (re)connect and reconnects after a fixed delay when the socket drops.
class WebSocketSignaling final : public SignalingTransport,
                                 public std::enable_shared_from_this<WebSocketSignaling> {
public:
    struct Options {
        std::chrono::milliseconds connect_timeout{10000};
        std::chrono::milliseconds reconnect_delay{3000};
    };

    WebSocketSignaling(boost::asio::io_context& io, Url url, std::string room, Options opts, Logger& logger);
    ~WebSocketSignaling() override;

    void start();
    void stop();

    bool send_text(const std::string& json) override;
    bool is_open() const override { return open_; }

private:
    using WsStream = boost::beast::websocket::stream<boost::beast::tcp_stream>;

    void do_connect();
    void on_resolve(const boost::beast::error_code& ec, boost::asio::ip::tcp::resolver::results_type results);
    void on_connect(const boost::beast::error_code& ec);
    void on_handshake(const boost::beast::error_code& ec);
    void do_read();
    void do_write();
    void on_lost(const boost::beast::error_code& ec, const char* where);
    void schedule_reconnect();

    boost::asio::io_context& io_;
    Url url_;
    std::string room_;
    Options opts_;
    Logger& logger_;

    boost::asio::ip::tcp::resolver resolver_;
    boost::asio::steady_timer reconnect_timer_;
    std::unique_ptr<WsStream> ws_;
    uint64_t conn_gen_ = 0;

    boost::beast::flat_buffer read_buffer_;
    std::deque<std::string> write_queue_;
    bool writing_ = false;
    bool open_ = false;
    bool stopped_ = false;
};

} // namespace clouddrop
