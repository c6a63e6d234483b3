#pragma once

#include <boost/asio.hpp>

#include <array>
#include <chrono>
#include <cstdint>
#include <deque>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "logger.hpp"
#include "peer_connection.hpp"
#include "traversal.hpp"
#include "wire.hpp"

namespace clouddrop {

// Candidate line: "candidate:<foundation> 1 tcp <priority> <ip> <port> typ host|srflx"
std::string format_tcp_candidate(const boost::asio::ip::tcp::endpoint& ep, bool reflexive);
std::optional<boost::asio::ip::tcp::endpoint> parse_tcp_candidate(const std::string& candidate);

struct TcpSessionParams {
    std::string ufrag;
    std::string setup;  // "active" (offer) | "passive" (answer)
    std::string label;  // data channel the offerer created, may be empty
};

std::string format_sdp(const TcpSessionParams& p);
std::optional<TcpSessionParams> parse_sdp(const std::string& sdp);

// Data channel over a framed TCP stream. The stream may be swapped underneath
// it (ICE restart); while no stream is attached sends are queued and count
// toward buffered_amount.
class TcpDataChannel final : public DataChannel, public std::enable_shared_from_this<TcpDataChannel> {
public:
    using tcp = boost::asio::ip::tcp;
    using LostHandler = std::function<void(const boost::system::error_code&)>;

    TcpDataChannel(boost::asio::io_context& io, std::string label, Logger& logger);

    const std::string& label() const override { return label_; }
    ChannelState state() const override { return state_; }

    bool send_text(const std::string& text) override;
    bool send_binary(const Bytes& data) override;
    size_t buffered_amount() const override { return buffered_; }

    void close() override;

    // Used by TcpPeerConnection.
    void attach(std::shared_ptr<tcp::socket> stream);
    void detach();
    bool attached() const { return static_cast<bool>(stream_); }
    void set_lost_handler(LostHandler h) { on_lost_ = std::move(h); }

private:
    bool enqueue(wire::FrameKind kind, const uint8_t* data, size_t len);
    void do_write();
    void do_read_header();
    void do_read_payload(const wire::Header& h);
    void on_stream_error(uint64_t gen, const boost::system::error_code& ec);

    boost::asio::io_context& io_;
    std::string label_;
    Logger& logger_;
    ChannelState state_ = ChannelState::CONNECTING;

    std::shared_ptr<tcp::socket> stream_;
    uint64_t stream_gen_ = 0;

    std::deque<std::shared_ptr<wire::Bytes>> queue_;
    size_t buffered_ = 0;
    bool writing_ = false;

    std::array<uint8_t, wire::kHeaderSize> header_{};
    wire::Bytes payload_;

    LostHandler on_lost_;
};

// PeerConnection over TCP. The offerer (setup:active) connects to the
// answerer's candidates and proves the answer's ufrag with a HELLO frame; the
// answerer (setup:passive) listens, gathers candidates and acknowledges.
class TcpPeerConnection final : public PeerConnection, public std::enable_shared_from_this<TcpPeerConnection> {
public:
    using tcp = boost::asio::ip::tcp;

    struct Options {
        std::string bind_ip = "0.0.0.0";
        std::chrono::milliseconds check_timeout{10000};
    };

    TcpPeerConnection(boost::asio::io_context& io,
                      std::vector<TraversalServer> servers,
                      ReflexiveProbe* probe,
                      Options opts,
                      Logger& logger);
    ~TcpPeerConnection() override;

    SignalingState signaling_state() const override { return signaling_state_; }
    IceState ice_state() const override { return ice_state_; }
    bool has_remote_description() const override { return has_remote_; }

    void create_offer(bool ice_restart, DescriptionHandler handler) override;
    void create_answer(DescriptionHandler handler) override;
    void set_local_description(const SessionDescription& desc, Handler handler) override;
    void rollback(Handler handler) override;
    void set_remote_description(const SessionDescription& desc, Handler handler) override;
    void add_ice_candidate(const IceCandidate& cand, Handler handler) override;

    std::shared_ptr<DataChannel> create_data_channel(const std::string& label) override;

    void close() override;

    // Listening endpoint of the answerer side, unspecified before it listens.
    tcp::endpoint local_endpoint() const;

private:
    void complete(Handler handler, const boost::system::error_code& ec);
    void set_ice_state(IceState s);

    void begin_checks();
    void arm_check_timer();
    bool start_listening();
    void gather_candidates();
    void emit_candidate(const tcp::endpoint& ep, bool reflexive);
    void do_accept();
    void read_hello(std::shared_ptr<tcp::socket> sock);
    void try_next_candidate();
    void connect_to(const tcp::endpoint& ep);
    void connect_failed(uint64_t gen, const std::string& why);
    void adopt(std::shared_ptr<tcp::socket> sock, uint64_t gen);
    void on_stream_lost(const boost::system::error_code& ec);
    std::shared_ptr<TcpDataChannel> ensure_channel(const std::string& label);

    static std::string new_ufrag();

    boost::asio::io_context& io_;
    std::vector<TraversalServer> servers_;
    ReflexiveProbe* probe_;
    Options opts_;
    Logger& logger_;

    SignalingState signaling_state_ = SignalingState::STABLE;
    IceState ice_state_ = IceState::NEW;
    bool has_remote_ = false;
    bool closed_ = false;

    std::string local_ufrag_;
    std::string remote_ufrag_;
    std::string remote_label_;
    bool offerer_ = false;

    std::unique_ptr<tcp::acceptor> acceptor_;
    std::shared_ptr<tcp::socket> stream_;
    std::vector<tcp::endpoint> host_candidates_;

    // Offerer side: candidates are tried one at a time so the answerer sees a
    // single proven stream per check round.
    std::vector<tcp::endpoint> remote_candidates_;
    std::deque<tcp::endpoint> connect_queue_;
    std::shared_ptr<tcp::socket> attempt_;
    bool connecting_ = false;

    uint64_t check_gen_ = 0;
    uint64_t adopted_gen_ = 0;
    boost::asio::steady_timer check_timer_;

    std::shared_ptr<TcpDataChannel> channel_;
};

class TcpPeerConnectionFactory final : public PeerConnectionFactory {
public:
    TcpPeerConnectionFactory(boost::asio::io_context& io,
                             TcpPeerConnection::Options opts,
                             ReflexiveProbe* probe,
                             Logger& logger);

    std::shared_ptr<PeerConnection> create(const std::vector<TraversalServer>& servers) override;

private:
    boost::asio::io_context& io_;
    TcpPeerConnection::Options opts_;
    ReflexiveProbe* probe_;
    Logger& logger_;
};

} // namespace clouddrop
