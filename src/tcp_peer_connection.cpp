#include "tcp_peer_connection.hpp"

#include "crypto/Crypto.h"
#include "util.hpp"

#include <algorithm>
#include <sstream>

namespace clouddrop {

namespace {

using tcp = boost::asio::ip::tcp;

constexpr size_t kMaxUfrag = 64;

boost::system::error_code bad_state() {
    return boost::system::errc::make_error_code(boost::system::errc::operation_not_permitted);
}

boost::system::error_code bad_argument() {
    return boost::system::errc::make_error_code(boost::system::errc::invalid_argument);
}

void close_socket(const std::shared_ptr<tcp::socket>& sock) {
    if (!sock) return;
    boost::system::error_code ec;
    sock->shutdown(tcp::socket::shutdown_both, ec);
    sock->close(ec);
}

} // namespace

// ---------------- candidate / description text ----------------

std::string format_tcp_candidate(const tcp::endpoint& ep, bool reflexive) {
    std::ostringstream oss;
    oss << "candidate:" << (reflexive ? 2 : 1) << " 1 tcp " << (reflexive ? 1694498815u : 2130706431u) << " "
        << ep.address().to_string() << " " << ep.port() << " typ " << (reflexive ? "srflx" : "host");
    return oss.str();
}

std::optional<tcp::endpoint> parse_tcp_candidate(const std::string& candidate) {
    std::string line = candidate;
    if (starts_with(line, "a=")) line = line.substr(2);
    if (!starts_with(line, "candidate:")) return std::nullopt;

    std::istringstream iss(line);
    std::vector<std::string> fields;
    std::string f;
    while (iss >> f) fields.push_back(f);
    if (fields.size() < 8 || fields[6] != "typ") return std::nullopt;

    std::string transport = fields[2];
    std::transform(transport.begin(), transport.end(), transport.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (transport != "tcp") return std::nullopt;

    boost::system::error_code ec;
    auto addr = boost::asio::ip::make_address(fields[4], ec);
    if (ec) return std::nullopt;
    unsigned long port = 0;
    try {
        port = std::stoul(fields[5]);
    } catch (const std::exception&) {
        return std::nullopt;
    }
    if (port == 0 || port > 65535) return std::nullopt;
    return tcp::endpoint(addr, static_cast<uint16_t>(port));
}

std::string format_sdp(const TcpSessionParams& p) {
    std::string out = "v=0\r\ns=clouddrop\r\n";
    out += "a=ice-ufrag:" + p.ufrag + "\r\n";
    out += "a=setup:" + p.setup + "\r\n";
    if (!p.label.empty()) out += "a=label:" + p.label + "\r\n";
    return out;
}

std::optional<TcpSessionParams> parse_sdp(const std::string& sdp) {
    TcpSessionParams p;
    std::istringstream iss(sdp);
    std::string line;
    while (std::getline(iss, line)) {
        line = trim(line);
        if (starts_with(line, "a=ice-ufrag:")) p.ufrag = line.substr(12);
        else if (starts_with(line, "a=setup:")) p.setup = line.substr(8);
        else if (starts_with(line, "a=label:")) p.label = line.substr(8);
    }
    if (p.ufrag.empty() || p.ufrag.size() > kMaxUfrag) return std::nullopt;
    if (p.setup != "active" && p.setup != "passive") return std::nullopt;
    return p;
}

// ---------------- TcpDataChannel ----------------

TcpDataChannel::TcpDataChannel(boost::asio::io_context& io, std::string label, Logger& logger)
    : io_(io), label_(std::move(label)), logger_(logger) {}

bool TcpDataChannel::send_text(const std::string& text) {
    return enqueue(wire::FrameKind::TEXT, reinterpret_cast<const uint8_t*>(text.data()), text.size());
}

bool TcpDataChannel::send_binary(const Bytes& data) {
    return enqueue(wire::FrameKind::BINARY, data.data(), data.size());
}

bool TcpDataChannel::enqueue(wire::FrameKind kind, const uint8_t* data, size_t len) {
    if (state_ != ChannelState::OPEN) return false;
    if (len > wire::kMaxFrame) {
        logger_.warn("chan " + label_ + " message too large len=" + std::to_string(len));
        return false;
    }
    auto buf = std::make_shared<wire::Bytes>(wire::encode(kind, data, len));
    buffered_ += buf->size();
    queue_.push_back(std::move(buf));
    if (stream_ && !writing_) do_write();
    return true;
}

void TcpDataChannel::do_write() {
    if (queue_.empty() || !stream_) {
        writing_ = false;
        return;
    }
    writing_ = true;
    auto buf = queue_.front();
    auto self = shared_from_this();
    uint64_t gen = stream_gen_;
    boost::asio::async_write(*stream_, boost::asio::buffer(*buf),
                             [this, self, buf, gen](const boost::system::error_code& ec, std::size_t) {
        if (gen != stream_gen_) return;
        if (ec) {
            // The frame stays queued and is written again on the next stream.
            writing_ = false;
            on_stream_error(gen, ec);
            return;
        }
        if (!queue_.empty() && queue_.front() == buf) {
            buffered_ -= buf->size();
            queue_.pop_front();
        }
        do_write();
    });
}

void TcpDataChannel::attach(std::shared_ptr<tcp::socket> stream) {
    if (state_ == ChannelState::CLOSED || state_ == ChannelState::CLOSING) {
        close_socket(stream);
        return;
    }
    detach();
    stream_ = std::move(stream);
    ++stream_gen_;

    if (state_ == ChannelState::CONNECTING) {
        state_ = ChannelState::OPEN;
        logger_.debug("chan " + label_ + " open");
        auto self = shared_from_this();
        boost::asio::post(io_, [this, self]() {
            if (state_ == ChannelState::OPEN && on_open_) on_open_();
        });
    } else {
        logger_.debug("chan " + label_ + " stream replaced, queued=" + std::to_string(queue_.size()));
    }

    do_read_header();
    do_write();
}

void TcpDataChannel::detach() {
    ++stream_gen_;
    writing_ = false;
    if (stream_) {
        close_socket(stream_);
        stream_.reset();
    }
}

void TcpDataChannel::close() {
    if (state_ == ChannelState::CLOSED) return;
    state_ = ChannelState::CLOSED;
    detach();
    queue_.clear();
    buffered_ = 0;
    on_lost_ = nullptr;
}

void TcpDataChannel::on_stream_error(uint64_t gen, const boost::system::error_code& ec) {
    if (gen != stream_gen_) return;
    detach();
    if (ec != boost::asio::error::eof) {
        logger_.info("chan " + label_ + " stream error: " + ec.message());
    } else {
        logger_.info("chan " + label_ + " stream closed by remote");
    }
    if (on_lost_) on_lost_(ec);
}

void TcpDataChannel::do_read_header() {
    auto self = shared_from_this();
    uint64_t gen = stream_gen_;
    boost::asio::async_read(*stream_, boost::asio::buffer(header_),
                            [this, self, gen](const boost::system::error_code& ec, std::size_t) {
        if (gen != stream_gen_) return;
        if (ec) {
            on_stream_error(gen, ec);
            return;
        }
        wire::Header h;
        try {
            h = wire::decode_header(header_.data(), header_.size());
        } catch (const std::runtime_error& e) {
            // A desynchronized stream cannot be recovered.
            logger_.warn("chan " + label_ + " protocol error: " + e.what());
            close();
            if (on_close_) on_close_();
            return;
        }
        do_read_payload(h);
    });
}

void TcpDataChannel::do_read_payload(const wire::Header& h) {
    payload_.assign(h.length, 0);
    auto self = shared_from_this();
    uint64_t gen = stream_gen_;
    auto dispatch = [this, self, gen, kind = h.kind]() {
        if (kind == wire::FrameKind::TEXT) {
            if (on_text_) on_text_(wire::bytes_str(payload_));
        } else if (kind == wire::FrameKind::BINARY) {
            if (on_binary_) on_binary_(payload_);
        } else {
            logger_.debug("chan " + label_ + " stray handshake frame ignored");
        }
        // A handler may have closed the channel.
        if (gen == stream_gen_ && state_ == ChannelState::OPEN) do_read_header();
    };
    if (h.length == 0) {
        dispatch();
        return;
    }
    boost::asio::async_read(*stream_, boost::asio::buffer(payload_),
                            [this, self, gen, dispatch](const boost::system::error_code& ec, std::size_t) {
        if (gen != stream_gen_) return;
        if (ec) {
            on_stream_error(gen, ec);
            return;
        }
        dispatch();
    });
}

// ---------------- TcpPeerConnection ----------------

TcpPeerConnection::TcpPeerConnection(boost::asio::io_context& io,
                                     std::vector<TraversalServer> servers,
                                     ReflexiveProbe* probe,
                                     Options opts,
                                     Logger& logger)
    : io_(io),
      servers_(std::move(servers)),
      probe_(probe),
      opts_(std::move(opts)),
      logger_(logger),
      check_timer_(io) {}

TcpPeerConnection::~TcpPeerConnection() {
    close();
}

std::string TcpPeerConnection::new_ufrag() {
    crypto::Byte b[8];
    crypto::RandomBytes(b, sizeof(b));
    return to_hex(b, sizeof(b));
}

void TcpPeerConnection::complete(Handler handler, const boost::system::error_code& ec) {
    if (!handler) return;
    boost::asio::post(io_, [handler = std::move(handler), ec]() { handler(ec); });
}

void TcpPeerConnection::set_ice_state(IceState s) {
    if (ice_state_ == s) return;
    logger_.debug(std::string("pc ice ") + to_string(ice_state_) + " -> " + to_string(s));
    ice_state_ = s;
    auto self = shared_from_this();
    boost::asio::post(io_, [this, self, s]() {
        if (closed_) return;
        if (on_ice_state_) on_ice_state_(s);
    });
}

tcp::endpoint TcpPeerConnection::local_endpoint() const {
    if (!acceptor_) return {};
    boost::system::error_code ec;
    auto ep = acceptor_->local_endpoint(ec);
    return ec ? tcp::endpoint{} : ep;
}

// ---------------- descriptions ----------------

void TcpPeerConnection::create_offer(bool ice_restart, DescriptionHandler handler) {
    SessionDescription desc;
    boost::system::error_code ec;
    if (closed_) {
        ec = boost::asio::error::operation_aborted;
    } else {
        TcpSessionParams p;
        p.ufrag = (ice_restart || local_ufrag_.empty()) ? new_ufrag() : local_ufrag_;
        p.setup = "active";
        if (channel_) p.label = channel_->label();
        desc = SessionDescription{"offer", format_sdp(p)};
    }
    boost::asio::post(io_, [handler = std::move(handler), ec, desc]() { handler(ec, desc); });
}

void TcpPeerConnection::create_answer(DescriptionHandler handler) {
    SessionDescription desc;
    boost::system::error_code ec;
    if (closed_) {
        ec = boost::asio::error::operation_aborted;
    } else if (signaling_state_ != SignalingState::HAVE_REMOTE_OFFER) {
        ec = bad_state();
    } else {
        // Every answer opens a fresh check round.
        desc = SessionDescription{"answer", format_sdp(TcpSessionParams{new_ufrag(), "passive", std::string()})};
    }
    boost::asio::post(io_, [handler = std::move(handler), ec, desc]() { handler(ec, desc); });
}

void TcpPeerConnection::set_local_description(const SessionDescription& desc, Handler handler) {
    if (closed_) return complete(std::move(handler), boost::asio::error::operation_aborted);
    auto p = parse_sdp(desc.sdp);
    if (!p) return complete(std::move(handler), bad_argument());

    if (desc.type == "offer") {
        if (signaling_state_ != SignalingState::STABLE && signaling_state_ != SignalingState::HAVE_LOCAL_OFFER) {
            return complete(std::move(handler), bad_state());
        }
        signaling_state_ = SignalingState::HAVE_LOCAL_OFFER;
        local_ufrag_ = p->ufrag;
        complete(std::move(handler), {});
        return;
    }

    if (desc.type == "answer") {
        if (signaling_state_ != SignalingState::HAVE_REMOTE_OFFER) return complete(std::move(handler), bad_state());
        signaling_state_ = SignalingState::STABLE;
        local_ufrag_ = p->ufrag;
        offerer_ = false;
        complete(std::move(handler), {});
        if (!start_listening()) {
            set_ice_state(IceState::FAILED);
            return;
        }
        begin_checks();
        gather_candidates();
        return;
    }

    complete(std::move(handler), bad_argument());
}

void TcpPeerConnection::rollback(Handler handler) {
    if (closed_) return complete(std::move(handler), boost::asio::error::operation_aborted);
    if (signaling_state_ == SignalingState::HAVE_LOCAL_OFFER) {
        logger_.debug("pc local offer rolled back");
        signaling_state_ = SignalingState::STABLE;
    }
    complete(std::move(handler), {});
}

void TcpPeerConnection::set_remote_description(const SessionDescription& desc, Handler handler) {
    if (closed_) return complete(std::move(handler), boost::asio::error::operation_aborted);
    auto p = parse_sdp(desc.sdp);
    if (!p) return complete(std::move(handler), bad_argument());

    if (desc.type == "offer") {
        if (signaling_state_ != SignalingState::STABLE || p->setup != "active") {
            return complete(std::move(handler), bad_state());
        }
        signaling_state_ = SignalingState::HAVE_REMOTE_OFFER;
        remote_ufrag_ = p->ufrag;
        remote_label_ = p->label;
        has_remote_ = true;
        complete(std::move(handler), {});
        return;
    }

    if (desc.type == "answer") {
        if (signaling_state_ != SignalingState::HAVE_LOCAL_OFFER || p->setup != "passive") {
            return complete(std::move(handler), bad_state());
        }
        signaling_state_ = SignalingState::STABLE;
        remote_ufrag_ = p->ufrag;
        has_remote_ = true;
        offerer_ = true;
        complete(std::move(handler), {});
        begin_checks();
        return;
    }

    complete(std::move(handler), bad_argument());
}

void TcpPeerConnection::add_ice_candidate(const IceCandidate& cand, Handler handler) {
    if (closed_) return complete(std::move(handler), boost::asio::error::operation_aborted);
    if (!has_remote_) return complete(std::move(handler), bad_state());
    auto ep = parse_tcp_candidate(cand.candidate);
    if (!ep) return complete(std::move(handler), bad_argument());

    if (std::find(remote_candidates_.begin(), remote_candidates_.end(), *ep) == remote_candidates_.end()) {
        remote_candidates_.push_back(*ep);
        logger_.debug("pc remote candidate " + ep->address().to_string() + ":" + std::to_string(ep->port()));
        if (offerer_ && adopted_gen_ != check_gen_) {
            connect_queue_.push_back(*ep);
            try_next_candidate();
        }
    }
    complete(std::move(handler), {});
}

// ---------------- connectivity checks ----------------

void TcpPeerConnection::begin_checks() {
    ++check_gen_;
    close_socket(attempt_);
    attempt_.reset();
    connecting_ = false;
    connect_queue_.clear();

    if (ice_state_ != IceState::CONNECTED && ice_state_ != IceState::COMPLETED) {
        set_ice_state(IceState::CHECKING);
    }
    arm_check_timer();

    if (offerer_) {
        connect_queue_.assign(remote_candidates_.begin(), remote_candidates_.end());
        try_next_candidate();
    }
}

void TcpPeerConnection::arm_check_timer() {
    uint64_t gen = check_gen_;
    auto self = shared_from_this();
    check_timer_.expires_after(opts_.check_timeout);
    check_timer_.async_wait([this, self, gen](const boost::system::error_code& ec) {
        if (ec == boost::asio::error::operation_aborted || closed_ || gen != check_gen_) return;
        if (adopted_gen_ == gen) return;
        if (ice_state_ == IceState::CONNECTED || ice_state_ == IceState::COMPLETED) return;
        logger_.warn("pc connectivity checks timed out");
        close_socket(attempt_);
        attempt_.reset();
        connecting_ = false;
        set_ice_state(IceState::FAILED);
    });
}

bool TcpPeerConnection::start_listening() {
    if (acceptor_) return true;

    boost::system::error_code ec;
    auto addr = boost::asio::ip::make_address(opts_.bind_ip, ec);
    if (ec) {
        logger_.error("pc invalid bind_ip " + opts_.bind_ip + ": " + ec.message());
        return false;
    }
    tcp::endpoint ep(addr, 0);
    auto acceptor = std::make_unique<tcp::acceptor>(io_);
    acceptor->open(ep.protocol(), ec);
    if (!ec) acceptor->set_option(tcp::acceptor::reuse_address(true), ec);
    if (!ec) acceptor->bind(ep, ec);
    if (!ec) acceptor->listen(boost::asio::socket_base::max_listen_connections, ec);
    if (ec) {
        logger_.error("pc cannot listen on " + opts_.bind_ip + ": " + ec.message());
        return false;
    }
    acceptor_ = std::move(acceptor);
    logger_.info("pc listening on port " + std::to_string(local_endpoint().port()));
    do_accept();
    return true;
}

void TcpPeerConnection::gather_candidates() {
    uint16_t port = local_endpoint().port();
    if (port == 0) return;

    if (host_candidates_.empty()) {
        boost::system::error_code ec;
        auto bind = boost::asio::ip::make_address(opts_.bind_ip, ec);
        if (!ec && !bind.is_unspecified()) {
            host_candidates_.emplace_back(bind, port);
        } else {
            tcp::resolver resolver(io_);
            auto results = resolver.resolve(boost::asio::ip::host_name(), "", ec);
            if (!ec) {
                for (const auto& r : results) {
                    auto a = r.endpoint().address();
                    if (!a.is_v4() || a.is_loopback()) continue;
                    tcp::endpoint cand(a, port);
                    if (std::find(host_candidates_.begin(), host_candidates_.end(), cand) == host_candidates_.end()) {
                        host_candidates_.push_back(cand);
                    }
                }
            } else {
                logger_.debug("pc host name lookup failed: " + ec.message());
            }
            host_candidates_.emplace_back(boost::asio::ip::address_v4::loopback(), port);
        }
    }
    for (const auto& ep : host_candidates_) emit_candidate(ep, false);

    if (!probe_) return;
    for (const auto& s : servers_) {
        auto url = s.stun_url();
        if (!url) continue;
        auto self = shared_from_this();
        probe_->probe(*url, opts_.check_timeout / 2,
                      [this, self, port](const boost::system::error_code& ec, ProbeResult r) {
            if (closed_ || ec) return;
            tcp::endpoint srflx(r.mapped.address(), port);
            if (std::find(host_candidates_.begin(), host_candidates_.end(), srflx) != host_candidates_.end()) return;
            emit_candidate(srflx, true);
        });
        break;
    }
}

void TcpPeerConnection::emit_candidate(const tcp::endpoint& ep, bool reflexive) {
    IceCandidate cand{format_tcp_candidate(ep, reflexive), "0", 0};
    auto self = shared_from_this();
    // Posted so the answer that precedes these candidates is signaled first.
    boost::asio::post(io_, [this, self, cand]() {
        if (closed_) return;
        logger_.debug("pc local candidate " + cand.candidate);
        if (on_candidate_) on_candidate_(cand);
    });
}

void TcpPeerConnection::do_accept() {
    auto sock = std::make_shared<tcp::socket>(io_);
    auto self = shared_from_this();
    acceptor_->async_accept(*sock, [this, self, sock](const boost::system::error_code& ec) {
        if (closed_ || ec == boost::asio::error::operation_aborted) return;
        if (ec) {
            logger_.warn("pc accept error: " + ec.message());
        } else {
            read_hello(sock);
        }
        do_accept();
    });
}

void TcpPeerConnection::read_hello(std::shared_ptr<tcp::socket> sock) {
    auto self = shared_from_this();
    auto header = std::make_shared<std::array<uint8_t, wire::kHeaderSize>>();
    boost::asio::async_read(*sock, boost::asio::buffer(*header),
                            [this, self, sock, header](const boost::system::error_code& ec, std::size_t) {
        if (closed_ || ec) {
            close_socket(sock);
            return;
        }
        wire::Header h;
        try {
            h = wire::decode_header(header->data(), header->size());
        } catch (const std::runtime_error& e) {
            logger_.debug(std::string("pc bad hello: ") + e.what());
            close_socket(sock);
            return;
        }
        if (h.kind != wire::FrameKind::HELLO || h.length == 0 || h.length > kMaxUfrag) {
            close_socket(sock);
            return;
        }
        auto body = std::make_shared<wire::Bytes>(h.length);
        boost::asio::async_read(*sock, boost::asio::buffer(*body),
                                [this, self, sock, body](const boost::system::error_code& ec, std::size_t) {
            if (closed_ || ec) {
                close_socket(sock);
                return;
            }
            std::string ufrag = wire::bytes_str(*body);
            if (offerer_ || ufrag != local_ufrag_) {
                logger_.debug("pc hello with stale or unknown ufrag rejected");
                close_socket(sock);
                return;
            }
            uint64_t gen = check_gen_;
            auto ack = std::make_shared<wire::Bytes>(wire::encode(wire::FrameKind::HELLO_ACK, nullptr, 0));
            boost::asio::async_write(*sock, boost::asio::buffer(*ack),
                                     [this, self, sock, ack, gen](const boost::system::error_code& ec, std::size_t) {
                if (closed_ || ec) {
                    close_socket(sock);
                    return;
                }
                adopt(sock, gen);
            });
        });
    });
}

void TcpPeerConnection::try_next_candidate() {
    if (closed_ || connecting_ || adopted_gen_ == check_gen_ || connect_queue_.empty()) return;
    if (remote_ufrag_.empty()) return;
    auto ep = connect_queue_.front();
    connect_queue_.pop_front();
    connecting_ = true;
    connect_to(ep);
}

void TcpPeerConnection::connect_failed(uint64_t gen, const std::string& why) {
    if (closed_ || gen != check_gen_) return;
    logger_.debug("pc candidate check failed: " + why);
    close_socket(attempt_);
    attempt_.reset();
    connecting_ = false;
    try_next_candidate();
}

void TcpPeerConnection::connect_to(const tcp::endpoint& ep) {
    uint64_t gen = check_gen_;
    auto sock = std::make_shared<tcp::socket>(io_);
    attempt_ = sock;
    auto self = shared_from_this();
    logger_.debug("pc checking " + ep.address().to_string() + ":" + std::to_string(ep.port()));

    sock->async_connect(ep, [this, self, sock, gen](const boost::system::error_code& ec) {
        if (closed_ || gen != check_gen_) {
            close_socket(sock);
            return;
        }
        if (ec) return connect_failed(gen, ec.message());

        auto hello = std::make_shared<wire::Bytes>(
            wire::encode(wire::FrameKind::HELLO, reinterpret_cast<const uint8_t*>(remote_ufrag_.data()),
                         remote_ufrag_.size()));
        boost::asio::async_write(*sock, boost::asio::buffer(*hello),
                                 [this, self, sock, hello, gen](const boost::system::error_code& ec, std::size_t) {
            if (closed_ || gen != check_gen_) {
                close_socket(sock);
                return;
            }
            if (ec) return connect_failed(gen, ec.message());

            auto header = std::make_shared<std::array<uint8_t, wire::kHeaderSize>>();
            boost::asio::async_read(*sock, boost::asio::buffer(*header),
                                    [this, self, sock, header, gen](const boost::system::error_code& ec, std::size_t) {
                if (closed_ || gen != check_gen_) {
                    close_socket(sock);
                    return;
                }
                if (ec) return connect_failed(gen, ec.message());
                try {
                    auto h = wire::decode_header(header->data(), header->size());
                    if (h.kind != wire::FrameKind::HELLO_ACK || h.length != 0) {
                        return connect_failed(gen, "unexpected reply to hello");
                    }
                } catch (const std::runtime_error& e) {
                    return connect_failed(gen, e.what());
                }
                attempt_.reset();
                connecting_ = false;
                adopt(sock, gen);
            });
        });
    });
}

void TcpPeerConnection::adopt(std::shared_ptr<tcp::socket> sock, uint64_t gen) {
    if (closed_ || gen != check_gen_) {
        close_socket(sock);
        return;
    }
    if (offerer_ && adopted_gen_ == gen) {
        close_socket(sock);
        return;
    }
    check_timer_.cancel();
    adopted_gen_ = gen;
    connect_queue_.clear();
    stream_ = sock;

    boost::system::error_code ec;
    auto remote = sock->remote_endpoint(ec);
    logger_.info("pc stream established " + (ec ? std::string("?") : remote.address().to_string() + ":" +
                                                 std::to_string(remote.port())) +
                 (offerer_ ? " (active)" : " (passive)"));

    bool announce = !channel_;
    auto ch = ensure_channel(channel_ ? channel_->label() : (remote_label_.empty() ? "data" : remote_label_));
    if (announce && on_data_channel_) on_data_channel_(ch);
    if (closed_) return;
    ch->attach(sock);
    set_ice_state(IceState::CONNECTED);
}

void TcpPeerConnection::on_stream_lost(const boost::system::error_code& ec) {
    if (closed_) return;
    stream_.reset();
    logger_.info("pc stream lost: " + ec.message());
    if (ice_state_ == IceState::CONNECTED || ice_state_ == IceState::COMPLETED) {
        set_ice_state(IceState::DISCONNECTED);
    }
}

std::shared_ptr<TcpDataChannel> TcpPeerConnection::ensure_channel(const std::string& label) {
    if (channel_) return channel_;
    channel_ = std::make_shared<TcpDataChannel>(io_, label, logger_);
    std::weak_ptr<TcpPeerConnection> wself = weak_from_this();
    channel_->set_lost_handler([wself](const boost::system::error_code& ec) {
        if (auto self = wself.lock()) self->on_stream_lost(ec);
    });
    if (closed_) channel_->close();
    return channel_;
}

std::shared_ptr<DataChannel> TcpPeerConnection::create_data_channel(const std::string& label) {
    return ensure_channel(label);
}

void TcpPeerConnection::close() {
    if (closed_) return;
    closed_ = true;
    signaling_state_ = SignalingState::CLOSED;
    ice_state_ = IceState::CLOSED;
    check_timer_.cancel();

    boost::system::error_code ec;
    if (acceptor_) acceptor_->close(ec);
    close_socket(attempt_);
    attempt_.reset();
    stream_.reset();
    if (channel_) channel_->close();

    on_candidate_ = nullptr;
    on_ice_state_ = nullptr;
    on_data_channel_ = nullptr;
}

// ---------------- factory ----------------

TcpPeerConnectionFactory::TcpPeerConnectionFactory(boost::asio::io_context& io,
                                                   TcpPeerConnection::Options opts,
                                                   ReflexiveProbe* probe,
                                                   Logger& logger)
    : io_(io), opts_(std::move(opts)), probe_(probe), logger_(logger) {}

std::shared_ptr<PeerConnection> TcpPeerConnectionFactory::create(const std::vector<TraversalServer>& servers) {
    return std::make_shared<TcpPeerConnection>(io_, servers, probe_, opts_, logger_);
}

} // namespace clouddrop
