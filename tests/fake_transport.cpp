#include "fake_transport.hpp"

#include "messages.hpp"

namespace clouddrop {
namespace fakes {

bool run_until(boost::asio::io_context& io, const std::function<bool()>& pred, std::chrono::milliseconds limit) {
    auto deadline = std::chrono::steady_clock::now() + limit;
    while (!pred()) {
        if (std::chrono::steady_clock::now() >= deadline) return pred();
        if (io.stopped()) io.restart();
        io.run_for(std::chrono::milliseconds(2));
    }
    return true;
}

void run_for(boost::asio::io_context& io, std::chrono::milliseconds d) {
    auto deadline = std::chrono::steady_clock::now() + d;
    while (std::chrono::steady_clock::now() < deadline) {
        if (io.stopped()) io.restart();
        io.run_for(std::chrono::milliseconds(2));
    }
}

std::shared_ptr<FakePeerConnection> FakeNetwork::find(uint64_t id) const {
    auto it = pcs.find(id);
    return it == pcs.end() ? nullptr : it->second.lock();
}

// ---------------- FakeDataChannel ----------------

FakeDataChannel::FakeDataChannel(boost::asio::io_context& io, std::string label)
    : io_(io), label_(std::move(label)) {}

void FakeDataChannel::link(const std::shared_ptr<FakeDataChannel>& other) {
    peer_ = other;
    other->peer_ = shared_from_this();
}

void FakeDataChannel::open() {
    if (state_ != ChannelState::CONNECTING) return;
    state_ = ChannelState::OPEN;
    auto self = shared_from_this();
    boost::asio::post(io_, [self]() {
        if (self->state_ == ChannelState::OPEN && self->on_open_) self->on_open_();
    });
}

bool FakeDataChannel::send_text(const std::string& text) {
    if (state_ != ChannelState::OPEN) return false;
    ++text_sent_;
    auto peer = peer_.lock();
    if (!peer) return true;
    boost::asio::post(io_, [peer, text]() {
        if (peer->state_ == ChannelState::OPEN && peer->on_text_) peer->on_text_(text);
    });
    return true;
}

bool FakeDataChannel::send_binary(const Bytes& data) {
    if (state_ != ChannelState::OPEN) return false;
    ++binary_sent_;
    auto peer = peer_.lock();
    if (!peer) return true;
    boost::asio::post(io_, [peer, data]() {
        if (peer->state_ == ChannelState::OPEN && peer->on_binary_) peer->on_binary_(data);
    });
    return true;
}

void FakeDataChannel::close() {
    state_ = ChannelState::CLOSED;
}

void FakeDataChannel::remote_close() {
    state_ = ChannelState::CLOSED;
    if (on_close_) on_close_();
}

// ---------------- FakePeerConnection ----------------

namespace {

const std::string kSdpPrefix = "fake-pc:";

uint64_t sdp_owner(const std::string& sdp) {
    if (sdp.compare(0, kSdpPrefix.size(), kSdpPrefix) != 0) return 0;
    return std::stoull(sdp.substr(kSdpPrefix.size()));
}

} // namespace

FakePeerConnection::FakePeerConnection(FakeNetwork& net, std::vector<TraversalServer> servers)
    : net_(net), servers_(std::move(servers)), id_(net.next_id++) {}

void FakePeerConnection::complete(Handler handler, const boost::system::error_code& ec) {
    boost::asio::post(net_.io, [handler = std::move(handler), ec]() { handler(ec); });
}

void FakePeerConnection::set_ice(IceState s) {
    if (closed_ || ice_state_ == s) return;
    ice_state_ = s;
    auto self = shared_from_this();
    boost::asio::post(net_.io, [self, s]() {
        if (self->closed_) return;
        if (self->on_ice_state_) self->on_ice_state_(s);
    });
}

void FakePeerConnection::set_ice_pair(IceState s) {
    set_ice(s);
    if (auto r = remote()) r->set_ice(s);
}

std::shared_ptr<FakePeerConnection> FakePeerConnection::remote() const {
    return remote_id_ == 0 ? nullptr : net_.find(remote_id_);
}

void FakePeerConnection::create_offer(bool ice_restart, DescriptionHandler handler) {
    if (closed_) {
        boost::asio::post(net_.io, [handler = std::move(handler)]() {
            handler(boost::asio::error::operation_aborted, SessionDescription{});
        });
        return;
    }
    ++offers_;
    if (ice_restart) ++restart_offers_;
    SessionDescription d{"offer", kSdpPrefix + std::to_string(id_) + " round=" + std::to_string(offers_)};
    boost::asio::post(net_.io, [handler = std::move(handler), d]() { handler(boost::system::error_code{}, d); });
}

void FakePeerConnection::create_answer(DescriptionHandler handler) {
    boost::system::error_code ec;
    if (closed_) ec = boost::asio::error::operation_aborted;
    else if (signaling_state_ != SignalingState::HAVE_REMOTE_OFFER) ec = boost::system::errc::make_error_code(
        boost::system::errc::operation_not_permitted);
    SessionDescription d{"answer", kSdpPrefix + std::to_string(id_)};
    boost::asio::post(net_.io, [handler = std::move(handler), ec, d]() { handler(ec, ec ? SessionDescription{} : d); });
}

void FakePeerConnection::set_local_description(const SessionDescription& desc, Handler handler) {
    if (closed_) {
        complete(std::move(handler), boost::asio::error::operation_aborted);
        return;
    }
    if (desc.type == "offer") {
        if (signaling_state_ == SignalingState::HAVE_REMOTE_OFFER) {
            complete(std::move(handler), boost::system::errc::make_error_code(
                boost::system::errc::operation_not_permitted));
            return;
        }
        signaling_state_ = SignalingState::HAVE_LOCAL_OFFER;
        complete(std::move(handler), {});
        return;
    }
    if (signaling_state_ != SignalingState::HAVE_REMOTE_OFFER) {
        complete(std::move(handler), boost::system::errc::make_error_code(
            boost::system::errc::operation_not_permitted));
        return;
    }
    signaling_state_ = SignalingState::STABLE;
    complete(std::move(handler), {});

    auto self = shared_from_this();
    boost::asio::post(net_.io, [self]() {
        if (self->closed_ || !self->on_candidate_) return;
        self->on_candidate_(IceCandidate{"candidate:fake " + std::to_string(self->id_), "0", 0});
    });
}

void FakePeerConnection::rollback(Handler handler) {
    if (signaling_state_ == SignalingState::HAVE_LOCAL_OFFER) {
        signaling_state_ = SignalingState::STABLE;
        ++rollbacks_;
    }
    complete(std::move(handler), {});
}

void FakePeerConnection::set_remote_description(const SessionDescription& desc, Handler handler) {
    if (closed_) {
        complete(std::move(handler), boost::asio::error::operation_aborted);
        return;
    }
    uint64_t owner = sdp_owner(desc.sdp);
    if (owner == 0) {
        complete(std::move(handler), boost::system::errc::make_error_code(boost::system::errc::invalid_argument));
        return;
    }
    if (desc.type == "offer") {
        if (signaling_state_ == SignalingState::HAVE_LOCAL_OFFER) {
            complete(std::move(handler), boost::system::errc::make_error_code(
                boost::system::errc::operation_not_permitted));
            return;
        }
        signaling_state_ = SignalingState::HAVE_REMOTE_OFFER;
        remote_id_ = owner;
        has_remote_ = true;
        complete(std::move(handler), {});
        return;
    }
    if (signaling_state_ != SignalingState::HAVE_LOCAL_OFFER) {
        complete(std::move(handler), boost::system::errc::make_error_code(
            boost::system::errc::operation_not_permitted));
        return;
    }
    signaling_state_ = SignalingState::STABLE;
    remote_id_ = owner;
    has_remote_ = true;
    complete(std::move(handler), {});
    start_round();
}

void FakePeerConnection::add_ice_candidate(const IceCandidate&, Handler handler) {
    if (!has_remote_) {
        complete(std::move(handler), boost::system::errc::make_error_code(
            boost::system::errc::operation_not_permitted));
        return;
    }
    ++candidates_added_;
    complete(std::move(handler), {});
}

std::shared_ptr<DataChannel> FakePeerConnection::create_data_channel(const std::string& label) {
    if (!channel_ || channel_->state() == ChannelState::CLOSED) {
        channel_ = std::make_shared<FakeDataChannel>(net_.io, label);
    }
    return channel_;
}

void FakePeerConnection::close() {
    if (closed_) return;
    closed_ = true;
    signaling_state_ = SignalingState::CLOSED;
    ice_state_ = IceState::CLOSED;
    if (round_timer_) round_timer_->cancel();
    if (channel_) channel_->close();
}

void FakePeerConnection::start_round() {
    auto answerer = remote();
    if (!answerer) return;
    ++net_.rounds;
    set_ice(IceState::CHECKING);
    answerer->set_ice(IceState::CHECKING);
    if (net_.hang) return;

    round_timer_ = std::make_shared<boost::asio::steady_timer>(net_.io);
    round_timer_->expires_after(net_.check_delay);
    std::weak_ptr<FakePeerConnection> wself = shared_from_this();
    round_timer_->async_wait([this, wself](const boost::system::error_code& ec) {
        auto self = wself.lock();
        if (ec || !self || closed_) return;
        auto answerer = remote();
        if (!answerer) return;
        if (net_.blocked || net_.fail_rounds > 0) {
            if (net_.fail_rounds > 0) --net_.fail_rounds;
            set_ice_pair(IceState::FAILED);
            return;
        }
        connect_pair(answerer);
    });
}

void FakePeerConnection::connect_pair(const std::shared_ptr<FakePeerConnection>& answerer) {
    set_ice_pair(IceState::CONNECTED);

    auto usable = [](const std::shared_ptr<FakeDataChannel>& ch) {
        return ch && ch->state() != ChannelState::CLOSED;
    };
    if (!usable(channel_) && !usable(answerer->channel_)) return;
    std::string label = usable(channel_) ? channel_->label() : answerer->channel_->label();

    // The end that did not create the channel learns about it from the remote.
    auto announce = [this, &label](const std::shared_ptr<FakePeerConnection>& pc) {
        pc->channel_ = std::make_shared<FakeDataChannel>(net_.io, label);
        auto ch = pc->channel_;
        boost::asio::post(net_.io, [pc, ch]() {
            if (pc->closed_ || !pc->on_data_channel_) return;
            pc->on_data_channel_(ch);
        });
    };
    if (!usable(channel_)) announce(shared_from_this());
    if (!usable(answerer->channel_)) announce(answerer);

    channel_->link(answerer->channel_);
    channel_->open();
    answerer->channel_->open();
}

// ---------------- FakeConnectionFactory ----------------

std::shared_ptr<PeerConnection> FakeConnectionFactory::create(const std::vector<TraversalServer>& servers) {
    if (fail_create) return nullptr;
    auto pc = std::make_shared<FakePeerConnection>(net_, servers);
    net_.pcs[pc->id()] = pc;
    created.push_back(pc);
    return pc;
}

// ---------------- LoopbackCarrier ----------------

LoopbackCarrier::LoopbackCarrier(boost::asio::io_context& io, PeerId self) : io_(io), self_(std::move(self)) {}

void LoopbackCarrier::link(LoopbackCarrier& a, LoopbackCarrier& b) {
    a.peer_ = &b;
    b.peer_ = &a;
}

bool LoopbackCarrier::send_text(const std::string& json) {
    if (!open_) return false;

    Json::Value t;
    if (!parse_json(json, t) || !t.isObject()) return false;
    std::string type = t.get("type", "").asString();
    std::string to = t.get("to", "").asString();
    sent_types.push_back(type);
    if (drop_types.count(type) > 0) return true;

    std::string out = rewrite ? rewrite(json) : json;
    std::string from_key = "\"to\":\"" + to + "\"";
    auto pos = out.find(from_key);
    if (pos != std::string::npos) out.replace(pos, from_key.size(), "\"from\":\"" + self_ + "\"");

    LoopbackCarrier* peer = peer_;
    if (!peer || peer->self_ != to) return true;
    boost::asio::post(io_, [peer, out]() {
        if (peer->open_ && peer->on_message_) peer->on_message_(out);
    });
    return true;
}

void LoopbackCarrier::set_open(bool open) {
    if (open_ == open) return;
    open_ = open;
    if (on_state_) on_state_(open);
}

void LoopbackCarrier::deliver_raw(const std::string& json) {
    boost::asio::post(io_, [this, json]() {
        if (on_message_) on_message_(json);
    });
}

size_t LoopbackCarrier::count_sent(const std::string& type) const {
    size_t n = 0;
    for (const auto& t : sent_types) {
        if (t == type) ++n;
    }
    return n;
}

// ---------------- scripted traversal ----------------

void ScriptedProbe::probe(const ServerUrl& server, std::chrono::milliseconds timeout, ProbeHandler handler) {
    ++calls;
    auto it = latency.find(server.host);
    if (it == latency.end()) {
        auto timer = std::make_shared<boost::asio::steady_timer>(io_, timeout);
        timer->async_wait([timer, handler = std::move(handler)](const boost::system::error_code&) {
            handler(boost::asio::error::timed_out, ProbeResult{});
        });
        return;
    }
    ProbeResult res;
    res.latency_ms = it->second;
    res.mapped = boost::asio::ip::udp::endpoint(boost::asio::ip::make_address("203.0.113.7"), 40000);
    boost::asio::post(io_, [handler = std::move(handler), res]() { handler(boost::system::error_code{}, res); });
}

void ScriptedDirectory::fetch(std::chrono::milliseconds, FetchHandler handler) {
    ++calls;
    auto list = servers;
    auto ec = error;
    boost::asio::post(io_, [handler = std::move(handler), ec, list = std::move(list)]() mutable {
        handler(ec, ec ? std::vector<TraversalServer>{} : std::move(list));
    });
}

// ---------------- TestPeer ----------------

Config fast_config() {
    Config cfg;
    cfg.connect_timeout_ms = 3000;
    cfg.slow_hint_ms = 1000;
    cfg.disconnect_grace_ms = 100;
    cfg.restart_delay_ms = 20;
    cfg.max_restarts = 2;
    cfg.chunk_size = 1024;
    cfg.backlog_threshold = 64 * 1024;
    cfg.backlog_poll_ms = 2;
    cfg.relay_chunk_delay_ms = 1;
    cfg.probe_timeout_ms = 50;
    cfg.directory_timeout_ms = 100;
    return cfg;
}

namespace {

TraversalServer relay_server() {
    TraversalServer s;
    s.urls.push_back("turn:turn.example.test:3478");
    s.username = "u";
    s.credential = "p";
    s.kind = ServerKind::RELAY;
    return s;
}

} // namespace

TestPeer::TestPeer(boost::asio::io_context& io, FakeNetwork& net, const PeerId& id, const Config& cfg)
    : id(id),
      carrier(io, id),
      directory(io),
      probe(io),
      factory(net),
      node(io, carrier, directory, probe, factory, cfg, logger) {
    directory.servers.push_back(relay_server());
    node.set_status_handler([this](const PeerId&, ConnectionStatus st, const std::optional<std::string>&) {
        statuses.push_back(st);
    });
    node.start();
}

void join_room(boost::asio::io_context& io, TestPeer& a, TestPeer& b) {
    LoopbackCarrier::link(a.carrier, b.carrier);
    a.carrier.set_open(true);
    b.carrier.set_open(true);
    a.carrier.deliver_raw("{\"type\":\"welcome\",\"data\":{\"peerId\":\"" + a.id + "\",\"peers\":[\"" + b.id + "\"]}}");
    b.carrier.deliver_raw("{\"type\":\"welcome\",\"data\":{\"peerId\":\"" + b.id + "\",\"peers\":[\"" + a.id + "\"]}}");
    run_until(io, [&]() { return a.node.local_id() == a.id && b.node.local_id() == b.id; });
}

} // namespace fakes
} // namespace clouddrop
