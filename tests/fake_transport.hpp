#pragma once

#include <boost/asio.hpp>

#include <chrono>
#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <set>
#include <string>
#include <vector>

#include "config.hpp"
#include "logger.hpp"
#include "node.hpp"
#include "peer_connection.hpp"
#include "signaling.hpp"
#include "traversal.hpp"

namespace clouddrop {
namespace fakes {

// Runs io until pred() holds or limit elapses. Returns pred().
bool run_until(boost::asio::io_context& io, const std::function<bool()>& pred,
               std::chrono::milliseconds limit = std::chrono::milliseconds(5000));
void run_for(boost::asio::io_context& io, std::chrono::milliseconds d);

class FakePeerConnection;

// Shared behaviour of every fake connection on one simulated network.
struct FakeNetwork {
    explicit FakeNetwork(boost::asio::io_context& io) : io(io) {}

    boost::asio::io_context& io;
    // Every check round ends FAILED.
    bool blocked = false;
    // Check rounds never finish.
    bool hang = false;
    // The next N rounds end FAILED, later ones connect.
    int fail_rounds = 0;
    std::chrono::milliseconds check_delay{5};

    int rounds = 0;
    uint64_t next_id = 1;
    std::map<uint64_t, std::weak_ptr<FakePeerConnection>> pcs;

    std::shared_ptr<FakePeerConnection> find(uint64_t id) const;
};

class FakeDataChannel final : public DataChannel, public std::enable_shared_from_this<FakeDataChannel> {
public:
    FakeDataChannel(boost::asio::io_context& io, std::string label);

    const std::string& label() const override { return label_; }
    ChannelState state() const override { return state_; }
    bool send_text(const std::string& text) override;
    bool send_binary(const Bytes& data) override;
    size_t buffered_amount() const override { return buffered_; }
    void close() override;

    void link(const std::shared_ptr<FakeDataChannel>& other);
    void open();

    // Goes CLOSED without notifying anyone, like a silently dead stream.
    void drop() { state_ = ChannelState::CLOSED; }
    // Goes CLOSED and fires the close handler, as when the remote end closes.
    void remote_close();

    void set_buffered_amount(size_t n) { buffered_ = n; }
    size_t binary_sent() const { return binary_sent_; }
    size_t text_sent() const { return text_sent_; }

private:
    boost::asio::io_context& io_;
    std::string label_;
    ChannelState state_ = ChannelState::CONNECTING;
    std::weak_ptr<FakeDataChannel> peer_;
    size_t buffered_ = 0;
    size_t binary_sent_ = 0;
    size_t text_sent_ = 0;
};

// Signaling state machine of a real connection; connectivity is decided by
// the FakeNetwork. The description carries the connection id so the two ends
// find each other.
class FakePeerConnection final : public PeerConnection, public std::enable_shared_from_this<FakePeerConnection> {
public:
    FakePeerConnection(FakeNetwork& net, std::vector<TraversalServer> servers);

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

    uint64_t id() const { return id_; }
    const std::vector<TraversalServer>& servers() const { return servers_; }
    std::shared_ptr<FakeDataChannel> channel() const { return channel_; }

    // Moves this end and its remote end to state s.
    void set_ice_pair(IceState s);

    int offers() const { return offers_; }
    int restart_offers() const { return restart_offers_; }
    int rollbacks() const { return rollbacks_; }
    int candidates_added() const { return candidates_added_; }

private:
    void complete(Handler handler, const boost::system::error_code& ec);
    void set_ice(IceState s);
    void start_round();
    void connect_pair(const std::shared_ptr<FakePeerConnection>& answerer);
    std::shared_ptr<FakePeerConnection> remote() const;

    FakeNetwork& net_;
    std::vector<TraversalServer> servers_;
    uint64_t id_ = 0;
    uint64_t remote_id_ = 0;
    SignalingState signaling_state_ = SignalingState::STABLE;
    IceState ice_state_ = IceState::NEW;
    bool has_remote_ = false;
    bool closed_ = false;
    std::shared_ptr<FakeDataChannel> channel_;
    std::shared_ptr<boost::asio::steady_timer> round_timer_;

    int offers_ = 0;
    int restart_offers_ = 0;
    int rollbacks_ = 0;
    int candidates_added_ = 0;
};

class FakeConnectionFactory final : public PeerConnectionFactory {
public:
    explicit FakeConnectionFactory(FakeNetwork& net) : net_(net) {}

    std::shared_ptr<PeerConnection> create(const std::vector<TraversalServer>& servers) override;

    bool fail_create = false;
    std::vector<std::shared_ptr<FakePeerConnection>> created;

    std::shared_ptr<FakePeerConnection> last() const { return created.empty() ? nullptr : created.back(); }

private:
    FakeNetwork& net_;
};

// In-process signaling relay between two carriers. Outbound {"to":X} becomes
// inbound {"from":self} at X, delivered from the io_context.
class LoopbackCarrier final : public SignalingTransport {
public:
    LoopbackCarrier(boost::asio::io_context& io, PeerId self);

    static void link(LoopbackCarrier& a, LoopbackCarrier& b);

    bool send_text(const std::string& json) override;
    bool is_open() const override { return open_; }

    // Fires the state handler.
    void set_open(bool open);
    // Delivers a message as if the relay service produced it.
    void deliver_raw(const std::string& json);

    size_t count_sent(const std::string& type) const;

    std::vector<std::string> sent_types;
    std::set<std::string> drop_types;
    // Applied to every outbound message before delivery.
    std::function<std::string(const std::string&)> rewrite;

private:
    boost::asio::io_context& io_;
    PeerId self_;
    bool open_ = false;
    LoopbackCarrier* peer_ = nullptr;
};

// Answers from a fixed table: host -> latency; hosts not listed time out.
class ScriptedProbe final : public ReflexiveProbe {
public:
    explicit ScriptedProbe(boost::asio::io_context& io) : io_(io) {}

    void probe(const ServerUrl& server, std::chrono::milliseconds timeout, ProbeHandler handler) override;

    std::map<std::string, uint32_t> latency;
    int calls = 0;

private:
    boost::asio::io_context& io_;
};

// Directory whose answer is set by the test.
class ScriptedDirectory final : public ServerDirectory {
public:
    explicit ScriptedDirectory(boost::asio::io_context& io) : io_(io) {}

    void fetch(std::chrono::milliseconds timeout, FetchHandler handler) override;

    std::vector<TraversalServer> servers;
    boost::system::error_code error;
    int calls = 0;

private:
    boost::asio::io_context& io_;
};

// Timings short enough for the fakes.
Config fast_config();

// One PeerNode wired to fakes.
struct TestPeer {
    TestPeer(boost::asio::io_context& io, FakeNetwork& net, const PeerId& id, const Config& cfg);

    PeerId id;
    Logger logger;
    LoopbackCarrier carrier;
    ScriptedDirectory directory;
    ScriptedProbe probe;
    FakeConnectionFactory factory;
    PeerNode node;

    std::vector<ConnectionStatus> statuses;

    std::shared_ptr<FakePeerConnection> pc() const { return factory.last(); }
};

// Links two peers through their carriers, opens both and sends each its welcome.
void join_room(boost::asio::io_context& io, TestPeer& a, TestPeer& b);

} // namespace fakes
} // namespace clouddrop
