#pragma once

#include <boost/asio.hpp>

#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <string>
#include <unordered_map>
#include <unordered_set>
#include <vector>

#include "errors.hpp"
#include "events.hpp"
#include "logger.hpp"
#include "messages.hpp"
#include "peer_connection.hpp"
#include "secure_channel.hpp"
#include "signaling.hpp"
#include "traversal.hpp"

namespace clouddrop {

// Owns one negotiation state machine per remote peer.
//
// Offer collisions are resolved with perfect negotiation: the side whose id is
// lexicographically smaller (or that does not know its own id yet) is polite
// and yields to a concurrent remote offer; the other side ignores it.
// A peer is ready once its data channel is open AND a shared key exists.
class ConnectionManager {
public:
    static constexpr const char* kChannelLabel = "file-transfer";

    struct Options {
        std::chrono::milliseconds connect_timeout{15000};
        std::chrono::milliseconds slow_hint{5000};
        std::chrono::milliseconds disconnect_grace{5000};
        std::chrono::milliseconds restart_delay{2000};
        uint32_t max_restarts = 2;
    };

    using ReadyHandler = std::function<void(const boost::system::error_code&, std::shared_ptr<DataChannel>)>;
    using ChannelTextHandler = std::function<void(const PeerId&, const std::string&)>;
    using ChannelBinaryHandler = std::function<void(const PeerId&, const std::vector<uint8_t>&)>;

    ConnectionManager(boost::asio::io_context& io,
                      Signaler& signaler,
                      SecureChannel& secure,
                      TraversalServerSelector& selector,
                      PeerConnectionFactory& factory,
                      Options opts,
                      Logger& logger);
    ~ConnectionManager();

    ConnectionManager(const ConnectionManager&) = delete;
    ConnectionManager& operator=(const ConnectionManager&) = delete;

    void set_local_peer_id(const PeerId& id);
    const PeerId& local_peer_id() const { return local_id_; }

    bool is_polite(const PeerId& remote) const { return is_polite(local_id_, remote); }
    static bool is_polite(const PeerId& local, const PeerId& remote);

    // Completes with an open channel once the peer is ready. On timeout the peer
    // is switched to relay mode and the handler gets channel_timeout or
    // encryption_key_timeout; when the direct path is abandoned after the
    // restart budget it gets connect_failed. Concurrent calls for one peer share
    // a single negotiation. The handler never runs inline.
    void ensure_ready(const PeerId& peer, ReadyHandler handler);

    void initiate_offer(const PeerId& peer);
    void handle_remote_offer(const PeerId& peer, const signal::Offer& offer);
    void handle_remote_answer(const PeerId& peer, const signal::Answer& answer);
    void handle_remote_candidate(const PeerId& peer, const IceCandidate& cand);

    // Drops every piece of per-peer state, including the shared key and the
    // relay flag. Pending ensure_ready calls fail with operation_aborted.
    void close(const PeerId& peer);
    void close_all();

    bool relay_mode(const PeerId& peer) const { return relay_peers_.count(peer) > 0; }
    void enter_relay_mode(const PeerId& peer, const std::string& reason);

    // The peer's data channel when it is open, otherwise null.
    std::shared_ptr<DataChannel> open_channel(const PeerId& peer) const;

    bool has_session(const PeerId& peer) const { return sessions_.count(peer) > 0; }
    uint32_t restart_count(const PeerId& peer) const;
    std::vector<PeerId> session_peers() const;

    void set_status_handler(ConnectionStateHandler h) { on_status_ = std::move(h); }
    void set_channel_text_handler(ChannelTextHandler h) { on_channel_text_ = std::move(h); }
    void set_channel_binary_handler(ChannelBinaryHandler h) { on_channel_binary_ = std::move(h); }

private:
    struct PeerSession {
        PeerSession(boost::asio::io_context& io, PeerId id)
            : peer(std::move(id)), connect_timer(io), slow_timer(io), disconnect_timer(io), restart_timer(io) {}

        PeerId peer;
        std::shared_ptr<PeerConnection> pc;
        std::shared_ptr<DataChannel> channel;

        bool creating_pc = false;
        std::vector<std::function<void()>> pc_waiters;

        bool making_offer = false;
        bool ignore_offer = false;
        uint64_t offer_gen = 0;

        uint32_t restart_count = 0;
        bool restart_pending = false;

        std::vector<IceCandidate> pending_candidates;
        std::vector<ReadyHandler> waiters;

        boost::asio::steady_timer connect_timer;
        boost::asio::steady_timer slow_timer;
        boost::asio::steady_timer disconnect_timer;
        boost::asio::steady_timer restart_timer;

        bool closed = false;
    };
    using SessionPtr = std::shared_ptr<PeerSession>;
    using WeakSession = std::weak_ptr<PeerSession>;

    SessionPtr get_or_create(const PeerId& peer);
    SessionPtr find(const PeerId& peer) const;
    static SessionPtr live(const WeakSession& ws);

    void with_connection(const SessionPtr& s, std::function<void()> fn);
    void create_connection(const SessionPtr& s, const std::vector<TraversalServer>& servers);
    void setup_channel(const SessionPtr& s, const std::shared_ptr<DataChannel>& ch);

    void send_offer(const SessionPtr& s, bool ice_restart, uint64_t gen);
    void accept_remote_offer(const SessionPtr& s, const signal::Offer& offer);
    void import_key(const SessionPtr& s, const std::string& public_key);
    void add_candidate(const SessionPtr& s, const IceCandidate& cand);
    void flush_candidates(const SessionPtr& s);
    bool needs_offer(const PeerSession& s) const;
    bool usable(const PeerSession& s) const;

    void on_ice_state(const SessionPtr& s, IceState state);
    void attempt_restart(const SessionPtr& s);
    void on_connect_timeout(const SessionPtr& s);
    void check_ready(const SessionPtr& s);

    void give_up(const SessionPtr& s, const std::string& reason);
    void teardown(const SessionPtr& s, bool remove_key, const boost::system::error_code& ec);
    static void fail_waiters(const SessionPtr& s, const boost::system::error_code& ec);

    void notify(const PeerId& peer, ConnectionStatus status, const std::optional<std::string>& hint);

    boost::asio::io_context& io_;
    Signaler& signaler_;
    SecureChannel& secure_;
    TraversalServerSelector& selector_;
    PeerConnectionFactory& factory_;
    Options opts_;
    Logger& logger_;

    PeerId local_id_;
    std::unordered_map<PeerId, SessionPtr> sessions_;
    // Outlives sessions: a peer whose direct path was abandoned stays on the
    // relay until a direct channel opens again or the peer is closed.
    std::unordered_set<PeerId> relay_peers_;

    ConnectionStateHandler on_status_;
    ChannelTextHandler on_channel_text_;
    ChannelBinaryHandler on_channel_binary_;
};

} // namespace clouddrop
