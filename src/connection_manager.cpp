#include "connection_manager.hpp"

#include <utility>

namespace clouddrop {

ConnectionManager::ConnectionManager(boost::asio::io_context& io,
                                     Signaler& signaler,
                                     SecureChannel& secure,
                                     TraversalServerSelector& selector,
                                     PeerConnectionFactory& factory,
                                     Options opts,
                                     Logger& logger)
    : io_(io),
      signaler_(signaler),
      secure_(secure),
      selector_(selector),
      factory_(factory),
      opts_(opts),
      logger_(logger) {}

ConnectionManager::~ConnectionManager() {
    // No handlers run from here: waiters are dropped, not failed.
    for (auto& kv : sessions_) {
        auto& s = kv.second;
        s->closed = true;
        s->connect_timer.cancel();
        s->slow_timer.cancel();
        s->disconnect_timer.cancel();
        s->restart_timer.cancel();
        if (s->channel) s->channel->close();
        if (s->pc) s->pc->close();
    }
}

void ConnectionManager::set_local_peer_id(const PeerId& id) {
    local_id_ = id;
    logger_.info("conn local peer id=" + id);
}

bool ConnectionManager::is_polite(const PeerId& local, const PeerId& remote) {
    if (local.empty()) return true;
    return local < remote;
}

ConnectionManager::SessionPtr ConnectionManager::get_or_create(const PeerId& peer) {
    auto it = sessions_.find(peer);
    if (it != sessions_.end()) return it->second;
    auto s = std::make_shared<PeerSession>(io_, peer);
    sessions_.emplace(peer, s);
    logger_.debug("conn session created peer=" + peer);
    return s;
}

ConnectionManager::SessionPtr ConnectionManager::find(const PeerId& peer) const {
    auto it = sessions_.find(peer);
    return it == sessions_.end() ? nullptr : it->second;
}

ConnectionManager::SessionPtr ConnectionManager::live(const WeakSession& ws) {
    auto s = ws.lock();
    if (!s || s->closed) return nullptr;
    return s;
}

uint32_t ConnectionManager::restart_count(const PeerId& peer) const {
    auto s = find(peer);
    return s ? s->restart_count : 0;
}

std::vector<PeerId> ConnectionManager::session_peers() const {
    std::vector<PeerId> out;
    out.reserve(sessions_.size());
    for (const auto& kv : sessions_) out.push_back(kv.first);
    return out;
}

std::shared_ptr<DataChannel> ConnectionManager::open_channel(const PeerId& peer) const {
    auto s = find(peer);
    if (!s || !s->channel || s->channel->state() != ChannelState::OPEN) return nullptr;
    return s->channel;
}

bool ConnectionManager::usable(const PeerSession& s) const {
    return s.channel && s.channel->state() == ChannelState::OPEN && secure_.has_key(s.peer);
}

bool ConnectionManager::needs_offer(const PeerSession& s) const {
    if (s.making_offer) return false;
    if (!s.pc) return true;
    if (s.channel && s.channel->state() != ChannelState::CLOSED) return false;
    return s.pc->signaling_state() == SignalingState::STABLE && !s.pc->has_remote_description();
}

// ---------------- readiness ----------------

void ConnectionManager::ensure_ready(const PeerId& peer, ReadyHandler handler) {
    auto s = get_or_create(peer);
    if (usable(*s)) {
        auto ch = s->channel;
        boost::asio::post(io_, [handler = std::move(handler), ch]() {
            handler(boost::system::error_code{}, ch);
        });
        return;
    }

    s->waiters.push_back(std::move(handler));
    if (s->waiters.size() > 1) {
        logger_.debug("conn ensure_ready joins in-flight negotiation peer=" + peer +
                      " waiters=" + std::to_string(s->waiters.size()));
        return;
    }

    logger_.info("conn ensure_ready start peer=" + peer);
    notify(peer, ConnectionStatus::CONNECTING, std::string("establishing connection"));

    WeakSession ws = s;
    s->connect_timer.expires_after(opts_.connect_timeout);
    s->connect_timer.async_wait([this, ws](const boost::system::error_code& ec) {
        if (ec == boost::asio::error::operation_aborted) return;
        auto s = live(ws);
        if (!s) return;
        on_connect_timeout(s);
    });
    s->slow_timer.expires_after(opts_.slow_hint);
    s->slow_timer.async_wait([this, ws](const boost::system::error_code& ec) {
        if (ec == boost::asio::error::operation_aborted) return;
        auto s = live(ws);
        if (!s || s->waiters.empty()) return;
        notify(s->peer, ConnectionStatus::SLOW, std::string("network is slow, still trying"));
    });

    if (needs_offer(*s)) {
        initiate_offer(peer);
    } else {
        logger_.debug("conn negotiation already underway peer=" + peer);
    }
}

void ConnectionManager::check_ready(const SessionPtr& s) {
    if (s->waiters.empty() || !usable(*s)) return;

    s->connect_timer.cancel();
    s->slow_timer.cancel();
    logger_.info("conn ready peer=" + s->peer + " waiters=" + std::to_string(s->waiters.size()));
    notify(s->peer, ConnectionStatus::CONNECTED, std::nullopt);

    auto waiters = std::move(s->waiters);
    s->waiters.clear();
    auto ch = s->channel;
    for (auto& w : waiters) {
        if (w) w(boost::system::error_code{}, ch);
    }
}

void ConnectionManager::on_connect_timeout(const SessionPtr& s) {
    if (s->waiters.empty()) return;
    s->slow_timer.cancel();

    bool channel_open = s->channel && s->channel->state() == ChannelState::OPEN;
    Errc code = channel_open ? Errc::encryption_key_timeout : Errc::channel_timeout;
    logger_.warn("conn ensure_ready timed out peer=" + s->peer + " reason=" +
                 make_error_code(code).message());

    enter_relay_mode(s->peer, "direct connection timed out, using relay");
    fail_waiters(s, make_error_code(code));
}

void ConnectionManager::fail_waiters(const SessionPtr& s, const boost::system::error_code& ec) {
    auto waiters = std::move(s->waiters);
    s->waiters.clear();
    for (auto& w : waiters) {
        if (w) w(ec, nullptr);
    }
}

// ---------------- connection setup ----------------

void ConnectionManager::with_connection(const SessionPtr& s, std::function<void()> fn) {
    if (s->pc) {
        fn();
        return;
    }
    s->pc_waiters.push_back(std::move(fn));
    if (s->creating_pc) return;
    s->creating_pc = true;

    WeakSession ws = s;
    selector_.get_servers([this, ws](const std::vector<TraversalServer>& servers) {
        auto s = live(ws);
        if (!s) return;
        s->creating_pc = false;
        create_connection(s, servers);
        if (!s->pc) return;

        auto pending = std::move(s->pc_waiters);
        s->pc_waiters.clear();
        for (auto& fn : pending) {
            if (s->closed) break;
            fn();
        }
    });
}

void ConnectionManager::create_connection(const SessionPtr& s, const std::vector<TraversalServer>& servers) {
    std::shared_ptr<PeerConnection> pc;
    try {
        pc = factory_.create(servers);
    } catch (const std::exception& e) {
        logger_.error("conn cannot create peer connection peer=" + s->peer + ": " + e.what());
    }
    if (!pc) {
        give_up(s, "direct transport unavailable, using relay");
        return;
    }

    logger_.info("conn peer connection created peer=" + s->peer + " servers=" + std::to_string(servers.size()));
    s->pc = pc;

    WeakSession ws = s;
    pc->set_candidate_handler([this, ws](const IceCandidate& cand) {
        auto s = live(ws);
        if (!s) return;
        signaler_.send(s->peer, signal::Candidate{cand});
    });
    pc->set_ice_state_handler([this, ws](IceState state) {
        auto s = live(ws);
        if (!s) return;
        on_ice_state(s, state);
    });
    pc->set_data_channel_handler([this, ws](std::shared_ptr<DataChannel> ch) {
        auto s = live(ws);
        if (!s) return;
        logger_.info("conn remote data channel label=" + ch->label() + " peer=" + s->peer);
        setup_channel(s, ch);
    });
}

void ConnectionManager::setup_channel(const SessionPtr& s, const std::shared_ptr<DataChannel>& ch) {
    if (s->channel == ch) return;
    s->channel = ch;

    WeakSession ws = s;
    std::weak_ptr<DataChannel> wch = ch;
    PeerId peer = s->peer;

    auto on_open = [this, ws, wch]() {
        auto s = live(ws);
        auto ch = wch.lock();
        if (!s || !ch || s->channel != ch) return;
        logger_.info("conn data channel open peer=" + s->peer);
        if (relay_peers_.erase(s->peer) > 0) {
            logger_.info("conn relay mode cleared peer=" + s->peer);
        }
        check_ready(s);
    };
    ch->set_open_handler(on_open);
    ch->set_close_handler([this, ws, wch]() {
        auto s = live(ws);
        auto ch = wch.lock();
        if (!s || !ch || s->channel != ch) return;
        logger_.warn("conn data channel closed by remote peer=" + s->peer);
        teardown(s, false, make_error_code(Errc::transport_closed));
    });
    ch->set_text_handler([this, peer](const std::string& text) {
        if (on_channel_text_) on_channel_text_(peer, text);
    });
    ch->set_binary_handler([this, peer](const std::vector<uint8_t>& data) {
        if (on_channel_binary_) on_channel_binary_(peer, data);
    });

    if (ch->state() == ChannelState::OPEN) on_open();
}

// ---------------- negotiation ----------------

void ConnectionManager::initiate_offer(const PeerId& peer) {
    auto s = get_or_create(peer);
    if (s->making_offer) {
        logger_.debug("conn offer already being made peer=" + peer);
        return;
    }
    // Set before the first suspension point so a remote offer arriving while
    // this one is built is recognized as a collision.
    s->making_offer = true;
    uint64_t gen = ++s->offer_gen;

    WeakSession ws = s;
    with_connection(s, [this, ws, gen]() {
        auto s = live(ws);
        if (!s || gen != s->offer_gen) return;
        if (s->channel && (s->channel->state() == ChannelState::OPEN ||
                           s->channel->state() == ChannelState::CONNECTING) &&
            s->pc->has_remote_description()) {
            logger_.debug("conn channel already negotiated peer=" + s->peer);
            s->making_offer = false;
            return;
        }
        if (!s->channel || s->channel->state() == ChannelState::CLOSED) {
            setup_channel(s, s->pc->create_data_channel(kChannelLabel));
        }
        send_offer(s, false, gen);
    });
}

void ConnectionManager::send_offer(const SessionPtr& s, bool ice_restart, uint64_t gen) {
    std::string key;
    try {
        key = secure_.export_public_key_b64();
    } catch (const std::exception& e) {
        logger_.error("conn cannot export public key: " + std::string(e.what()));
        s->making_offer = false;
        return;
    }

    WeakSession ws = s;
    s->pc->create_offer(ice_restart, [this, ws, gen, ice_restart, key](const boost::system::error_code& ec,
                                                                       SessionDescription offer) {
        auto s = live(ws);
        if (!s) return;
        if (gen != s->offer_gen) {
            logger_.debug("conn local offer superseded peer=" + s->peer);
            return;
        }
        if (ec) {
            logger_.warn("conn create_offer failed peer=" + s->peer + ": " + ec.message());
            s->making_offer = false;
            return;
        }
        s->pc->set_local_description(offer, [this, ws, gen, ice_restart, key, offer](
                                                const boost::system::error_code& ec) {
            auto s = live(ws);
            if (!s || gen != s->offer_gen) return;
            s->making_offer = false;
            if (ec) {
                logger_.warn("conn set_local_description(offer) failed peer=" + s->peer + ": " + ec.message());
                return;
            }
            logger_.info(std::string("conn sending ") + (ice_restart ? "ice-restart " : "") +
                         "offer peer=" + s->peer);
            signaler_.send(s->peer, signal::Offer{offer, key, ice_restart});
        });
    });
}

void ConnectionManager::handle_remote_offer(const PeerId& peer, const signal::Offer& offer) {
    auto s = get_or_create(peer);
    logger_.info(std::string("conn received ") + (offer.ice_restart ? "ice-restart " : "") +
                 "offer peer=" + peer);

    WeakSession ws = s;
    with_connection(s, [this, ws, offer]() {
        auto s = live(ws);
        if (!s) return;

        bool polite = is_polite(s->peer);
        bool collision = s->making_offer || s->pc->signaling_state() != SignalingState::STABLE;
        s->ignore_offer = !polite && collision;
        if (s->ignore_offer) {
            logger_.info("conn offer collision, impolite side ignores remote offer peer=" + s->peer);
            return;
        }

        if (!collision) {
            accept_remote_offer(s, offer);
            return;
        }

        logger_.info("conn offer collision, polite side rolls back peer=" + s->peer);
        s->making_offer = false;
        ++s->offer_gen;
        WeakSession ws2 = s;
        s->pc->rollback([this, ws2, offer](const boost::system::error_code& ec) {
            auto s = live(ws2);
            if (!s) return;
            if (ec) logger_.warn("conn rollback failed peer=" + s->peer + ": " + ec.message());
            accept_remote_offer(s, offer);
        });
    });
}

void ConnectionManager::accept_remote_offer(const SessionPtr& s, const signal::Offer& offer) {
    WeakSession ws = s;
    s->pc->set_remote_description(offer.sdp, [this, ws, offer](const boost::system::error_code& ec) {
        auto s = live(ws);
        if (!s) return;
        if (ec) {
            logger_.warn("conn set_remote_description(offer) failed peer=" + s->peer + ": " + ec.message());
            return;
        }
        import_key(s, offer.public_key);
        flush_candidates(s);

        s->pc->create_answer([this, ws](const boost::system::error_code& ec, SessionDescription answer) {
            auto s = live(ws);
            if (!s) return;
            if (ec) {
                logger_.warn("conn create_answer failed peer=" + s->peer + ": " + ec.message());
                return;
            }
            s->pc->set_local_description(answer, [this, ws, answer](const boost::system::error_code& ec) {
                auto s = live(ws);
                if (!s) return;
                if (ec) {
                    logger_.warn("conn set_local_description(answer) failed peer=" + s->peer + ": " +
                                 ec.message());
                    return;
                }
                std::string key;
                try {
                    key = secure_.export_public_key_b64();
                } catch (const std::exception& e) {
                    logger_.error("conn cannot export public key: " + std::string(e.what()));
                    return;
                }
                logger_.info("conn sending answer peer=" + s->peer);
                signaler_.send(s->peer, signal::Answer{answer, key});
            });
        });
    });
}

void ConnectionManager::handle_remote_answer(const PeerId& peer, const signal::Answer& answer) {
    auto s = find(peer);
    if (!s || !s->pc) {
        logger_.warn("conn answer without session dropped peer=" + peer);
        return;
    }
    if (s->pc->signaling_state() != SignalingState::HAVE_LOCAL_OFFER) {
        // Expected after a rollback: the remote side answered an offer we withdrew.
        logger_.info(std::string("conn answer in state ") + to_string(s->pc->signaling_state()) +
                     " dropped peer=" + peer);
        return;
    }

    logger_.info("conn received answer peer=" + peer);
    WeakSession ws = s;
    s->pc->set_remote_description(answer.sdp, [this, ws, answer](const boost::system::error_code& ec) {
        auto s = live(ws);
        if (!s) return;
        if (ec) {
            logger_.warn("conn set_remote_description(answer) failed peer=" + s->peer + ": " + ec.message());
            return;
        }
        flush_candidates(s);
        import_key(s, answer.public_key);
    });
}

void ConnectionManager::handle_remote_candidate(const PeerId& peer, const IceCandidate& cand) {
    auto s = get_or_create(peer);
    if (s->pc && s->pc->has_remote_description()) {
        add_candidate(s, cand);
        return;
    }
    s->pending_candidates.push_back(cand);
    logger_.debug("conn candidate buffered peer=" + peer + " pending=" +
                  std::to_string(s->pending_candidates.size()));
}

void ConnectionManager::add_candidate(const SessionPtr& s, const IceCandidate& cand) {
    WeakSession ws = s;
    s->pc->add_ice_candidate(cand, [this, ws](const boost::system::error_code& ec) {
        auto s = live(ws);
        if (!s || !ec) return;
        if (s->ignore_offer) return;
        logger_.warn("conn add_ice_candidate failed peer=" + s->peer + ": " + ec.message());
    });
}

void ConnectionManager::flush_candidates(const SessionPtr& s) {
    if (s->pending_candidates.empty()) return;
    auto pending = std::move(s->pending_candidates);
    s->pending_candidates.clear();
    logger_.debug("conn flushing candidates peer=" + s->peer + " count=" + std::to_string(pending.size()));
    for (const auto& c : pending) add_candidate(s, c);
}

void ConnectionManager::import_key(const SessionPtr& s, const std::string& public_key) {
    if (public_key.empty()) return;
    try {
        secure_.import_peer_key_b64(s->peer, public_key);
    } catch (const KeyImportError& e) {
        logger_.warn(std::string("conn ") + e.what());
        return;
    }
    check_ready(s);
}

// ---------------- connectivity state machine ----------------

void ConnectionManager::on_ice_state(const SessionPtr& s, IceState state) {
    logger_.info(std::string("conn ice state ") + to_string(state) + " peer=" + s->peer);
    s->disconnect_timer.cancel();

    switch (state) {
        case IceState::DISCONNECTED: {
            WeakSession ws = s;
            s->disconnect_timer.expires_after(opts_.disconnect_grace);
            s->disconnect_timer.async_wait([this, ws](const boost::system::error_code& ec) {
                if (ec == boost::asio::error::operation_aborted) return;
                auto s = live(ws);
                if (!s || !s->pc) return;
                if (s->pc->ice_state() != IceState::DISCONNECTED) return;
                logger_.info("conn still disconnected after grace period peer=" + s->peer);
                attempt_restart(s);
            });
            break;
        }
        case IceState::FAILED:
            attempt_restart(s);
            break;
        case IceState::CONNECTED:
        case IceState::COMPLETED:
            s->restart_count = 0;
            check_ready(s);
            break;
        case IceState::CLOSED:
            give_up(s, "direct connection closed, using relay");
            break;
        case IceState::NEW:
        case IceState::CHECKING:
            break;
    }
}

void ConnectionManager::attempt_restart(const SessionPtr& s) {
    if (s->restart_pending) {
        logger_.debug("conn restart already scheduled peer=" + s->peer);
        return;
    }
    if (s->restart_count >= opts_.max_restarts) {
        logger_.warn("conn max ice restarts (" + std::to_string(opts_.max_restarts) + ") reached peer=" + s->peer);
        give_up(s, "direct connection failed, using relay");
        return;
    }

    ++s->restart_count;
    s->restart_pending = true;
    logger_.info("conn ice restart " + std::to_string(s->restart_count) + "/" +
                 std::to_string(opts_.max_restarts) + " scheduled peer=" + s->peer);

    WeakSession ws = s;
    s->restart_timer.expires_after(opts_.restart_delay);
    s->restart_timer.async_wait([this, ws](const boost::system::error_code& ec) {
        if (ec == boost::asio::error::operation_aborted) return;
        auto s = live(ws);
        if (!s || !s->pc) return;
        s->restart_pending = false;

        IceState st = s->pc->ice_state();
        if (st == IceState::CONNECTED || st == IceState::COMPLETED) {
            logger_.info("conn recovered before restart peer=" + s->peer);
            return;
        }
        s->making_offer = true;
        uint64_t gen = ++s->offer_gen;
        send_offer(s, true, gen);
    });
}

void ConnectionManager::give_up(const SessionPtr& s, const std::string& reason) {
    logger_.warn("conn giving up on direct path peer=" + s->peer + ": " + reason);
    enter_relay_mode(s->peer, reason);
    // The shared key survives: relay payloads are encrypted with it too.
    teardown(s, false, make_error_code(Errc::connect_failed));
}

void ConnectionManager::teardown(const SessionPtr& s, bool remove_key, const boost::system::error_code& ec) {
    if (s->closed) return;
    s->closed = true;

    s->connect_timer.cancel();
    s->slow_timer.cancel();
    s->disconnect_timer.cancel();
    s->restart_timer.cancel();

    auto it = sessions_.find(s->peer);
    if (it != sessions_.end() && it->second == s) sessions_.erase(it);

    auto ch = std::move(s->channel);
    auto pc = std::move(s->pc);
    if (ch) ch->close();
    if (pc) pc->close();

    s->pending_candidates.clear();
    s->pc_waiters.clear();
    if (remove_key) secure_.remove_peer(s->peer);

    logger_.info("conn session closed peer=" + s->peer);
    fail_waiters(s, ec);
}

void ConnectionManager::close(const PeerId& peer) {
    if (relay_peers_.erase(peer) > 0) logger_.debug("conn relay mode cleared peer=" + peer);
    auto s = find(peer);
    if (!s) {
        secure_.remove_peer(peer);
        return;
    }
    teardown(s, true, boost::asio::error::operation_aborted);
}

void ConnectionManager::close_all() {
    std::vector<PeerId> peers = session_peers();
    for (const auto& p : relay_peers_) peers.push_back(p);
    for (const auto& p : peers) close(p);
    logger_.info("conn all sessions closed");
}

void ConnectionManager::enter_relay_mode(const PeerId& peer, const std::string& reason) {
    if (!relay_peers_.insert(peer).second) return;
    logger_.info("conn relay mode entered peer=" + peer + ": " + reason);
    notify(peer, ConnectionStatus::RELAY, reason);
}

void ConnectionManager::notify(const PeerId& peer, ConnectionStatus status, const std::optional<std::string>& hint) {
    if (on_status_) on_status_(peer, status, hint);
}

} // namespace clouddrop
