#include "node.hpp"

#include <type_traits>

namespace clouddrop {

ConnectionManager::Options connection_options(const Config& cfg) {
    ConnectionManager::Options o;
    o.connect_timeout = std::chrono::milliseconds(cfg.connect_timeout_ms);
    o.slow_hint = std::chrono::milliseconds(cfg.slow_hint_ms);
    o.disconnect_grace = std::chrono::milliseconds(cfg.disconnect_grace_ms);
    o.restart_delay = std::chrono::milliseconds(cfg.restart_delay_ms);
    o.max_restarts = cfg.max_restarts;
    return o;
}

TransferEngine::Options transfer_options(const Config& cfg) {
    TransferEngine::Options o;
    o.chunk_size = cfg.chunk_size;
    o.backlog_threshold = cfg.backlog_threshold;
    o.backlog_poll = std::chrono::milliseconds(cfg.backlog_poll_ms);
    o.relay_chunk_delay = std::chrono::milliseconds(cfg.relay_chunk_delay_ms);
    return o;
}

TraversalServerSelector::Options selector_options(const Config& cfg) {
    TraversalServerSelector::Options o;
    o.ttl = std::chrono::milliseconds(cfg.server_cache_ttl_ms);
    o.probe_timeout = std::chrono::milliseconds(cfg.probe_timeout_ms);
    o.directory_timeout = std::chrono::milliseconds(cfg.directory_timeout_ms);
    return o;
}

PeerNode::PeerNode(boost::asio::io_context& io,
                   SignalingTransport& transport,
                   ServerDirectory& directory,
                   ReflexiveProbe& probe,
                   PeerConnectionFactory& factory,
                   const Config& cfg,
                   Logger& logger)
    : io_(io),
      transport_(transport),
      logger_(logger),
      signaler_(transport, logger),
      secure_(logger),
      selector_(io, directory, probe, selector_options(cfg), logger),
      connections_(io, signaler_, secure_, selector_, factory, connection_options(cfg), logger),
      transfers_(io, connections_, secure_, signaler_, transfer_options(cfg), logger) {
    signaler_.set_signal_handler([this](const InboundSignal& msg) { on_signal(msg); });
    transport_.set_state_handler([this](bool open) { on_carrier_state(open); });
    connections_.set_channel_text_handler([this](const PeerId& peer, const std::string& text) {
        transfers_.on_channel_text(peer, text);
    });
    connections_.set_channel_binary_handler([this](const PeerId& peer, const std::vector<uint8_t>& data) {
        transfers_.on_channel_binary(peer, data);
    });
}

void PeerNode::start() {
    secure_.generate_identity();
    logger_.info("node start, identity ready");
    // Warm the server ranking so the first connection does not wait on probes.
    selector_.get_servers([this](const std::vector<TraversalServer>& servers) {
        logger_.info("node traversal servers ready count=" + std::to_string(servers.size()));
    });
}

void PeerNode::stop() {
    logger_.info("node stop requested");
    transfers_.drop_all();
    connections_.close_all();
}

std::string PeerNode::send_file(const PeerId& peer, std::shared_ptr<FileSource> file,
                                TransferEngine::CompletionHandler done) {
    return transfers_.send_file(peer, std::move(file), std::move(done));
}

void PeerNode::send_text(const PeerId& peer, const std::string& text, TransferEngine::CompletionHandler done) {
    transfers_.send_text(peer, text, std::move(done));
}

void PeerNode::close_peer(const PeerId& peer) {
    logger_.info("node closing peer=" + peer);
    transfers_.drop_peer(peer);
    connections_.close(peer);
}

void PeerNode::servers(TraversalServerSelector::ServersHandler handler, bool force_refresh) {
    selector_.get_servers(std::move(handler), force_refresh);
}

void PeerNode::on_carrier_state(bool open) {
    if (open) {
        logger_.info("node signaling carrier open");
        return;
    }
    // Room membership is re-announced by the next welcome.
    logger_.warn("node signaling carrier lost, relay unavailable until it reconnects");
    room_peers_.clear();
}

void PeerNode::on_signal(const InboundSignal& msg) {
    std::visit([this, &msg](const auto& body) {
        using T = std::decay_t<decltype(body)>;

        if constexpr (std::is_same_v<T, signal::Welcome>) {
            connections_.set_local_peer_id(body.peer_id);
            room_peers_.clear();
            for (const auto& p : body.peers) {
                if (p != body.peer_id) room_peers_.insert(p);
            }
            logger_.info("node joined room as " + body.peer_id + " peers=" + std::to_string(room_peers_.size()));
            if (on_peer_) {
                for (const auto& p : room_peers_) on_peer_(p, true);
            }
        } else if constexpr (std::is_same_v<T, signal::PeerJoined>) {
            if (body.peer.empty() || body.peer == local_id()) return;
            room_peers_.insert(body.peer);
            logger_.info("node peer joined " + body.peer);
            if (on_peer_) on_peer_(body.peer, true);
        } else if constexpr (std::is_same_v<T, signal::PeerLeft>) {
            if (body.peer.empty()) return;
            room_peers_.erase(body.peer);
            logger_.info("node peer left " + body.peer);
            close_peer(body.peer);
            if (on_peer_) on_peer_(body.peer, false);
        } else {
            if (msg.from.empty()) {
                logger_.warn(std::string("node ") + type_name(msg.body) + " without sender dropped");
                return;
            }
            if constexpr (std::is_same_v<T, signal::Offer>) {
                connections_.handle_remote_offer(msg.from, body);
            } else if constexpr (std::is_same_v<T, signal::Answer>) {
                connections_.handle_remote_answer(msg.from, body);
            } else if constexpr (std::is_same_v<T, signal::Candidate>) {
                connections_.handle_remote_candidate(msg.from, body.candidate);
            } else if constexpr (std::is_same_v<T, signal::RelayData>) {
                transfers_.on_relay_data(msg.from, body.record);
            }
        }
    }, msg.body);
}

} // namespace clouddrop
