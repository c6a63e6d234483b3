#pragma once

#include <boost/asio.hpp>

#include <functional>
#include <memory>
#include <set>
#include <string>
#include <vector>

#include "config.hpp"
#include "connection_manager.hpp"
#include "events.hpp"
#include "file_source.hpp"
#include "logger.hpp"
#include "peer_connection.hpp"
#include "secure_channel.hpp"
#include "signaling.hpp"
#include "transfer.hpp"
#include "traversal.hpp"

namespace clouddrop {

ConnectionManager::Options connection_options(const Config& cfg);
TransferEngine::Options transfer_options(const Config& cfg);
TraversalServerSelector::Options selector_options(const Config& cfg);

// Composition root: one local peer in a room. The carrier, the server
// directory, the probe and the direct transport are supplied by the caller.
// All methods run on the io_context thread.
class PeerNode {
public:
    using PeerEventHandler = std::function<void(const PeerId&, bool joined)>;

    PeerNode(boost::asio::io_context& io,
             SignalingTransport& transport,
             ServerDirectory& directory,
             ReflexiveProbe& probe,
             PeerConnectionFactory& factory,
             const Config& cfg,
             Logger& logger);

    PeerNode(const PeerNode&) = delete;
    PeerNode& operator=(const PeerNode&) = delete;

    void start();
    void stop();

    std::string send_file(const PeerId& peer, std::shared_ptr<FileSource> file,
                          TransferEngine::CompletionHandler done);
    void send_text(const PeerId& peer, const std::string& text, TransferEngine::CompletionHandler done);
    void close_peer(const PeerId& peer);

    void servers(TraversalServerSelector::ServersHandler handler, bool force_refresh = false);

    const PeerId& local_id() const { return connections_.local_peer_id(); }
    const std::set<PeerId>& room_peers() const { return room_peers_; }
    bool relay_mode(const PeerId& peer) const { return connections_.relay_mode(peer); }
    bool signaling_open() const { return signaler_.is_open(); }

    SecureChannel& secure() { return secure_; }
    ConnectionManager& connections() { return connections_; }
    TransferEngine& transfers() { return transfers_; }

    void set_status_handler(ConnectionStateHandler h) { connections_.set_status_handler(std::move(h)); }
    void set_file_offered_handler(FileOfferedHandler h) { transfers_.set_file_offered_handler(std::move(h)); }
    void set_file_received_handler(FileReceivedHandler h) { transfers_.set_file_received_handler(std::move(h)); }
    void set_progress_handler(ProgressHandler h) { transfers_.set_progress_handler(std::move(h)); }
    void set_text_handler(TextReceivedHandler h) { transfers_.set_text_handler(std::move(h)); }
    void set_peer_handler(PeerEventHandler h) { on_peer_ = std::move(h); }

private:
    void on_signal(const InboundSignal& msg);
    void on_carrier_state(bool open);

    boost::asio::io_context& io_;
    SignalingTransport& transport_;
    Logger& logger_;

    Signaler signaler_;
    SecureChannel secure_;
    TraversalServerSelector selector_;
    ConnectionManager connections_;
    TransferEngine transfers_;

    std::set<PeerId> room_peers_;
    PeerEventHandler on_peer_;
};

} // namespace clouddrop
