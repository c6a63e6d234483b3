#pragma once

#include <boost/asio.hpp>

#include <chrono>
#include <cstdint>
#include <deque>
#include <functional>
#include <memory>
#include <string>
#include <unordered_map>
#include <vector>

#include "connection_manager.hpp"
#include "events.hpp"
#include "file_source.hpp"
#include "logger.hpp"
#include "messages.hpp"
#include "secure_channel.hpp"
#include "signaling.hpp"

namespace clouddrop {

// Chunked, encrypted file and text exchange over the direct channel or, when
// the peer is in relay mode, over the signaling carrier.
//
// Direct channel: control records are text messages, chunks are binary
// messages carrying nonce || ciphertext. Relay: every record is a relay-data
// signal and chunk data is base64 text.
class TransferEngine {
public:
    struct Options {
        size_t chunk_size = 64 * 1024;
        size_t backlog_threshold = 1024 * 1024;
        std::chrono::milliseconds backlog_poll{10};
        std::chrono::milliseconds relay_chunk_delay{10};
    };

    using CompletionHandler = std::function<void(const boost::system::error_code&, const std::string& transfer_id)>;

    TransferEngine(boost::asio::io_context& io,
                   ConnectionManager& connections,
                   SecureChannel& secure,
                   Signaler& signaler,
                   Options opts,
                   Logger& logger);
    ~TransferEngine();

    TransferEngine(const TransferEngine&) = delete;
    TransferEngine& operator=(const TransferEngine&) = delete;

    // Returns the transfer id. done runs once, from the io_context. Files to
    // the same peer go out one at a time, in call order.
    std::string send_file(const PeerId& peer, std::shared_ptr<FileSource> file, CompletionHandler done);
    void send_text(const PeerId& peer, const std::string& text, CompletionHandler done);

    void on_channel_text(const PeerId& peer, const std::string& text);
    void on_channel_binary(const PeerId& peer, const std::vector<uint8_t>& data);
    void on_relay_data(const PeerId& peer, const ControlRecord& rec);

    // Aborts outbound transfers to peer and discards its inbound state.
    void drop_peer(const PeerId& peer);
    // drop_peer for every peer, including relay-only ones without a session.
    void drop_all();

    size_t outbound_count() const { return outbound_.size(); }
    bool receiving_from(const PeerId& peer) const { return inbound_.count(peer) > 0; }

    static uint64_t chunk_count(uint64_t size, size_t chunk_size);

    void set_file_offered_handler(FileOfferedHandler h) { on_file_offered_ = std::move(h); }
    void set_file_received_handler(FileReceivedHandler h) { on_file_received_ = std::move(h); }
    void set_progress_handler(ProgressHandler h) { on_progress_ = std::move(h); }
    void set_text_handler(TextReceivedHandler h) { on_text_ = std::move(h); }

private:
    using Transport = std::shared_ptr<DataChannel>;  // null means relay
    using TransportHandler = std::function<void(const boost::system::error_code&, Transport)>;

    struct Outbound {
        explicit Outbound(boost::asio::io_context& io) : timer(io) {}

        PeerId peer;
        std::string id;
        std::shared_ptr<FileSource> file;
        uint64_t size = 0;
        uint64_t offset = 0;
        uint64_t total_chunks = 0;
        uint64_t started_ms = 0;
        Transport channel;
        bool relay = false;
        bool finished = false;
        CompletionHandler done;
        boost::asio::steady_timer timer;
    };
    using OutboundPtr = std::shared_ptr<Outbound>;

    struct Inbound {
        std::string id;
        std::string name;
        uint64_t size = 0;
        uint64_t total_chunks = 0;
        std::vector<std::vector<uint8_t>> chunks;
        uint64_t received = 0;
        uint64_t started_ms = 0;
        bool corrupted = false;
        bool relay = false;
    };

    void resolve_transport(const PeerId& peer, TransportHandler handler);
    bool send_record(const PeerId& peer, const Transport& channel, const ControlRecord& rec);

    void start(const OutboundPtr& t);
    void begin(const OutboundPtr& t);
    void pump(const OutboundPtr& t);
    void schedule(const OutboundPtr& t, std::chrono::milliseconds delay);
    void finish(const OutboundPtr& t, const boost::system::error_code& ec);
    void report(const PeerId& peer, const std::string& id, const std::string& name,
                uint64_t total, uint64_t done, uint64_t started_ms, bool outbound);

    void on_record(const PeerId& peer, const ControlRecord& rec, bool via_relay);
    void on_chunk(const PeerId& peer, Inbound& in, const std::vector<uint8_t>& framed);
    void on_file_end(const PeerId& peer, const std::string& file_id);

    boost::asio::io_context& io_;
    ConnectionManager& connections_;
    SecureChannel& secure_;
    Signaler& signaler_;
    Options opts_;
    Logger& logger_;

    std::unordered_map<std::string, OutboundPtr> outbound_;
    std::unordered_map<PeerId, Inbound> inbound_;
    // Per-peer send queue; the front entry is the one on the wire.
    std::unordered_map<PeerId, std::deque<OutboundPtr>> lanes_;

    FileOfferedHandler on_file_offered_;
    FileReceivedHandler on_file_received_;
    ProgressHandler on_progress_;
    TextReceivedHandler on_text_;
};

} // namespace clouddrop
