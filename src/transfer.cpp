#include "transfer.hpp"

#include "base64.hpp"
#include "crypto/Crypto.h"
#include "util.hpp"

#include <algorithm>

namespace clouddrop {

TransferEngine::TransferEngine(boost::asio::io_context& io,
                               ConnectionManager& connections,
                               SecureChannel& secure,
                               Signaler& signaler,
                               Options opts,
                               Logger& logger)
    : io_(io),
      connections_(connections),
      secure_(secure),
      signaler_(signaler),
      opts_(opts),
      logger_(logger) {
    if (opts_.chunk_size == 0) opts_.chunk_size = 64 * 1024;
}

TransferEngine::~TransferEngine() {
    for (auto& kv : outbound_) {
        kv.second->finished = true;
        kv.second->timer.cancel();
    }
}

uint64_t TransferEngine::chunk_count(uint64_t size, size_t chunk_size) {
    if (chunk_size == 0) return 0;
    return (size + chunk_size - 1) / chunk_size;
}

// ---------------- transport selection ----------------

void TransferEngine::resolve_transport(const PeerId& peer, TransportHandler handler) {
    if (connections_.relay_mode(peer)) {
        logger_.debug("xfer peer in relay mode, using relay peer=" + peer);
        boost::asio::post(io_, [handler = std::move(handler)]() {
            handler(boost::system::error_code{}, nullptr);
        });
        return;
    }

    connections_.ensure_ready(peer, [this, peer, handler = std::move(handler)](
                                        const boost::system::error_code& ec, std::shared_ptr<DataChannel> ch) {
        if (!ec) {
            handler(ec, std::move(ch));
            return;
        }
        if (ec == boost::asio::error::operation_aborted) {
            handler(ec, nullptr);
            return;
        }
        logger_.warn("xfer direct path unavailable peer=" + peer + " (" + ec.message() + "), falling back to relay");
        connections_.enter_relay_mode(peer, "direct connection failed, using relay");
        handler(boost::system::error_code{}, nullptr);
    });
}

bool TransferEngine::send_record(const PeerId& peer, const Transport& channel, const ControlRecord& rec) {
    if (channel) return channel->send_text(to_json(rec));
    return signaler_.send(peer, signal::RelayData{rec});
}

// ---------------- outbound ----------------

std::string TransferEngine::send_file(const PeerId& peer, std::shared_ptr<FileSource> file, CompletionHandler done) {
    auto t = std::make_shared<Outbound>(io_);
    t->peer = peer;
    t->id = crypto::RandomUuid();
    t->file = std::move(file);
    t->size = t->file->size();
    t->total_chunks = chunk_count(t->size, opts_.chunk_size);
    t->done = std::move(done);
    outbound_[t->id] = t;
    auto& lane = lanes_[peer];
    lane.push_back(t);

    logger_.info("xfer send_file queued id=" + t->id + " peer=" + peer + " name=" + t->file->name() +
                 " size=" + std::to_string(t->size) + " chunks=" + std::to_string(t->total_chunks) +
                 " ahead=" + std::to_string(lane.size() - 1));

    if (lane.size() == 1) start(t);
    return t->id;
}

void TransferEngine::start(const OutboundPtr& t) {
    if (t->finished) return;
    resolve_transport(t->peer, [this, t](const boost::system::error_code& ec, Transport channel) {
        if (t->finished) return;
        if (ec) {
            finish(t, ec);
            return;
        }
        t->channel = std::move(channel);
        t->relay = !t->channel;
        begin(t);
    });
}

void TransferEngine::begin(const OutboundPtr& t) {
    if (t->relay && !signaler_.is_open()) {
        finish(t, make_error_code(Errc::relay_unavailable));
        return;
    }
    if (!secure_.has_key(t->peer)) {
        finish(t, make_error_code(Errc::no_shared_key));
        return;
    }

    record::FileStart start{t->id, t->file->name(), t->size, t->total_chunks};
    if (!send_record(t->peer, t->channel, start)) {
        finish(t, make_error_code(t->relay ? Errc::relay_unavailable : Errc::transport_closed));
        return;
    }
    t->started_ms = now_ms();
    logger_.info("xfer file-start id=" + t->id + " via=" + (t->relay ? "relay" : "direct"));
    pump(t);
}

void TransferEngine::schedule(const OutboundPtr& t, std::chrono::milliseconds delay) {
    t->timer.expires_after(delay);
    t->timer.async_wait([this, t](const boost::system::error_code& ec) {
        if (ec == boost::asio::error::operation_aborted || t->finished) return;
        pump(t);
    });
}

void TransferEngine::pump(const OutboundPtr& t) {
    if (t->finished) return;

    if (t->offset >= t->size) {
        if (!send_record(t->peer, t->channel, record::FileEnd{t->id})) {
            finish(t, make_error_code(t->relay ? Errc::relay_unavailable : Errc::transport_closed));
            return;
        }
        if (t->size == 0) report(t->peer, t->id, t->file->name(), 0, 0, t->started_ms, true);
        logger_.info("xfer file-end id=" + t->id + " bytes=" + std::to_string(t->size));
        finish(t, boost::system::error_code{});
        return;
    }

    if (!t->relay) {
        if (t->channel->state() != ChannelState::OPEN) {
            logger_.warn("xfer direct channel lost mid-transfer id=" + t->id);
            connections_.enter_relay_mode(t->peer, "direct channel lost, using relay");
            finish(t, make_error_code(Errc::transport_closed));
            return;
        }
        if (t->channel->buffered_amount() > opts_.backlog_threshold) {
            schedule(t, opts_.backlog_poll);
            return;
        }
    }

    size_t want = static_cast<size_t>(std::min<uint64_t>(opts_.chunk_size, t->size - t->offset));
    std::vector<uint8_t> plain;
    try {
        plain = t->file->read(t->offset, want);
    } catch (const std::exception& e) {
        logger_.error("xfer read failed id=" + t->id + ": " + e.what());
        finish(t, make_error_code(boost::system::errc::io_error));
        return;
    }
    if (plain.empty()) {
        logger_.error("xfer source ended early id=" + t->id + " offset=" + std::to_string(t->offset));
        finish(t, make_error_code(boost::system::errc::io_error));
        return;
    }

    std::vector<uint8_t> framed;
    try {
        framed = secure_.encrypt_framed(t->peer, plain);
    } catch (const NoSharedKey& e) {
        logger_.warn(std::string("xfer ") + e.what());
        finish(t, e.code());
        return;
    }

    bool sent = false;
    if (t->relay) {
        sent = signaler_.send(t->peer, signal::RelayData{record::FileChunk{t->id, b64::encode(framed)}});
    } else {
        sent = t->channel->send_binary(framed);
    }
    if (!sent) {
        if (t->relay) {
            finish(t, make_error_code(Errc::relay_unavailable));
        } else {
            connections_.enter_relay_mode(t->peer, "direct channel lost, using relay");
            finish(t, make_error_code(Errc::transport_closed));
        }
        return;
    }

    t->offset += plain.size();
    report(t->peer, t->id, t->file->name(), t->size, t->offset, t->started_ms, true);

    if (t->relay) {
        schedule(t, opts_.relay_chunk_delay);
    } else {
        boost::asio::post(io_, [this, t]() { pump(t); });
    }
}

void TransferEngine::finish(const OutboundPtr& t, const boost::system::error_code& ec) {
    if (t->finished) return;
    t->finished = true;
    t->timer.cancel();
    outbound_.erase(t->id);

    auto lane = lanes_.find(t->peer);
    if (lane != lanes_.end()) {
        auto& q = lane->second;
        OutboundPtr self = t;
        bool was_active = !q.empty() && q.front() == self;
        q.erase(std::remove(q.begin(), q.end(), self), q.end());
        if (q.empty()) {
            lanes_.erase(lane);
        } else if (was_active) {
            OutboundPtr next = q.front();
            boost::asio::post(io_, [this, next]() { start(next); });
        }
    }

    if (ec) {
        logger_.warn("xfer send failed id=" + t->id + " peer=" + t->peer + ": " + ec.message());
    } else {
        logger_.info("xfer send complete id=" + t->id + " peer=" + t->peer);
    }
    auto done = std::move(t->done);
    if (done) done(ec, t->id);
}

void TransferEngine::send_text(const PeerId& peer, const std::string& text, CompletionHandler done) {
    resolve_transport(peer, [this, peer, text, done = std::move(done)](const boost::system::error_code& ec,
                                                                       Transport channel) {
        if (ec) {
            if (done) done(ec, std::string());
            return;
        }
        bool relay = !channel;
        if (relay && !signaler_.is_open()) {
            logger_.warn("xfer text to " + peer + " dropped: relay unavailable");
            if (done) done(make_error_code(Errc::relay_unavailable), std::string());
            return;
        }
        if (!send_record(peer, channel, record::Text{text})) {
            if (!relay) connections_.enter_relay_mode(peer, "direct channel lost, using relay");
            if (done) done(make_error_code(relay ? Errc::relay_unavailable : Errc::transport_closed), std::string());
            return;
        }
        logger_.info("xfer text sent peer=" + peer + " via=" + (relay ? "relay" : "direct") +
                     " len=" + std::to_string(text.size()));
        if (done) done(boost::system::error_code{}, std::string());
    });
}

void TransferEngine::report(const PeerId& peer, const std::string& id, const std::string& name,
                            uint64_t total, uint64_t done, uint64_t started_ms, bool outbound) {
    if (!on_progress_) return;
    TransferProgress p;
    p.peer = peer;
    p.file_id = id;
    p.name = name;
    p.total = total;
    p.sent = std::min(done, total);
    p.percent = total == 0 ? 100.0 : std::min(100.0, static_cast<double>(p.sent) * 100.0 / static_cast<double>(total));
    uint64_t elapsed = std::max<uint64_t>(1, now_ms() - started_ms);
    p.bytes_per_sec = static_cast<double>(p.sent) * 1000.0 / static_cast<double>(elapsed);
    p.outbound = outbound;
    on_progress_(p);
}

void TransferEngine::drop_peer(const PeerId& peer) {
    std::vector<OutboundPtr> victims;
    for (const auto& kv : outbound_) {
        if (kv.second->peer == peer) victims.push_back(kv.second);
    }
    for (const auto& t : victims) finish(t, boost::asio::error::operation_aborted);
    if (inbound_.erase(peer) > 0) logger_.info("xfer inbound transfer discarded peer=" + peer);
}

void TransferEngine::drop_all() {
    std::vector<PeerId> peers;
    for (const auto& kv : outbound_) peers.push_back(kv.second->peer);
    for (const auto& kv : inbound_) peers.push_back(kv.first);
    std::sort(peers.begin(), peers.end());
    peers.erase(std::unique(peers.begin(), peers.end()), peers.end());
    for (const auto& peer : peers) drop_peer(peer);
}

// ---------------- inbound ----------------

void TransferEngine::on_channel_text(const PeerId& peer, const std::string& text) {
    auto rec = control_from_json(text);
    if (!rec) {
        logger_.warn("xfer unrecognized channel message dropped peer=" + peer);
        return;
    }
    on_record(peer, *rec, false);
}

void TransferEngine::on_channel_binary(const PeerId& peer, const std::vector<uint8_t>& data) {
    auto it = inbound_.find(peer);
    if (it == inbound_.end()) {
        logger_.debug("xfer chunk without transfer dropped peer=" + peer);
        return;
    }
    on_chunk(peer, it->second, data);
}

void TransferEngine::on_relay_data(const PeerId& peer, const ControlRecord& rec) {
    if (!connections_.relay_mode(peer)) {
        logger_.info("xfer relay data from " + peer + ", switching to relay mode");
        connections_.enter_relay_mode(peer, "peer is using relay");
    }
    on_record(peer, rec, true);
}

void TransferEngine::on_record(const PeerId& peer, const ControlRecord& rec, bool via_relay) {
    if (auto* start = std::get_if<record::FileStart>(&rec)) {
        auto prev = inbound_.find(peer);
        if (prev != inbound_.end()) {
            logger_.warn("xfer unfinished transfer " + prev->second.id + " replaced peer=" + peer);
        }
        Inbound in;
        in.id = start->file_id;
        in.name = start->name;
        in.size = start->size;
        in.total_chunks = start->total_chunks;
        in.started_ms = now_ms();
        in.relay = via_relay;
        inbound_[peer] = std::move(in);
        logger_.info("xfer file offered id=" + start->file_id + " peer=" + peer + " name=" + start->name +
                     " size=" + std::to_string(start->size));
        if (on_file_offered_) {
            on_file_offered_(peer, FileOffer{start->file_id, start->name, start->size, start->total_chunks});
        }
        return;
    }

    if (auto* chunk = std::get_if<record::FileChunk>(&rec)) {
        auto it = inbound_.find(peer);
        if (it == inbound_.end() || it->second.id != chunk->file_id) {
            logger_.debug("xfer chunk for unknown transfer " + chunk->file_id + " dropped peer=" + peer);
            return;
        }
        std::vector<uint8_t> framed;
        try {
            framed = b64::decode(chunk->data);
        } catch (const std::invalid_argument& e) {
            logger_.warn("xfer undecodable chunk id=" + chunk->file_id + ": " + e.what());
            it->second.corrupted = true;
            return;
        }
        on_chunk(peer, it->second, framed);
        return;
    }

    if (auto* end = std::get_if<record::FileEnd>(&rec)) {
        on_file_end(peer, end->file_id);
        return;
    }

    if (auto* text = std::get_if<record::Text>(&rec)) {
        logger_.info("xfer text received peer=" + peer + " len=" + std::to_string(text->content.size()));
        if (on_text_) on_text_(peer, text->content);
    }
}

void TransferEngine::on_chunk(const PeerId& peer, Inbound& in, const std::vector<uint8_t>& framed) {
    if (in.corrupted) return;
    std::vector<uint8_t> plain;
    try {
        plain = secure_.decrypt_framed(peer, framed);
    } catch (const Error& e) {
        // Tampered, truncated or keyless: the transfer can no longer complete intact.
        logger_.warn("xfer chunk rejected id=" + in.id + ": " + e.what());
        in.corrupted = true;
        return;
    }
    if (in.received + plain.size() > in.size) {
        logger_.warn("xfer transfer " + in.id + " exceeds declared size, discarding");
        in.corrupted = true;
        return;
    }
    in.received += plain.size();
    in.chunks.push_back(std::move(plain));
    report(peer, in.id, in.name, in.size, in.received, in.started_ms, false);
}

void TransferEngine::on_file_end(const PeerId& peer, const std::string& file_id) {
    auto it = inbound_.find(peer);
    if (it == inbound_.end() || it->second.id != file_id) {
        logger_.debug("xfer file-end for unknown transfer " + file_id + " dropped peer=" + peer);
        return;
    }
    Inbound in = std::move(it->second);
    inbound_.erase(it);

    if (in.corrupted) {
        logger_.warn("xfer transfer " + in.id + " from " + peer + " failed authentication, discarded");
        return;
    }
    if (in.received != in.size) {
        logger_.warn("xfer transfer " + in.id + " from " + peer + " incomplete (" + std::to_string(in.received) +
                     "/" + std::to_string(in.size) + "), discarded");
        return;
    }

    std::vector<uint8_t> data;
    data.reserve(static_cast<size_t>(in.size));
    for (const auto& c : in.chunks) data.insert(data.end(), c.begin(), c.end());
    if (in.size == 0) report(peer, in.id, in.name, 0, 0, in.started_ms, false);

    logger_.info("xfer file received id=" + in.id + " peer=" + peer + " name=" + in.name +
                 " bytes=" + std::to_string(data.size()) + " chunks=" + std::to_string(in.chunks.size()));
    if (on_file_received_) on_file_received_(peer, in.name, data);
}

} // namespace clouddrop
