#pragma once

#include <boost/system/error_code.hpp>

#include <cstdint>
#include <functional>
#include <memory>
#include <string>
#include <vector>

#include "traversal.hpp"

namespace clouddrop {

enum class SignalingState {
    STABLE,
    HAVE_LOCAL_OFFER,
    HAVE_REMOTE_OFFER,
    CLOSED
};

enum class IceState {
    NEW,
    CHECKING,
    CONNECTED,
    COMPLETED,
    DISCONNECTED,
    FAILED,
    CLOSED
};

enum class ChannelState {
    CONNECTING,
    OPEN,
    CLOSING,
    CLOSED
};

const char* to_string(SignalingState s);
const char* to_string(IceState s);

struct SessionDescription {
    std::string type;  // "offer" | "answer"
    std::string sdp;
};

struct IceCandidate {
    std::string candidate;
    std::string sdp_mid;
    int sdp_mline_index = 0;
};

// Ordered, reliable message channel negotiated by a PeerConnection.
class DataChannel {
public:
    using Bytes = std::vector<uint8_t>;
    using EventHandler = std::function<void()>;
    using TextHandler = std::function<void(const std::string&)>;
    using BinaryHandler = std::function<void(const Bytes&)>;

    virtual ~DataChannel() = default;

    virtual const std::string& label() const = 0;
    virtual ChannelState state() const = 0;

    // Both return false when the channel is not open; nothing is queued then.
    virtual bool send_text(const std::string& text) = 0;
    virtual bool send_binary(const Bytes& data) = 0;

    // Bytes accepted by send_* but not yet handed to the network.
    virtual size_t buffered_amount() const = 0;

    virtual void close() = 0;

    void set_open_handler(EventHandler h) { on_open_ = std::move(h); }
    void set_close_handler(EventHandler h) { on_close_ = std::move(h); }
    void set_text_handler(TextHandler h) { on_text_ = std::move(h); }
    void set_binary_handler(BinaryHandler h) { on_binary_ = std::move(h); }

protected:
    EventHandler on_open_;
    EventHandler on_close_;
    TextHandler on_text_;
    BinaryHandler on_binary_;
};

// One negotiated direct connection to a peer.
// Every asynchronous completion handler runs later from the io_context, never inline.
class PeerConnection {
public:
    using Handler = std::function<void(const boost::system::error_code&)>;
    using DescriptionHandler = std::function<void(const boost::system::error_code&, SessionDescription)>;
    using CandidateHandler = std::function<void(const IceCandidate&)>;
    using IceStateHandler = std::function<void(IceState)>;
    using ChannelHandler = std::function<void(std::shared_ptr<DataChannel>)>;

    virtual ~PeerConnection() = default;

    virtual SignalingState signaling_state() const = 0;
    virtual IceState ice_state() const = 0;
    virtual bool has_remote_description() const = 0;

    virtual void create_offer(bool ice_restart, DescriptionHandler handler) = 0;
    virtual void create_answer(DescriptionHandler handler) = 0;
    virtual void set_local_description(const SessionDescription& desc, Handler handler) = 0;
    // Discards a local offer (have-local-offer -> stable). No-op when already stable.
    virtual void rollback(Handler handler) = 0;
    virtual void set_remote_description(const SessionDescription& desc, Handler handler) = 0;
    virtual void add_ice_candidate(const IceCandidate& cand, Handler handler) = 0;

    virtual std::shared_ptr<DataChannel> create_data_channel(const std::string& label) = 0;

    virtual void close() = 0;

    void set_candidate_handler(CandidateHandler h) { on_candidate_ = std::move(h); }
    void set_ice_state_handler(IceStateHandler h) { on_ice_state_ = std::move(h); }
    void set_data_channel_handler(ChannelHandler h) { on_data_channel_ = std::move(h); }

protected:
    CandidateHandler on_candidate_;
    IceStateHandler on_ice_state_;
    ChannelHandler on_data_channel_;
};

class PeerConnectionFactory {
public:
    virtual ~PeerConnectionFactory() = default;

    virtual std::shared_ptr<PeerConnection> create(const std::vector<TraversalServer>& servers) = 0;
};

} // namespace clouddrop
