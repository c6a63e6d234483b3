#pragma once

#include <functional>
#include <string>

#include "logger.hpp"
#include "messages.hpp"

namespace clouddrop {

// Text message carrier to the signaling relay. Delivery between two peers is
// reliable and in order.
class SignalingTransport {
public:
    using MessageHandler = std::function<void(const std::string&)>;
    using StateHandler = std::function<void(bool open)>;

    virtual ~SignalingTransport() = default;

    // Returns false when the carrier is not open; the message is dropped.
    virtual bool send_text(const std::string& json) = 0;
    virtual bool is_open() const = 0;

    void set_message_handler(MessageHandler h) { on_message_ = std::move(h); }
    void set_state_handler(StateHandler h) { on_state_ = std::move(h); }

protected:
    MessageHandler on_message_;
    StateHandler on_state_;
};

// Typed view over a SignalingTransport.
class Signaler {
public:
    using SignalHandler = std::function<void(const InboundSignal&)>;

    Signaler(SignalingTransport& transport, Logger& logger);

    bool send(const PeerId& to, const SignalBody& body);
    bool is_open() const { return transport_.is_open(); }

    void set_signal_handler(SignalHandler h) { on_signal_ = std::move(h); }

private:
    void on_text(const std::string& json);

    SignalingTransport& transport_;
    Logger& logger_;
    SignalHandler on_signal_;
};

} // namespace clouddrop
