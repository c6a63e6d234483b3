#include "signaling.hpp"

namespace clouddrop {

Signaler::Signaler(SignalingTransport& transport, Logger& logger)
    : transport_(transport), logger_(logger) {
    transport_.set_message_handler([this](const std::string& json) { on_text(json); });
}

bool Signaler::send(const PeerId& to, const SignalBody& body) {
    if (!transport_.is_open()) {
        logger_.warn(std::string("signal drop ") + type_name(body) + " to=" + to + ": carrier not open");
        return false;
    }
    if (!transport_.send_text(to_json(to, body))) {
        logger_.warn(std::string("signal send failed ") + type_name(body) + " to=" + to);
        return false;
    }
    logger_.debug(std::string("signal tx ") + type_name(body) + " to=" + to);
    return true;
}

void Signaler::on_text(const std::string& json) {
    auto msg = signal_from_json(json);
    if (!msg) {
        logger_.warn("signal rx dropped unrecognized message len=" + std::to_string(json.size()));
        return;
    }
    logger_.debug(std::string("signal rx ") + type_name(msg->body) + " from=" + msg->from);
    if (on_signal_) on_signal_(*msg);
}

} // namespace clouddrop
