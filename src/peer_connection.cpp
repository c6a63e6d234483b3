#include "peer_connection.hpp"

namespace clouddrop {

const char* to_string(SignalingState s) {
    switch (s) {
        case SignalingState::STABLE: return "stable";
        case SignalingState::HAVE_LOCAL_OFFER: return "have-local-offer";
        case SignalingState::HAVE_REMOTE_OFFER: return "have-remote-offer";
        case SignalingState::CLOSED: return "closed";
    }
    return "unknown";
}

const char* to_string(IceState s) {
    switch (s) {
        case IceState::NEW: return "new";
        case IceState::CHECKING: return "checking";
        case IceState::CONNECTED: return "connected";
        case IceState::COMPLETED: return "completed";
        case IceState::DISCONNECTED: return "disconnected";
        case IceState::FAILED: return "failed";
        case IceState::CLOSED: return "closed";
    }
    return "unknown";
}

} // namespace clouddrop
