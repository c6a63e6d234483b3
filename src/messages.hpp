#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <variant>
#include <vector>

#include <json/json.h>

#include "peer_connection.hpp"
#include "util.hpp"

namespace clouddrop {

// Records exchanged between the two transfer engines. On the direct channel
// they travel as text messages (chunks travel as binary messages instead);
// on the relay they are the payload of a "relay-data" signal.
namespace record {

struct FileStart {
    std::string file_id;
    std::string name;
    uint64_t size = 0;
    uint64_t total_chunks = 0;
};

// Relay only: data is base64 of nonce || ciphertext.
struct FileChunk {
    std::string file_id;
    std::string data;
};

struct FileEnd {
    std::string file_id;
};

struct Text {
    std::string content;
};

} // namespace record

using ControlRecord = std::variant<record::FileStart, record::FileChunk, record::FileEnd, record::Text>;

// Messages carried by the signaling relay.
namespace signal {

struct Offer {
    SessionDescription sdp;
    std::string public_key;  // base64 SubjectPublicKeyInfo, may be empty
    bool ice_restart = false;
};

struct Answer {
    SessionDescription sdp;
    std::string public_key;
};

struct Candidate {
    IceCandidate candidate;
};

struct RelayData {
    ControlRecord record;
};

// Room membership notifications, produced by the relay service itself.
struct Welcome {
    PeerId peer_id;
    std::vector<PeerId> peers;
};

struct PeerJoined {
    PeerId peer;
};

struct PeerLeft {
    PeerId peer;
};

} // namespace signal

using SignalBody = std::variant<signal::Offer, signal::Answer, signal::Candidate, signal::RelayData,
                                signal::Welcome, signal::PeerJoined, signal::PeerLeft>;

struct InboundSignal {
    PeerId from;  // empty for messages originated by the relay service
    SignalBody body;
};

const char* type_name(const ControlRecord& r);
const char* type_name(const SignalBody& b);

// Single line, no indentation.
std::string write_json(const Json::Value& v);
// False (with err filled when given) unless s is one well-formed JSON document.
bool parse_json(const std::string& s, Json::Value& out, std::string* err = nullptr);

std::string to_json(const ControlRecord& r);
// {"type":..., "to":peer, "data":{...}}
std::string to_json(const PeerId& to, const SignalBody& body);
// Join request sent once the carrier opens.
std::string join_json(const std::string& room);

// Both return nullopt for malformed JSON, a missing field or an unknown type.
std::optional<ControlRecord> control_from_json(const std::string& s);
std::optional<InboundSignal> signal_from_json(const std::string& s);

} // namespace clouddrop
