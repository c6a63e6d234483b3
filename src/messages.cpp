#include "messages.hpp"

#include <memory>

namespace clouddrop {
namespace {

template <class... Ts>
struct overloaded : Ts... { using Ts::operator()...; };
template <class... Ts>
overloaded(Ts...) -> overloaded<Ts...>;

const Json::Value* member(const Json::Value& v, const char* key) {
    if (!v.isObject() || !v.isMember(key)) return nullptr;
    return &v[key];
}

std::optional<std::string> get_str(const Json::Value& v, const char* key) {
    auto m = member(v, key);
    if (!m || !m->isString()) return std::nullopt;
    return m->asString();
}

std::optional<uint64_t> get_u64(const Json::Value& v, const char* key) {
    auto m = member(v, key);
    if (!m || !m->isIntegral() || !m->isUInt64()) return std::nullopt;
    return static_cast<uint64_t>(m->asUInt64());
}

Json::Value description_value(const SessionDescription& d) {
    Json::Value out(Json::objectValue);
    out["type"] = d.type;
    out["sdp"] = d.sdp;
    return out;
}

std::optional<SessionDescription> description_from_value(const Json::Value& v) {
    auto type = get_str(v, "type");
    auto sdp = get_str(v, "sdp");
    if (!type || !sdp) return std::nullopt;
    if (*type != "offer" && *type != "answer") return std::nullopt;
    return SessionDescription{*type, *sdp};
}

Json::Value control_value(const ControlRecord& r) {
    Json::Value out(Json::objectValue);
    out["type"] = type_name(r);
    std::visit(overloaded{
        [&](const record::FileStart& m) {
            out["fileId"] = m.file_id;
            out["name"] = m.name;
            out["size"] = static_cast<Json::UInt64>(m.size);
            out["totalChunks"] = static_cast<Json::UInt64>(m.total_chunks);
        },
        [&](const record::FileChunk& m) {
            out["fileId"] = m.file_id;
            out["data"] = m.data;
        },
        [&](const record::FileEnd& m) {
            out["fileId"] = m.file_id;
        },
        [&](const record::Text& m) {
            out["content"] = m.content;
        },
    }, r);
    return out;
}

std::optional<ControlRecord> control_from_value(const Json::Value& v) {
    auto type = get_str(v, "type");
    if (!type) return std::nullopt;

    if (*type == "file-start") {
        auto id = get_str(v, "fileId");
        auto name = get_str(v, "name");
        auto size = get_u64(v, "size");
        auto chunks = get_u64(v, "totalChunks");
        if (!id || !name || !size) return std::nullopt;
        return ControlRecord{record::FileStart{*id, *name, *size, chunks ? *chunks : 0}};
    }
    if (*type == "chunk") {
        auto id = get_str(v, "fileId");
        auto data = get_str(v, "data");
        if (!id || !data) return std::nullopt;
        return ControlRecord{record::FileChunk{*id, *data}};
    }
    if (*type == "file-end") {
        auto id = get_str(v, "fileId");
        if (!id) return std::nullopt;
        return ControlRecord{record::FileEnd{*id}};
    }
    if (*type == "text") {
        auto content = get_str(v, "content");
        if (!content) return std::nullopt;
        return ControlRecord{record::Text{*content}};
    }
    return std::nullopt;
}

Json::Value signal_data(const SignalBody& body) {
    Json::Value out(Json::objectValue);
    std::visit(overloaded{
        [&](const signal::Offer& m) {
            out["sdp"] = description_value(m.sdp);
            if (!m.public_key.empty()) out["publicKey"] = m.public_key;
            if (m.ice_restart) out["iceRestart"] = true;
        },
        [&](const signal::Answer& m) {
            out["sdp"] = description_value(m.sdp);
            if (!m.public_key.empty()) out["publicKey"] = m.public_key;
        },
        [&](const signal::Candidate& m) {
            out["candidate"] = m.candidate.candidate;
            out["sdpMid"] = m.candidate.sdp_mid;
            out["sdpMLineIndex"] = m.candidate.sdp_mline_index;
        },
        [&](const signal::RelayData& m) {
            out = control_value(m.record);
        },
        [&](const signal::Welcome& m) {
            out["peerId"] = m.peer_id;
            Json::Value peers(Json::arrayValue);
            for (const auto& p : m.peers) peers.append(p);
            out["peers"] = peers;
        },
        [&](const signal::PeerJoined& m) {
            out["peerId"] = m.peer;
        },
        [&](const signal::PeerLeft& m) {
            out["peerId"] = m.peer;
        },
    }, body);
    return out;
}

std::optional<SignalBody> signal_from_value(const std::string& type, const Json::Value& data) {
    if (type == "offer" || type == "answer") {
        auto sdp_value = member(data, "sdp");
        if (!sdp_value) return std::nullopt;
        auto sdp = description_from_value(*sdp_value);
        if (!sdp || sdp->type != type) return std::nullopt;
        // A missing key is sent as null.
        std::string key = get_str(data, "publicKey").value_or("");
        if (type == "offer") {
            auto restart = member(data, "iceRestart");
            bool ice_restart = restart && restart->isBool() && restart->asBool();
            return SignalBody{signal::Offer{*sdp, key, ice_restart}};
        }
        return SignalBody{signal::Answer{*sdp, key}};
    }
    if (type == "ice-candidate") {
        auto cand = get_str(data, "candidate");
        if (!cand) return std::nullopt;
        IceCandidate c;
        c.candidate = *cand;
        c.sdp_mid = get_str(data, "sdpMid").value_or("");
        auto index = member(data, "sdpMLineIndex");
        if (index && index->isInt()) c.sdp_mline_index = index->asInt();
        return SignalBody{signal::Candidate{c}};
    }
    if (type == "relay-data") {
        auto rec = control_from_value(data);
        if (!rec) return std::nullopt;
        return SignalBody{signal::RelayData{std::move(*rec)}};
    }
    if (type == "welcome") {
        auto id = get_str(data, "peerId");
        if (!id) return std::nullopt;
        signal::Welcome w;
        w.peer_id = *id;
        auto peers = member(data, "peers");
        if (peers && peers->isArray()) {
            for (const auto& p : *peers) {
                if (p.isString() && !p.asString().empty()) w.peers.push_back(p.asString());
            }
        }
        return SignalBody{std::move(w)};
    }
    if (type == "peer-joined" || type == "peer-left") {
        auto id = get_str(data, "peerId");
        if (!id) return std::nullopt;
        if (type == "peer-joined") return SignalBody{signal::PeerJoined{*id}};
        return SignalBody{signal::PeerLeft{*id}};
    }
    return std::nullopt;
}

} // namespace

const char* type_name(const ControlRecord& r) {
    return std::visit(overloaded{
        [](const record::FileStart&) { return "file-start"; },
        [](const record::FileChunk&) { return "chunk"; },
        [](const record::FileEnd&) { return "file-end"; },
        [](const record::Text&) { return "text"; },
    }, r);
}

const char* type_name(const SignalBody& b) {
    return std::visit(overloaded{
        [](const signal::Offer&) { return "offer"; },
        [](const signal::Answer&) { return "answer"; },
        [](const signal::Candidate&) { return "ice-candidate"; },
        [](const signal::RelayData&) { return "relay-data"; },
        [](const signal::Welcome&) { return "welcome"; },
        [](const signal::PeerJoined&) { return "peer-joined"; },
        [](const signal::PeerLeft&) { return "peer-left"; },
    }, b);
}

std::string write_json(const Json::Value& v) {
    Json::StreamWriterBuilder builder;
    builder["indentation"] = "";
    builder["emitUTF8"] = true;
    return Json::writeString(builder, v);
}

bool parse_json(const std::string& s, Json::Value& out, std::string* err) {
    Json::CharReaderBuilder builder;
    builder["collectComments"] = false;
    std::unique_ptr<Json::CharReader> reader(builder.newCharReader());
    std::string errs;
    if (!reader->parse(s.data(), s.data() + s.size(), &out, &errs)) {
        if (err) *err = errs;
        return false;
    }
    return true;
}

std::string to_json(const ControlRecord& r) {
    return write_json(control_value(r));
}

std::string to_json(const PeerId& to, const SignalBody& body) {
    Json::Value out(Json::objectValue);
    out["type"] = type_name(body);
    out["to"] = to;
    out["data"] = signal_data(body);
    return write_json(out);
}

std::string join_json(const std::string& room) {
    Json::Value out(Json::objectValue);
    out["type"] = "join";
    out["data"]["room"] = room;
    return write_json(out);
}

std::optional<ControlRecord> control_from_json(const std::string& s) {
    Json::Value v;
    if (!parse_json(s, v)) return std::nullopt;
    return control_from_value(v);
}

std::optional<InboundSignal> signal_from_json(const std::string& s) {
    Json::Value v;
    if (!parse_json(s, v)) return std::nullopt;
    auto type = get_str(v, "type");
    if (!type) return std::nullopt;

    static const Json::Value empty(Json::objectValue);
    auto data = member(v, "data");
    auto body = signal_from_value(*type, data ? *data : empty);
    if (!body) return std::nullopt;

    InboundSignal out;
    out.from = get_str(v, "from").value_or("");
    out.body = std::move(*body);
    return out;
}

} // namespace clouddrop
