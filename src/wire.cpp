#include "wire.hpp"

#include <stdexcept>

namespace clouddrop {
namespace wire {

static void ensure(size_t len, size_t off, size_t need) {
    if (off + need > len) throw std::runtime_error("frame parse: truncated");
}

void write_u16(Bytes& out, uint16_t v) {
    out.push_back(static_cast<uint8_t>((v >> 8) & 0xFF));
    out.push_back(static_cast<uint8_t>(v & 0xFF));
}

void write_u32(Bytes& out, uint32_t v) {
    out.push_back(static_cast<uint8_t>((v >> 24) & 0xFF));
    out.push_back(static_cast<uint8_t>((v >> 16) & 0xFF));
    out.push_back(static_cast<uint8_t>((v >> 8) & 0xFF));
    out.push_back(static_cast<uint8_t>(v & 0xFF));
}

uint16_t read_u16(const uint8_t* in, size_t len, size_t& off) {
    ensure(len, off, 2);
    uint16_t v = static_cast<uint16_t>((static_cast<uint16_t>(in[off]) << 8) | in[off+1]);
    off += 2;
    return v;
}

uint32_t read_u32(const uint8_t* in, size_t len, size_t& off) {
    ensure(len, off, 4);
    uint32_t v = (static_cast<uint32_t>(in[off]) << 24) |
                 (static_cast<uint32_t>(in[off+1]) << 16) |
                 (static_cast<uint32_t>(in[off+2]) << 8) |
                 (static_cast<uint32_t>(in[off+3]));
    off += 4;
    return v;
}

Bytes encode(FrameKind kind, const uint8_t* data, size_t len) {
    if (len > kMaxFrame) throw std::runtime_error("frame payload too large");
    Bytes out;
    out.reserve(kHeaderSize + len);
    out.push_back(kVersion);
    out.push_back(static_cast<uint8_t>(kind));
    write_u32(out, static_cast<uint32_t>(len));
    if (len > 0) out.insert(out.end(), data, data + len);
    return out;
}

Bytes encode(const Frame& f) {
    return encode(f.kind, f.payload.data(), f.payload.size());
}

Header decode_header(const uint8_t* in, size_t len) {
    ensure(len, 0, kHeaderSize);
    size_t off = 0;
    uint8_t ver = in[off++];
    if (ver != kVersion) throw std::runtime_error("frame version mismatch");
    uint8_t kind = in[off++];
    if (kind < static_cast<uint8_t>(FrameKind::HELLO) || kind > static_cast<uint8_t>(FrameKind::BINARY)) {
        throw std::runtime_error("unknown frame kind " + std::to_string(kind));
    }
    uint32_t plen = read_u32(in, len, off);
    if (plen > kMaxFrame) throw std::runtime_error("frame too large");
    return Header{static_cast<FrameKind>(kind), plen};
}

Bytes str_bytes(const std::string& s) {
    return Bytes(s.begin(), s.end());
}

std::string bytes_str(const Bytes& b) {
    return std::string(b.begin(), b.end());
}

} // namespace wire
} // namespace clouddrop
