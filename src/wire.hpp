#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace clouddrop {
namespace wire {

using Bytes = std::vector<uint8_t>;

static constexpr uint8_t kVersion = 1;
static constexpr size_t kHeaderSize = 1 + 1 + 4;
static constexpr uint32_t kMaxFrame = 16 * 1024 * 1024;

// Envelope: version(u8) kind(u8) payload_len(u32) payload_bytes
enum class FrameKind : uint8_t {
    HELLO = 1,      // payload: ufrag of the session being checked
    HELLO_ACK = 2,  // payload: empty
    TEXT = 3,       // payload: UTF-8 control record
    BINARY = 4      // payload: framed ciphertext
};

struct Frame {
    FrameKind kind{};
    Bytes payload;
};

struct Header {
    FrameKind kind{};
    uint32_t length = 0;
};

void write_u16(Bytes& out, uint16_t v);
void write_u32(Bytes& out, uint32_t v);
uint16_t read_u16(const uint8_t* in, size_t len, size_t& off);
uint32_t read_u32(const uint8_t* in, size_t len, size_t& off);

Bytes encode(const Frame& f);
Bytes encode(FrameKind kind, const uint8_t* data, size_t len);

// Throws std::runtime_error on a bad version, unknown kind or oversized length.
Header decode_header(const uint8_t* in, size_t len);

Bytes str_bytes(const std::string& s);
std::string bytes_str(const Bytes& b);

} // namespace wire
} // namespace clouddrop
