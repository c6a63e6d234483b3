#pragma once

#include <boost/asio.hpp>

#include <array>
#include <cstdint>
#include <optional>
#include <vector>

#include "logger.hpp"
#include "traversal.hpp"

namespace clouddrop {
namespace stun {

static constexpr uint16_t kBindingRequest = 0x0001;
static constexpr uint16_t kBindingResponse = 0x0101;
static constexpr uint16_t kAttrMappedAddress = 0x0001;
static constexpr uint16_t kAttrXorMappedAddress = 0x0020;
static constexpr uint32_t kMagicCookie = 0x2112A442;
static constexpr size_t kHeaderSize = 20;

using TransactionId = std::array<uint8_t, 12>;

std::vector<uint8_t> build_binding_request(const TransactionId& txid);

// Returns the reflexive address of a success response matching txid.
// XOR-MAPPED-ADDRESS wins over MAPPED-ADDRESS when both are present.
std::optional<boost::asio::ip::udp::endpoint> parse_binding_response(const uint8_t* data,
                                                                     size_t len,
                                                                     const TransactionId& txid);

} // namespace stun

// RFC 5389 binding request over UDP; latency is measured from send to response.
class StunProbe final : public ReflexiveProbe {
public:
    StunProbe(boost::asio::io_context& io, Logger& logger);

    void probe(const ServerUrl& server, std::chrono::milliseconds timeout, ProbeHandler handler) override;

private:
    boost::asio::io_context& io_;
    Logger& logger_;
};

} // namespace clouddrop
