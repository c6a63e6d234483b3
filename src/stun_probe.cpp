#include "stun_probe.hpp"

#include "crypto/Crypto.h"
#include "util.hpp"
#include "wire.hpp"

#include <algorithm>
#include <memory>

namespace clouddrop {
namespace stun {

std::vector<uint8_t> build_binding_request(const TransactionId& txid) {
    std::vector<uint8_t> out;
    out.reserve(kHeaderSize);
    wire::write_u16(out, kBindingRequest);
    wire::write_u16(out, 0);
    wire::write_u32(out, kMagicCookie);
    out.insert(out.end(), txid.begin(), txid.end());
    return out;
}

namespace {

std::optional<boost::asio::ip::udp::endpoint> read_address(const uint8_t* v, size_t len, bool xored,
                                                           const TransactionId& txid) {
    if (len < 4) return std::nullopt;
    uint8_t family = v[1];
    size_t off = 2;
    uint16_t port = wire::read_u16(v, len, off);
    if (xored) port = static_cast<uint16_t>(port ^ (kMagicCookie >> 16));

    if (family == 0x01) {
        if (len < 8) return std::nullopt;
        uint32_t a = wire::read_u32(v, len, off);
        if (xored) a ^= kMagicCookie;
        return boost::asio::ip::udp::endpoint(boost::asio::ip::address_v4(a), port);
    }
    if (family == 0x02) {
        if (len < 20) return std::nullopt;
        boost::asio::ip::address_v6::bytes_type b{};
        std::array<uint8_t, 16> mask{};
        mask[0] = static_cast<uint8_t>(kMagicCookie >> 24);
        mask[1] = static_cast<uint8_t>(kMagicCookie >> 16);
        mask[2] = static_cast<uint8_t>(kMagicCookie >> 8);
        mask[3] = static_cast<uint8_t>(kMagicCookie);
        std::copy(txid.begin(), txid.end(), mask.begin() + 4);
        for (size_t i = 0; i < 16; ++i) {
            b[i] = xored ? static_cast<uint8_t>(v[4 + i] ^ mask[i]) : v[4 + i];
        }
        return boost::asio::ip::udp::endpoint(boost::asio::ip::address_v6(b), port);
    }
    return std::nullopt;
}

} // namespace

std::optional<boost::asio::ip::udp::endpoint> parse_binding_response(const uint8_t* data,
                                                                     size_t len,
                                                                     const TransactionId& txid) {
    if (len < kHeaderSize) return std::nullopt;
    size_t off = 0;
    uint16_t type = wire::read_u16(data, len, off);
    uint16_t body_len = wire::read_u16(data, len, off);
    uint32_t cookie = wire::read_u32(data, len, off);
    if (type != kBindingResponse || cookie != kMagicCookie) return std::nullopt;
    if (!std::equal(txid.begin(), txid.end(), data + 8)) return std::nullopt;
    if (kHeaderSize + body_len > len) return std::nullopt;

    std::optional<boost::asio::ip::udp::endpoint> mapped;
    std::optional<boost::asio::ip::udp::endpoint> xor_mapped;
    off = kHeaderSize;
    const size_t end = kHeaderSize + body_len;
    while (off + 4 <= end) {
        uint16_t attr = wire::read_u16(data, end, off);
        uint16_t alen = wire::read_u16(data, end, off);
        if (off + alen > end) break;
        if (attr == kAttrXorMappedAddress) xor_mapped = read_address(data + off, alen, true, txid);
        else if (attr == kAttrMappedAddress) mapped = read_address(data + off, alen, false, txid);
        off += (alen + 3u) & ~3u;
    }
    return xor_mapped ? xor_mapped : mapped;
}

} // namespace stun

namespace {

using udp = boost::asio::ip::udp;

class ProbeOp : public std::enable_shared_from_this<ProbeOp> {
public:
    ProbeOp(boost::asio::io_context& io, Logger& logger, ReflexiveProbe::ProbeHandler handler)
        : resolver_(io), sock_(io), timer_(io), logger_(logger), handler_(std::move(handler)) {}

    void start(const ServerUrl& server, std::chrono::milliseconds timeout) {
        crypto::RandomBytes(txid_.data(), txid_.size());
        started_ms_ = now_ms();

        auto self = shared_from_this();
        timer_.expires_after(timeout);
        timer_.async_wait([self](const boost::system::error_code& ec) {
            if (ec == boost::asio::error::operation_aborted) return;
            self->complete(boost::asio::error::timed_out, {});
        });

        resolver_.async_resolve(udp::v4(), server.host, std::to_string(server.port),
                                [self](const boost::system::error_code& ec, udp::resolver::results_type results) {
            if (ec) {
                self->complete(ec, {});
                return;
            }
            if (results.empty()) {
                self->complete(boost::asio::error::host_not_found, {});
                return;
            }
            self->send(results.begin()->endpoint());
        });
    }

private:
    void send(const udp::endpoint& to) {
        if (done_) return;
        boost::system::error_code ec;
        sock_.open(udp::v4(), ec);
        if (ec) {
            complete(ec, {});
            return;
        }
        request_ = stun::build_binding_request(txid_);
        auto self = shared_from_this();
        sock_.async_send_to(boost::asio::buffer(request_), to,
                            [self](const boost::system::error_code& sec, std::size_t) {
            if (sec) {
                self->complete(sec, {});
                return;
            }
            self->receive();
        });
    }

    void receive() {
        if (done_) return;
        auto self = shared_from_this();
        sock_.async_receive_from(boost::asio::buffer(rxbuf_), from_,
                                 [self](const boost::system::error_code& ec, std::size_t n) {
            if (ec) {
                self->complete(ec, {});
                return;
            }
            auto mapped = stun::parse_binding_response(self->rxbuf_.data(), n, self->txid_);
            if (!mapped) {
                self->logger_.debug("stun ignoring unrelated datagram from " + self->from_.address().to_string());
                self->receive();
                return;
            }
            ProbeResult res;
            res.latency_ms = static_cast<uint32_t>(now_ms() - self->started_ms_);
            res.mapped = *mapped;
            self->complete({}, res);
        });
    }

    void complete(const boost::system::error_code& ec, ProbeResult res) {
        if (done_) return;
        done_ = true;
        timer_.cancel();
        resolver_.cancel();
        boost::system::error_code ignored;
        sock_.close(ignored);
        auto handler = std::move(handler_);
        if (handler) handler(ec, res);
    }

    udp::resolver resolver_;
    udp::socket sock_;
    boost::asio::steady_timer timer_;
    Logger& logger_;
    ReflexiveProbe::ProbeHandler handler_;

    stun::TransactionId txid_{};
    std::vector<uint8_t> request_;
    std::array<uint8_t, 1024> rxbuf_{};
    udp::endpoint from_;
    uint64_t started_ms_ = 0;
    bool done_ = false;
};

} // namespace

StunProbe::StunProbe(boost::asio::io_context& io, Logger& logger) : io_(io), logger_(logger) {}

void StunProbe::probe(const ServerUrl& server, std::chrono::milliseconds timeout, ProbeHandler handler) {
    logger_.debug("stun probe " + server.host + ":" + std::to_string(server.port));
    auto op = std::make_shared<ProbeOp>(io_, logger_, std::move(handler));
    op->start(server, timeout);
}

} // namespace clouddrop
