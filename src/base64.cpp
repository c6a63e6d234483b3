#include "base64.hpp"

#include <openssl/evp.h>

#include <limits>
#include <stdexcept>

namespace clouddrop {
namespace b64 {

std::string encode(const uint8_t* data, size_t len) {
    if (len == 0) return {};
    if (len > static_cast<size_t>(std::numeric_limits<int>::max() / 4 * 3)) {
        throw std::invalid_argument("base64 input too large");
    }
    // 4*ceil(n/3) characters plus the NUL EVP_EncodeBlock appends
    std::string out(4 * ((len + 2) / 3) + 1, '\0');
    int n = EVP_EncodeBlock(reinterpret_cast<unsigned char*>(&out[0]), data, static_cast<int>(len));
    if (n < 0) throw std::runtime_error("EVP_EncodeBlock failed");
    out.resize(static_cast<size_t>(n));
    return out;
}

std::string encode(const std::vector<uint8_t>& data) {
    return encode(data.data(), data.size());
}

std::vector<uint8_t> decode(const std::string& s) {
    if (s.empty()) return {};
    if (s.size() % 4 != 0) throw std::invalid_argument("base64 length is not a multiple of 4");
    if (s.size() > static_cast<size_t>(std::numeric_limits<int>::max())) {
        throw std::invalid_argument("base64 input too large");
    }

    std::vector<uint8_t> out(3 * (s.size() / 4) + 1);
    int n = EVP_DecodeBlock(out.data(),
                            reinterpret_cast<const unsigned char*>(s.data()),
                            static_cast<int>(s.size()));
    if (n < 0) throw std::invalid_argument("invalid base64 input");

    // EVP_DecodeBlock counts '=' padding as zero bytes.
    size_t pad = 0;
    if (s.back() == '=') pad++;
    if (s[s.size() - 2] == '=') pad++;

    size_t real = static_cast<size_t>(n);
    if (real < pad) throw std::invalid_argument("invalid base64 padding");
    out.resize(real - pad);
    return out;
}

} // namespace b64
} // namespace clouddrop
