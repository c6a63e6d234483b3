#pragma once

#include <cstdint>
#include <string>
#include <vector>

namespace clouddrop {
namespace b64 {

// Standard alphabet with '=' padding (OpenSSL EVP block codec).
std::string encode(const std::vector<uint8_t>& data);
std::string encode(const uint8_t* data, size_t len);

// Throws std::invalid_argument on input that is not canonical padded base64.
std::vector<uint8_t> decode(const std::string& s);

} // namespace b64
} // namespace clouddrop
