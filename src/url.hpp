#pragma once

#include <cstdint>
#include <optional>
#include <string>

namespace clouddrop {

// "scheme://host[:port][/target]" for the ws and http carriers.
struct Url {
    std::string scheme;
    std::string host;
    uint16_t port = 0;
    std::string target = "/";
};

// Accepts ws and http only; the port defaults to 80.
std::optional<Url> parse_url(const std::string& url);

} // namespace clouddrop
