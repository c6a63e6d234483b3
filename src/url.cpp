#include "url.hpp"

#include <algorithm>
#include <cctype>

namespace clouddrop {

std::optional<Url> parse_url(const std::string& url) {
    auto sep = url.find("://");
    if (sep == std::string::npos) return std::nullopt;

    Url out;
    out.scheme = url.substr(0, sep);
    std::transform(out.scheme.begin(), out.scheme.end(), out.scheme.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (out.scheme != "ws" && out.scheme != "http") return std::nullopt;

    std::string rest = url.substr(sep + 3);
    auto slash = rest.find('/');
    std::string authority = rest.substr(0, slash);
    if (slash != std::string::npos) out.target = rest.substr(slash);

    std::string port;
    if (!authority.empty() && authority[0] == '[') {
        auto close = authority.find(']');
        if (close == std::string::npos) return std::nullopt;
        out.host = authority.substr(1, close - 1);
        if (close + 1 < authority.size()) {
            if (authority[close + 1] != ':') return std::nullopt;
            port = authority.substr(close + 2);
        }
    } else {
        auto colon = authority.rfind(':');
        out.host = authority.substr(0, colon);
        if (colon != std::string::npos) port = authority.substr(colon + 1);
    }
    if (out.host.empty()) return std::nullopt;

    out.port = 80;
    if (!port.empty()) {
        if (!std::all_of(port.begin(), port.end(), [](unsigned char c) { return std::isdigit(c); }) ||
            port.size() > 5) {
            return std::nullopt;
        }
        unsigned long p = std::stoul(port);
        if (p == 0 || p > 65535) return std::nullopt;
        out.port = static_cast<uint16_t>(p);
    }
    return out;
}

} // namespace clouddrop
