#pragma once

#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <vector>

#include "util.hpp"

namespace clouddrop {

enum class ConnectionStatus {
    CONNECTING,
    SLOW,
    CONNECTED,
    RELAY
};

inline const char* to_string(ConnectionStatus s) {
    switch (s) {
        case ConnectionStatus::CONNECTING: return "connecting";
        case ConnectionStatus::SLOW: return "slow";
        case ConnectionStatus::CONNECTED: return "connected";
        case ConnectionStatus::RELAY: return "relay";
    }
    return "unknown";
}

struct FileOffer {
    std::string file_id;
    std::string name;
    uint64_t size = 0;
    uint64_t total_chunks = 0;
};

struct TransferProgress {
    PeerId peer;
    std::string file_id;
    std::string name;
    uint64_t total = 0;
    uint64_t sent = 0;      // bytes sent (outbound) or received (inbound)
    double percent = 0.0;
    double bytes_per_sec = 0.0;
    bool outbound = true;
};

// Caller-facing notifications. Each fires from the io_context thread.
using FileOfferedHandler = std::function<void(const PeerId&, const FileOffer&)>;
using FileReceivedHandler = std::function<void(const PeerId&, const std::string& name, const std::vector<uint8_t>& data)>;
using ProgressHandler = std::function<void(const TransferProgress&)>;
using TextReceivedHandler = std::function<void(const PeerId&, const std::string&)>;
using ConnectionStateHandler =
    std::function<void(const PeerId&, ConnectionStatus, const std::optional<std::string>& hint)>;

} // namespace clouddrop
