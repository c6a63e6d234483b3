#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace clouddrop {

struct Config {
    // Logging / console
    std::string log_file = "clouddrop.log";
    std::string log_level = "info";
    bool cli_enabled = true;

    // Signaling carrier
    std::string signaling_url = "ws://127.0.0.1:8787/ws";
    std::string room;

    // Direct transport
    std::string bind_ip = "0.0.0.0";
    uint32_t ice_check_timeout_ms = 10000;

    // Connection lifecycle
    uint32_t connect_timeout_ms = 15000;
    uint32_t slow_hint_ms = 5000;
    uint32_t disconnect_grace_ms = 5000;
    uint32_t restart_delay_ms = 2000;
    uint32_t max_restarts = 2;

    // Transfer
    size_t chunk_size = 64 * 1024;
    size_t backlog_threshold = 1024 * 1024;
    uint32_t backlog_poll_ms = 10;
    uint32_t relay_chunk_delay_ms = 10;

    // Traversal servers
    uint32_t server_cache_ttl_ms = 5 * 60 * 1000;
    uint32_t probe_timeout_ms = 2000;
    uint32_t directory_timeout_ms = 3000;
    std::string ice_servers_url;              // "http://host[:port]/path"; empty = use ice_servers
    std::vector<std::string> ice_servers;     // "stun:host:port" or "turn:host:port|user|credential"
};

bool load_config(const std::string& path, Config& out, std::string& err);

} // namespace clouddrop
