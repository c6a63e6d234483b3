#include "config.hpp"

#include "util.hpp"

#include <fstream>
#include <sstream>

namespace clouddrop {
namespace {

bool parse_bool(const std::string& s, bool& out) {
    if (s == "1" || s == "true" || s == "yes" || s == "on") { out = true; return true; }
    if (s == "0" || s == "false" || s == "no" || s == "off") { out = false; return true; }
    return false;
}

uint32_t parse_u32(const std::string& s) {
    return static_cast<uint32_t>(std::stoul(s));
}

} // namespace

bool load_config(const std::string& path, Config& out, std::string& err) {
    std::ifstream in(path);
    if (!in.is_open()) {
        err = "failed to open config: " + path;
        return false;
    }

    std::string line;
    size_t lineno = 0;
    while (std::getline(in, line)) {
        ++lineno;
        line = trim(line);
        if (line.empty()) continue;
        if (line[0] == '#') continue;

        auto pos = line.find('=');
        if (pos == std::string::npos) {
            err = "bad config line " + std::to_string(lineno) + ": missing '='";
            return false;
        }
        std::string key = trim(line.substr(0, pos));
        std::string val = trim(line.substr(pos + 1));
        if (key.empty()) continue;

        try {
            if (key == "log_file") out.log_file = val;
            else if (key == "log_level") out.log_level = val;
            else if (key == "cli_enabled") {
                bool b = false;
                if (!parse_bool(val, b)) {
                    err = "bad config value at line " + std::to_string(lineno) + ": invalid bool";
                    return false;
                }
                out.cli_enabled = b;
            }

            else if (key == "signaling_url") out.signaling_url = val;
            else if (key == "room") out.room = val;

            else if (key == "bind_ip") out.bind_ip = val;
            else if (key == "ice_check_timeout_ms") out.ice_check_timeout_ms = parse_u32(val);

            else if (key == "connect_timeout_ms") out.connect_timeout_ms = parse_u32(val);
            else if (key == "slow_hint_ms") out.slow_hint_ms = parse_u32(val);
            else if (key == "disconnect_grace_ms") out.disconnect_grace_ms = parse_u32(val);
            else if (key == "restart_delay_ms") out.restart_delay_ms = parse_u32(val);
            else if (key == "max_restarts") out.max_restarts = parse_u32(val);

            else if (key == "chunk_size") {
                out.chunk_size = static_cast<size_t>(std::stoul(val));
                if (out.chunk_size == 0) {
                    err = "bad config value at line " + std::to_string(lineno) + ": chunk_size must be > 0";
                    return false;
                }
            }
            else if (key == "backlog_threshold") out.backlog_threshold = static_cast<size_t>(std::stoul(val));
            else if (key == "backlog_poll_ms") out.backlog_poll_ms = parse_u32(val);
            else if (key == "relay_chunk_delay_ms") out.relay_chunk_delay_ms = parse_u32(val);

            else if (key == "server_cache_ttl_ms") out.server_cache_ttl_ms = parse_u32(val);
            else if (key == "probe_timeout_ms") out.probe_timeout_ms = parse_u32(val);
            else if (key == "directory_timeout_ms") out.directory_timeout_ms = parse_u32(val);
            else if (key == "ice_servers_url") out.ice_servers_url = val;
            else if (key == "ice_server") out.ice_servers.push_back(val);
            else if (key == "ice_servers") {
                std::stringstream ss(val);
                std::string item;
                while (std::getline(ss, item, ',')) {
                    item = trim(item);
                    if (!item.empty()) out.ice_servers.push_back(item);
                }
            }
            else {
                err = "unknown config key at line " + std::to_string(lineno) + ": " + key;
                return false;
            }
        } catch (const std::exception& e) {
            err = "bad config value at line " + std::to_string(lineno) + ": " + e.what();
            return false;
        }
    }

    return true;
}

} // namespace clouddrop
