#pragma once

#include <boost/asio.hpp>

#include <chrono>
#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <vector>

#include "logger.hpp"

namespace clouddrop {

enum class ServerKind {
    RELAY,      // turn:/turns:, credentialed, never reordered
    REFLEXIVE   // stun: only, ranked by measured latency
};

// One parsed "stun:host[:port]" / "turn:host[:port][?transport=udp|tcp]" url.
struct ServerUrl {
    std::string scheme;     // stun | stuns | turn | turns
    std::string host;
    uint16_t port = 0;
    std::string transport;  // empty when not given
};

std::optional<ServerUrl> parse_server_url(const std::string& url);

// One directory entry (an "iceServers" element): one or more urls sharing credentials.
struct TraversalServer {
    std::vector<std::string> urls;
    std::string username;
    std::string credential;
    ServerKind kind = ServerKind::REFLEXIVE;
    std::optional<uint32_t> latency_ms;

    // First url of the entry whose scheme is stun; what the health probe targets.
    std::optional<ServerUrl> stun_url() const;
};

// Relay if any url is turn:/turns:, reflexive if any is stun:, nullopt otherwise.
std::optional<ServerKind> classify(const std::vector<std::string>& urls);

// "stun:host:port" or "turn:host:port|username|credential" (config file form).
std::optional<TraversalServer> parse_server_spec(const std::string& spec);

std::string describe(const TraversalServer& s);

// Source of candidate servers.
class ServerDirectory {
public:
    using FetchHandler = std::function<void(const boost::system::error_code&, std::vector<TraversalServer>)>;

    virtual ~ServerDirectory() = default;

    // The handler runs exactly once, from the io_context, no later than timeout.
    virtual void fetch(std::chrono::milliseconds timeout, FetchHandler handler) = 0;
};

struct ProbeResult {
    uint32_t latency_ms = 0;
    boost::asio::ip::udp::endpoint mapped;
};

// Reflexive-address probe (STUN binding request).
class ReflexiveProbe {
public:
    using ProbeHandler = std::function<void(const boost::system::error_code&, ProbeResult)>;

    virtual ~ReflexiveProbe() = default;

    // The handler runs exactly once; a timeout is reported as boost::asio::error::timed_out.
    virtual void probe(const ServerUrl& server, std::chrono::milliseconds timeout, ProbeHandler handler) = 0;
};

// Servers listed in configuration.
class StaticServerDirectory final : public ServerDirectory {
public:
    StaticServerDirectory(boost::asio::io_context& io, std::vector<TraversalServer> servers);

    void fetch(std::chrono::milliseconds timeout, FetchHandler handler) override;

private:
    boost::asio::io_context& io_;
    std::vector<TraversalServer> servers_;
};

// Fetches, health-checks and ranks traversal servers, caching the ranking for a TTL.
// At most one refresh runs at a time; callers arriving meanwhile share its result.
class TraversalServerSelector {
public:
    using ServersHandler = std::function<void(const std::vector<TraversalServer>&)>;

    struct Options {
        std::chrono::milliseconds ttl{5 * 60 * 1000};
        std::chrono::milliseconds probe_timeout{2000};
        std::chrono::milliseconds directory_timeout{3000};
    };

    TraversalServerSelector(boost::asio::io_context& io,
                            ServerDirectory& directory,
                            ReflexiveProbe& probe,
                            Options opts,
                            Logger& logger);

    // Handler is always invoked from the io_context, never inline.
    void get_servers(ServersHandler handler, bool force_refresh = false);
    void invalidate();

    bool has_cache() const { return have_cache_; }
    const std::vector<TraversalServer>& cached() const { return cached_; }

    // Relay entries first in input order, then reflexive entries that carry a
    // latency, ascending; reflexive entries without one are dropped.
    static std::vector<TraversalServer> rank(const std::vector<TraversalServer>& servers);

    static std::vector<TraversalServer> fallback_servers();

private:
    struct ProbeRound;

    void refresh();
    void on_fetched(uint64_t gen, const boost::system::error_code& ec, std::vector<TraversalServer> servers);
    void finish(uint64_t gen, std::vector<TraversalServer> servers, bool cache);

    boost::asio::io_context& io_;
    ServerDirectory& directory_;
    ReflexiveProbe& probe_;
    Options opts_;
    Logger& logger_;

    std::vector<TraversalServer> cached_;
    uint64_t cached_at_ms_ = 0;
    bool have_cache_ = false;

    bool refreshing_ = false;
    uint64_t gen_ = 0;
    std::vector<ServersHandler> waiters_;
};

} // namespace clouddrop
