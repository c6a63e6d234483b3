#include "traversal.hpp"

#include "util.hpp"

#include <algorithm>
#include <memory>
#include <sstream>

namespace clouddrop {

std::optional<ServerUrl> parse_server_url(const std::string& url) {
    auto colon = url.find(':');
    if (colon == std::string::npos || colon == 0) return std::nullopt;

    ServerUrl out;
    out.scheme = url.substr(0, colon);
    uint16_t default_port = 0;
    if (out.scheme == "stun" || out.scheme == "turn") default_port = 3478;
    else if (out.scheme == "stuns" || out.scheme == "turns") default_port = 5349;
    else return std::nullopt;

    std::string rest = url.substr(colon + 1);
    auto q = rest.find('?');
    if (q != std::string::npos) {
        std::string query = rest.substr(q + 1);
        rest = rest.substr(0, q);
        const std::string key = "transport=";
        auto k = query.find(key);
        if (k != std::string::npos) {
            out.transport = query.substr(k + key.size());
            auto amp = out.transport.find('&');
            if (amp != std::string::npos) out.transport.resize(amp);
        }
    }
    if (starts_with(rest, "//")) rest = rest.substr(2);
    if (rest.empty()) return std::nullopt;

    if (rest[0] == '[') {
        auto close = rest.find(']');
        if (close == std::string::npos) return std::nullopt;
        out.host = rest.substr(1, close - 1);
        rest = rest.substr(close + 1);
        if (!rest.empty() && rest[0] != ':') return std::nullopt;
        if (!rest.empty()) rest = rest.substr(1);
    } else {
        auto pc = rest.rfind(':');
        if (pc == std::string::npos) {
            out.host = rest;
            rest.clear();
        } else {
            out.host = rest.substr(0, pc);
            rest = rest.substr(pc + 1);
        }
    }
    if (out.host.empty()) return std::nullopt;

    if (rest.empty()) {
        out.port = default_port;
    } else {
        if (rest.find_first_not_of("0123456789") != std::string::npos || rest.size() > 5) return std::nullopt;
        unsigned long p = std::stoul(rest);
        if (p == 0 || p > 65535) return std::nullopt;
        out.port = static_cast<uint16_t>(p);
    }
    return out;
}

std::optional<ServerUrl> TraversalServer::stun_url() const {
    for (const auto& u : urls) {
        auto parsed = parse_server_url(u);
        if (parsed && parsed->scheme == "stun") return parsed;
    }
    return std::nullopt;
}

std::optional<ServerKind> classify(const std::vector<std::string>& urls) {
    bool stun = false;
    for (const auto& u : urls) {
        if (starts_with(u, "turn:") || starts_with(u, "turns:")) return ServerKind::RELAY;
        if (starts_with(u, "stun:")) stun = true;
    }
    if (stun) return ServerKind::REFLEXIVE;
    return std::nullopt;
}

std::optional<TraversalServer> parse_server_spec(const std::string& spec) {
    std::vector<std::string> parts;
    std::stringstream ss(spec);
    std::string item;
    while (std::getline(ss, item, '|')) parts.push_back(trim(item));
    if (parts.empty() || parts.size() > 3) return std::nullopt;
    if (!parse_server_url(parts[0])) return std::nullopt;

    TraversalServer s;
    s.urls.push_back(parts[0]);
    if (parts.size() > 1) s.username = parts[1];
    if (parts.size() > 2) s.credential = parts[2];
    auto kind = classify(s.urls);
    if (!kind) return std::nullopt;
    s.kind = *kind;
    return s;
}

std::string describe(const TraversalServer& s) {
    std::ostringstream oss;
    for (size_t i = 0; i < s.urls.size(); ++i) {
        if (i > 0) oss << ",";
        oss << s.urls[i];
    }
    oss << (s.kind == ServerKind::RELAY ? " relay" : " reflexive");
    if (s.latency_ms) oss << " rtt=" << *s.latency_ms << "ms";
    if (!s.credential.empty()) oss << " (credentials)";
    return oss.str();
}

// ---------------- StaticServerDirectory ----------------

StaticServerDirectory::StaticServerDirectory(boost::asio::io_context& io, std::vector<TraversalServer> servers)
    : io_(io), servers_(std::move(servers)) {}

void StaticServerDirectory::fetch(std::chrono::milliseconds, FetchHandler handler) {
    auto servers = servers_;
    boost::asio::post(io_, [handler = std::move(handler), servers = std::move(servers)]() mutable {
        handler(boost::system::error_code{}, std::move(servers));
    });
}

// ---------------- TraversalServerSelector ----------------

struct TraversalServerSelector::ProbeRound {
    std::vector<TraversalServer> servers;
    size_t outstanding = 0;
};

TraversalServerSelector::TraversalServerSelector(boost::asio::io_context& io,
                                                 ServerDirectory& directory,
                                                 ReflexiveProbe& probe,
                                                 Options opts,
                                                 Logger& logger)
    : io_(io), directory_(directory), probe_(probe), opts_(opts), logger_(logger) {}

void TraversalServerSelector::get_servers(ServersHandler handler, bool force_refresh) {
    if (!force_refresh && have_cache_) {
        uint64_t age = now_ms() - cached_at_ms_;
        if (age < static_cast<uint64_t>(opts_.ttl.count())) {
            auto servers = cached_;
            boost::asio::post(io_, [handler = std::move(handler), servers = std::move(servers)]() {
                handler(servers);
            });
            return;
        }
    }

    waiters_.push_back(std::move(handler));
    if (refreshing_) {
        logger_.debug("servers refresh already in flight, waiting");
        return;
    }
    refresh();
}

void TraversalServerSelector::invalidate() {
    have_cache_ = false;
    cached_.clear();
    cached_at_ms_ = 0;
    ++gen_;
    logger_.info("servers cache invalidated");
}

void TraversalServerSelector::refresh() {
    refreshing_ = true;
    uint64_t gen = gen_;
    logger_.info("servers refresh start");
    directory_.fetch(opts_.directory_timeout,
                     [this, gen](const boost::system::error_code& ec, std::vector<TraversalServer> servers) {
        on_fetched(gen, ec, std::move(servers));
    });
}

void TraversalServerSelector::on_fetched(uint64_t gen,
                                         const boost::system::error_code& ec,
                                         std::vector<TraversalServer> servers) {
    if (ec) {
        logger_.warn("servers directory unreachable: " + ec.message() + ", using fallback");
        finish(gen, fallback_servers(), false);
        return;
    }
    logger_.info("servers fetched count=" + std::to_string(servers.size()));

    auto round = std::make_shared<ProbeRound>();
    std::vector<std::pair<size_t, ServerUrl>> to_probe;
    for (auto& s : servers) {
        auto kind = classify(s.urls);
        if (!kind) {
            logger_.debug("servers drop entry without stun/turn url: " + describe(s));
            continue;
        }
        s.kind = *kind;
        s.latency_ms.reset();
        if (s.kind == ServerKind::REFLEXIVE) {
            auto url = s.stun_url();
            if (!url) {
                logger_.debug("servers drop unparsable entry: " + describe(s));
                continue;
            }
            to_probe.emplace_back(round->servers.size(), *url);
        }
        round->servers.push_back(std::move(s));
    }

    if (to_probe.empty()) {
        auto ranked = rank(round->servers);
        finish(gen, ranked.empty() ? fallback_servers() : std::move(ranked), true);
        return;
    }

    round->outstanding = to_probe.size();
    for (const auto& p : to_probe) {
        size_t idx = p.first;
        std::string host = p.second.host;
        probe_.probe(p.second, opts_.probe_timeout,
                     [this, gen, round, idx, host](const boost::system::error_code& pec, ProbeResult res) {
            if (pec) {
                logger_.info("servers probe " + host + " failed: " + pec.message());
            } else {
                round->servers[idx].latency_ms = res.latency_ms;
                logger_.info("servers probe " + host + " rtt=" + std::to_string(res.latency_ms) +
                             "ms mapped=" + res.mapped.address().to_string() + ":" +
                             std::to_string(res.mapped.port()));
            }
            if (--round->outstanding > 0) return;

            auto ranked = rank(round->servers);
            if (ranked.empty()) {
                logger_.warn("servers none usable after probing, using fallback");
                finish(gen, fallback_servers(), true);
                return;
            }
            finish(gen, std::move(ranked), true);
        });
    }
}

void TraversalServerSelector::finish(uint64_t gen, std::vector<TraversalServer> servers, bool cache) {
    refreshing_ = false;
    if (cache && gen == gen_) {
        cached_ = servers;
        cached_at_ms_ = now_ms();
        have_cache_ = true;
    }
    logger_.info("servers ranked count=" + std::to_string(servers.size()) + (cache ? "" : " (uncached)"));

    auto waiters = std::move(waiters_);
    waiters_.clear();
    for (auto& w : waiters) {
        if (w) w(servers);
    }
}

std::vector<TraversalServer> TraversalServerSelector::rank(const std::vector<TraversalServer>& servers) {
    std::vector<TraversalServer> relay;
    std::vector<TraversalServer> reflexive;
    for (const auto& s : servers) {
        if (s.kind == ServerKind::RELAY) relay.push_back(s);
        else if (s.latency_ms) reflexive.push_back(s);
    }
    std::stable_sort(reflexive.begin(), reflexive.end(), [](const TraversalServer& a, const TraversalServer& b) {
        return *a.latency_ms < *b.latency_ms;
    });
    relay.insert(relay.end(), reflexive.begin(), reflexive.end());
    return relay;
}

std::vector<TraversalServer> TraversalServerSelector::fallback_servers() {
    TraversalServer s;
    s.urls.push_back("stun:stun.l.google.com:19302");
    s.kind = ServerKind::REFLEXIVE;
    return {s};
}

} // namespace clouddrop
