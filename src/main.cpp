#include <boost/asio.hpp>

#include <csignal>
#include <iomanip>
#include <iostream>
#include <memory>
#include <sstream>
#include <string>

#include "cli.hpp"
#include "config.hpp"
#include "console.hpp"
#include "http_directory.hpp"
#include "logger.hpp"
#include "node.hpp"
#include "secure_channel.hpp"
#include "stun_probe.hpp"
#include "tcp_peer_connection.hpp"
#include "traversal.hpp"
#include "url.hpp"
#include "ws_signaling.hpp"

using namespace clouddrop;

namespace {

void usage(const char* argv0) {
    std::cout << "Usage:\n";
    std::cout << "  " << argv0 << " <config_path>\n";
}

std::string percent(double p) {
    std::ostringstream oss;
    oss << std::fixed << std::setprecision(0) << p << "%";
    return oss.str();
}

} // namespace

int main(int argc, char** argv) {
    std::string cfg_path = "./config/default.conf";
    if (argc == 2) {
        cfg_path = argv[1];
    } else if (argc > 2) {
        usage(argv[0]);
        return 2;
    }

    Config cfg;
    std::string err;
    if (!load_config(cfg_path, cfg, err)) {
        std::cerr << err << "\n";
        return 2;
    }
    LogLevel level = LogLevel::INFO;
    if (!parse_log_level(cfg.log_level, level)) {
        std::cerr << "log_level must be one of debug|info|warn|error\n";
        return 2;
    }
    auto signaling_url = parse_url(cfg.signaling_url);
    if (!signaling_url || signaling_url->scheme != "ws") {
        std::cerr << "signaling_url must look like ws://host[:port]/path\n";
        return 2;
    }
    boost::system::error_code ec;
    boost::asio::ip::make_address(cfg.bind_ip, ec);
    if (ec) {
        std::cerr << "bind_ip must be a valid IP address\n";
        return 2;
    }

    std::vector<TraversalServer> configured;
    for (const auto& spec : cfg.ice_servers) {
        auto s = parse_server_spec(spec);
        if (!s) {
            std::cerr << "bad ice_server entry: " << spec << "\n";
            return 2;
        }
        configured.push_back(*s);
    }

    Logger logger(cfg.log_file, level);
    Console console;

    boost::asio::io_context io;

    std::unique_ptr<ServerDirectory> directory;
    if (!cfg.ice_servers_url.empty()) {
        auto url = parse_url(cfg.ice_servers_url);
        if (!url || url->scheme != "http") {
            std::cerr << "ice_servers_url must look like http://host[:port]/path\n";
            return 2;
        }
        directory = std::make_unique<HttpServerDirectory>(io, *url, logger);
    } else {
        directory = std::make_unique<StaticServerDirectory>(io, configured);
    }

    StunProbe probe(io, logger);
    TcpPeerConnection::Options pc_opts;
    pc_opts.bind_ip = cfg.bind_ip;
    pc_opts.check_timeout = std::chrono::milliseconds(cfg.ice_check_timeout_ms);
    TcpPeerConnectionFactory factory(io, pc_opts, &probe, logger);

    auto signaling = std::make_shared<WebSocketSignaling>(io, *signaling_url, cfg.room,
                                                          WebSocketSignaling::Options{}, logger);

    PeerNode node(io, *signaling, *directory, probe, factory, cfg, logger);

    node.set_status_handler([&console](const PeerId& peer, ConnectionStatus st, const std::optional<std::string>& hint) {
        std::string line = std::string("[") + to_string(st) + "] " + peer;
        if (hint) line += ": " + *hint;
        console.notify(line);
    });
    node.set_peer_handler([&console](const PeerId& peer, bool joined) {
        console.notify(peer + (joined ? " joined the room" : " left the room"));
    });
    node.set_file_offered_handler([&console](const PeerId& peer, const FileOffer& offer) {
        console.notify(peer + " is sending " + offer.name + " (" + std::to_string(offer.size) + " bytes)");
    });
    node.set_progress_handler([&console](const TransferProgress& p) {
        // Only the end points, the log has the rest.
        if (p.sent == p.total) {
            console.notify(std::string(p.outbound ? "sent " : "received ") + p.name + " " + percent(p.percent));
        }
    });
    node.set_file_received_handler([&console](const PeerId& peer, const std::string& name,
                                              const std::vector<uint8_t>& data) {
        console.notify("file from " + peer + ": " + name + " size=" + std::to_string(data.size()) +
                       " sha256=" + SecureChannel::digest(data));
    });
    node.set_text_handler([&console](const PeerId& peer, const std::string& text) {
        console.notify(peer + ": " + text);
    });

    try {
        node.start();
    } catch (const std::exception& e) {
        std::cerr << "failed to start: " << e.what() << "\n";
        return 2;
    }
    signaling->start();

    boost::asio::signal_set signals(io, SIGINT, SIGTERM);
    signals.async_wait([&](const boost::system::error_code&, int) {
        node.stop();
        signaling->stop();
        io.stop();
    });

    std::unique_ptr<Cli> cli;
    if (cfg.cli_enabled) {
        cli = std::make_unique<Cli>(io, node, console);
        cli->start();
    }

    io.run();
    if (cli) cli->join();

    signaling->stop();
    return 0;
}
