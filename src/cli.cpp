#include "cli.hpp"

#include "traversal.hpp"
#include "util.hpp"

#include <cctype>
#include <iostream>
#include <sstream>
#include <termios.h>
#include <unistd.h>

namespace clouddrop {
namespace {

const char* kPrompt = "clouddrop> ";

void print_help(Console& c) {
    c.println("commands:");
    c.println("  help                      show this help");
    c.println("  id                        show local peer id");
    c.println("  peers                     list peers in the room");
    c.println("  servers [refresh]         show ranked traversal servers");
    c.println("  send <peer> <path>        send a file");
    c.println("  text <peer> <message>     send a text message");
    c.println("  close <peer>              drop the connection to a peer");
    c.println("  quit                      exit");
}

bool read_line(Console& c, std::string& out) {
    out.clear();
    if (!::isatty(STDIN_FILENO)) {
        return static_cast<bool>(std::getline(std::cin, out));
    }

    termios orig{};
    if (::tcgetattr(STDIN_FILENO, &orig) != 0) {
        return static_cast<bool>(std::getline(std::cin, out));
    }
    termios raw = orig;
    raw.c_lflag &= static_cast<unsigned int>(~(ICANON | ECHO));
    raw.c_cc[VMIN] = 1;
    raw.c_cc[VTIME] = 0;
    if (::tcsetattr(STDIN_FILENO, TCSANOW, &raw) != 0) {
        return static_cast<bool>(std::getline(std::cin, out));
    }

    auto restore = [&]() { ::tcsetattr(STDIN_FILENO, TCSANOW, &orig); };
    char ch = 0;
    while (true) {
        ssize_t n = ::read(STDIN_FILENO, &ch, 1);
        if (n <= 0) {
            restore();
            return false;
        }
        if (ch == '\r' || ch == '\n') {
            c.print("\n");
            break;
        }
        if (ch == 0x7f || ch == '\b') {
            if (!out.empty()) {
                out.pop_back();
                c.print("\b \b");
            }
            continue;
        }
        if (ch == 0x03) {
            c.print("^C\n");
            restore();
            return false;
        }
        if (std::isprint(static_cast<unsigned char>(ch))) {
            out.push_back(ch);
            c.print(std::string(1, ch));
        }
    }
    restore();
    return true;
}

std::string rest_of(std::istringstream& iss) {
    std::string rest;
    std::getline(iss, rest);
    return trim(rest);
}

} // namespace

Cli::Cli(boost::asio::io_context& io, PeerNode& node, Console& console)
    : io_(io), node_(node), console_(console) {}

void Cli::start() {
    console_.set_prompt(kPrompt);
    th_ = std::thread([this] { run(); });
}

void Cli::join() {
    if (th_.joinable()) th_.join();
}

void Cli::cmd_send(const std::string& peer, const std::string& path) {
    std::string err;
    auto file = DiskFileSource::open(path, err);
    if (!file) {
        console_.println("send: " + err);
        return;
    }
    std::string name = file->name();
    uint64_t size = file->size();
    auto id = node_.send_file(peer, file, [this, peer, name](const boost::system::error_code& ec,
                                                             const std::string&) {
        if (ec) {
            console_.notify("send " + name + " to " + peer + " failed: " + ec.message());
        } else {
            console_.notify("sent " + name + " to " + peer);
        }
    });
    console_.println("sending " + name + " (" + std::to_string(size) + " bytes) to " + peer + " id=" + id);
}

void Cli::cmd_text(const std::string& peer, const std::string& text) {
    node_.send_text(peer, text, [this, peer](const boost::system::error_code& ec, const std::string&) {
        if (ec) console_.notify("text to " + peer + " failed: " + ec.message());
    });
}

void Cli::run() {
    print_help(console_);

    std::string line;
    while (!stop_.load()) {
        console_.print(kPrompt);
        if (!read_line(console_, line)) break;
        line = trim(line);
        if (line.empty()) continue;

        std::istringstream iss(line);
        std::string cmd;
        iss >> cmd;

        if (cmd == "help" || cmd == "h" || cmd == "?") {
            print_help(console_);
            continue;
        }

        if (cmd == "quit" || cmd == "exit" || cmd == "q") {
            stop_.store(true);
            boost::asio::post(io_, [this] { node_.stop(); io_.stop(); });
            break;
        }

        if (cmd == "id") {
            boost::asio::post(io_, [this] {
                const auto& id = node_.local_id();
                console_.println("peer_id=" + (id.empty() ? std::string("(not joined)") : id) +
                                 " signaling=" + (node_.signaling_open() ? "open" : "closed"));
            });
            continue;
        }

        if (cmd == "peers") {
            boost::asio::post(io_, [this] {
                const auto& peers = node_.room_peers();
                console_.println("Peers in room (" + std::to_string(peers.size()) + "):");
                if (peers.empty()) {
                    console_.println("  (none)");
                    return;
                }
                for (const auto& p : peers) {
                    std::string mode = node_.relay_mode(p) ? "relay"
                                       : node_.connections().open_channel(p) ? "direct"
                                                                             : "idle";
                    console_.println("  - " + p + " [" + mode + "]");
                }
            });
            continue;
        }

        if (cmd == "servers") {
            bool refresh = rest_of(iss) == "refresh";
            boost::asio::post(io_, [this, refresh] {
                node_.servers([this](const std::vector<TraversalServer>& servers) {
                    std::ostringstream oss;
                    oss << "Traversal servers (" << servers.size() << "):";
                    console_.notify(oss.str());
                    for (const auto& s : servers) console_.println("  - " + describe(s));
                }, refresh);
            });
            continue;
        }

        if (cmd == "send") {
            std::string peer;
            iss >> peer;
            std::string path = rest_of(iss);
            if (peer.empty() || path.empty()) {
                console_.println("usage: send <peer> <path>");
                continue;
            }
            boost::asio::post(io_, [this, peer, path] { cmd_send(peer, path); });
            continue;
        }

        if (cmd == "text") {
            std::string peer;
            iss >> peer;
            std::string text = rest_of(iss);
            if (peer.empty() || text.empty()) {
                console_.println("usage: text <peer> <message>");
                continue;
            }
            boost::asio::post(io_, [this, peer, text] { cmd_text(peer, text); });
            continue;
        }

        if (cmd == "close") {
            std::string peer;
            iss >> peer;
            if (peer.empty()) {
                console_.println("usage: close <peer>");
                continue;
            }
            boost::asio::post(io_, [this, peer] {
                node_.close_peer(peer);
                console_.println("closed " + peer);
            });
            continue;
        }

        console_.println("unknown command: " + cmd);
    }
}

} // namespace clouddrop
