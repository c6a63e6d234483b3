#pragma once

#include <boost/asio.hpp>

#include <atomic>
#include <string>
#include <thread>

#include "console.hpp"
#include "node.hpp"

namespace clouddrop {

// Reads commands on its own thread and posts every action to the io_context.
class Cli {
public:
    Cli(boost::asio::io_context& io, PeerNode& node, Console& console);

    void start();
    void join();

private:
    void run();
    void cmd_send(const std::string& peer, const std::string& path);
    void cmd_text(const std::string& peer, const std::string& text);

    boost::asio::io_context& io_;
    PeerNode& node_;
    Console& console_;

    std::atomic<bool> stop_{false};
    std::thread th_;
};

} // namespace clouddrop
