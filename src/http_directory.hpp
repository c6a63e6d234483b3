#pragma once

#include <boost/asio.hpp>

#include <chrono>
#include <memory>
#include <string>
#include <vector>

#include "logger.hpp"
#include "traversal.hpp"
#include "url.hpp"

namespace clouddrop {

// Parses {"iceServers":[{"urls": "..." | ["..."], "username": "...", "credential": "..."}]}.
// Entries without a stun/turn url are skipped. Returns false on malformed JSON.
bool parse_ice_servers_json(const std::string& body, std::vector<TraversalServer>& out, std::string& err);

// Fetches the server list with a plain HTTP GET.
class HttpServerDirectory final : public ServerDirectory {
public:
    HttpServerDirectory(boost::asio::io_context& io, Url url, Logger& logger);

    void fetch(std::chrono::milliseconds timeout, FetchHandler handler) override;

private:
    struct Request;

    boost::asio::io_context& io_;
    Url url_;
    Logger& logger_;
};

} // namespace clouddrop
