#pragma once
#include <boost/asio.hpp>
#include <unordered_map>
#include <iostream>
#include <string>
#include "const/rest_enums.hpp"
#include "http/Request.hpp"
#include "server/endpoint.hpp"

namespace intentcluster {

class wServer
{
  boost::asio::io_context io_context_;
  boost::asio::ip::tcp::acceptor acceptor_;
  std::unordered_map<std::string, endpoint> handlers_;
public:
    wServer();
    void add_endpoint(const endpoint& ep);

    // Route a parsed request to its endpoint. Handler exceptions become 400.
    http::Response dispatch(const http::Request& req) const;

    // Parse request line and headers (everything before the blank line).
    // Throws std::invalid_argument on a malformed request line or method.
    static http::Request parse_head(const std::string& head,
                                    size_t& content_length,
                                    bool& has_content_length,
                                    std::string& boundary);

    // Attach the body: multipart bodies are split into parts, others kept raw
    static void attach_body(http::Request& req, std::string body, const std::string& boundary);

    // Blocking accept loop, one request per connection
    void run(uint16_t port);

private:
    void serve_one(boost::asio::ip::tcp::socket& socket);
};

} // namespace intentcluster
