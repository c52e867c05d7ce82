#include "server/wserver.hpp"
#include "config.hpp"
#include "http/MultipartParser.hpp"
#include <sstream>
#include <stdexcept>

namespace asio = boost::asio;
using boost::asio::ip::tcp;

namespace intentcluster {

namespace {

int hex_value(char c) {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
}

// %XX and '+' decoding for query strings
std::string url_decode(const std::string& s) {
    std::string out;
    out.reserve(s.size());
    for (size_t i = 0; i < s.size(); ++i) {
        if (s[i] == '+') {
            out.push_back(' ');
        } else if (s[i] == '%' && i + 2 < s.size() && hex_value(s[i + 1]) >= 0 && hex_value(s[i + 2]) >= 0) {
            out.push_back(static_cast<char>(hex_value(s[i + 1]) * 16 + hex_value(s[i + 2])));
            i += 2;
        } else {
            out.push_back(s[i]);
        }
    }
    return out;
}

void parse_query(const std::string& qs, std::unordered_map<std::string, std::string>& query) {
    size_t pos = 0;
    while (pos <= qs.size()) {
        size_t amp = qs.find('&', pos);
        std::string pair = qs.substr(pos, (amp == std::string::npos ? qs.size() : amp) - pos);
        if (!pair.empty()) {
            size_t eq = pair.find('=');
            if (eq == std::string::npos) {
                query[url_decode(pair)] = "";
            } else {
                query[url_decode(pair.substr(0, eq))] = url_decode(pair.substr(eq + 1));
            }
        }
        if (amp == std::string::npos) break;
        pos = amp + 1;
    }
}

} // namespace

wServer::wServer(): acceptor_(io_context_){}

void wServer::add_endpoint(const endpoint& ep)
{
    handlers_.insert_or_assign(ep.get_path(), ep);
}

http::Request wServer::parse_head(const std::string& head,
                                  size_t& content_length,
                                  bool& has_content_length,
                                  std::string& boundary)
{
    std::istringstream request_stream(head);
    content_length = 0;
    has_content_length = false;
    boundary.clear();

    std::string method, path, version;
    if (!(request_stream >> method >> path >> version)) {
        throw std::invalid_argument("Malformed request line");
    }

    std::string dummy;
    std::getline(request_stream, dummy);

    http::Request req;
    req.method = http::method_from_string(method);

    req.path = path;
    auto qm = path.find('?');
    if (qm != std::string::npos) {
        req.path = path.substr(0, qm);
        parse_query(path.substr(qm + 1), req.query);
    }

    std::string header_line;
    while (std::getline(request_stream, header_line))
    {
        if (!header_line.empty() && header_line.back() == '\r') header_line.pop_back();
        if (header_line.empty()) break;

        auto colon = header_line.find(':');
        if (colon == std::string::npos) continue;

        std::string name = header_line.substr(0, colon);
        std::string value = header_line.substr(colon + 1);
        http::MultipartParser::trim(name);
        http::MultipartParser::trim(value);
        http::MultipartParser::toLower(name);

        if (name == "content-length") {
            try {
                content_length = static_cast<size_t>(std::stoull(value));
                has_content_length = true;
            } catch (const std::exception&) {
                has_content_length = false;
            }
        } else if (name == "content-type") {
            req.mediaType = http::MultipartParser::parseContentType(value, boundary);
        }
    }

    return req;
}

void wServer::attach_body(http::Request& req, std::string body, const std::string& boundary)
{
    if (req.mediaType == "multipart/form-data") {
        req.parts = http::MultipartParser::parse(body, boundary);
        std::cout << "Multipart parts count: " << req.parts.size() << std::endl;
    }
    req.rawBody = std::move(body);
}

http::Response wServer::dispatch(const http::Request& req) const
{
    auto it = handlers_.find(req.path);
    if (it == handlers_.end()) {
        return http::Response::notFound("No endpoint " + req.path);
    }

    const endpoint& ep = it->second;
    if (ep.get_rest_type() != req.method) {
        return http::Response::methodNotAllowed();
    }
    if (!ep.get_media_type().empty() && ep.get_media_type() != req.mediaType) {
        return http::Response::unsupportedMediaType(ep.get_media_type());
    }

    try {
        return ep.get_handler()(req);
    }
    catch (const std::exception& e) {
        std::cerr << "Handler for " << req.path << " failed: " << e.what() << std::endl;
        return http::Response::badRequest(std::string("Bad Request: ") + e.what());
    }
}

void wServer::serve_one(tcp::socket& socket)
{
    asio::streambuf buf;
    asio::read_until(socket, buf, "\r\n\r\n");

    std::string data(asio::buffers_begin(buf.data()), asio::buffers_end(buf.data()));
    size_t head_end = data.find("\r\n\r\n");
    std::string head = data.substr(0, head_end + 2);
    std::string body = data.substr(head_end + 4);

    http::Response response;
    try {
        size_t content_length = 0;
        bool has_content_length = false;
        std::string boundary;
        http::Request req = parse_head(head, content_length, has_content_length, boundary);

        if (has_content_length && content_length > MAX_BODY_SIZE) {
            response = http::Response::payloadTooLarge();
        } else {
            if (has_content_length) {
                if (body.size() < content_length) {
                    std::string rest;
                    rest.resize(content_length - body.size());
                    asio::read(socket, asio::buffer(&rest[0], rest.size()));
                    body += rest;
                } else if (body.size() > content_length) {
                    body.resize(content_length);
                }
            }

            attach_body(req, std::move(body), boundary);
            std::cout << http::to_string(req.method) << " " << req.path << " (" << req.rawBody.size() << " bytes)" << std::endl;
            response = dispatch(req);
        }
    }
    catch (const std::invalid_argument& e) {
        response = http::Response::badRequest(e.what());
    }

    std::ostringstream out;
    out << "HTTP/1.1 " << response.status << " " << http::status_text(response.status) << "\r\n";
    out << "Content-Length: " << response.body.size() << "\r\n";
    out << "Content-Type: " << response.contentType << "\r\n";
    out << "Connection: close\r\n\r\n";
    out << response.body;

    asio::write(socket, asio::buffer(out.str()));
}

void wServer::run(uint16_t port)
{
    tcp::endpoint listen_on(tcp::v4(), port);
    acceptor_ = tcp::acceptor(io_context_, listen_on);
    std::cout << "Server listening on port " << port << std::endl;

    while (true)
    {
        tcp::socket socket(io_context_);
        acceptor_.accept(socket);

        try {
            serve_one(socket);
        }
        catch (const boost::system::system_error& e) {
            std::cerr << "Connection error: " << e.what() << std::endl;
        }

        boost::system::error_code ec;
        socket.shutdown(tcp::socket::shutdown_both, ec);
        socket.close(ec);
    }
}

} // namespace intentcluster
