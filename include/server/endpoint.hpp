#pragma once 

#include <string>
#include <functional>
#include "const/rest_enums.hpp"
#include "http/Request.hpp"

namespace intentcluster {

using Handler = std::function<http::Response(const http::Request&)>;

class endpoint
{
    Handler handler;
    http::HttpRequest rest_type;
    std::string path;
    std::string media_type; // required Content-Type, empty accepts any

public:
    endpoint(Handler handler, 
             http::HttpRequest rest_type, 
             const std::string& path,
             const std::string& media_type = "")
        : handler(std::move(handler)), rest_type(rest_type), path(path), media_type(media_type) {}

    std::string get_path() const { return path; }
    const Handler& get_handler() const { return handler; }
    http::HttpRequest get_rest_type() const { return rest_type; }
    const std::string& get_media_type() const { return media_type; }
};

} // namespace intentcluster
