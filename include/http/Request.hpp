#pragma once

#include <string>
#include <vector>
#include <unordered_map>
#include <nlohmann/json.hpp>
#include "http/MultipartParser.hpp"
#include "const/rest_enums.hpp"

namespace intentcluster {
namespace http {

/**
 * HTTP Request object containing all request data
 */
struct Request {
    HttpRequest method = HttpRequest::GET;                 // GET, POST, PUT, PATCH
    std::string path;                                      // Clean path without query string
    std::unordered_map<std::string, std::string> query;    // Query parameters (?key=value)
    std::string mediaType;                                 // Content-Type without parameters
    std::vector<MultipartPart> parts;                      // Multipart parts
    std::string rawBody;                                   // Raw body for JSON requests

    std::string getQuery(const std::string& key, const std::string& defaultValue = "") const {
        auto it = query.find(key);
        return it != query.end() ? it->second : defaultValue;
    }

    bool hasQuery(const std::string& key) const {
        return query.find(key) != query.end();
    }

    // Multipart part by form field name, nullptr if absent
    const MultipartPart* findPart(const std::string& name) const {
        for (const auto& part : parts) {
            if (part.name == name) return &part;
        }
        return nullptr;
    }
};

/**
 * HTTP Response object
 */
struct Response {
    int status = 200;
    std::string contentType = "application/json";
    std::string body;

    static Response ok(const nlohmann::json& body) {
        return {200, "application/json", body.dump()};
    }

    static Response badRequest(const std::string& message) {
        return errorResponse(400, message);
    }

    static Response notFound(const std::string& message = "Not found") {
        return errorResponse(404, message);
    }

    static Response methodNotAllowed() {
        return errorResponse(405, "Method not allowed");
    }

    static Response payloadTooLarge() {
        return errorResponse(413, "Payload too large");
    }

    static Response unsupportedMediaType(const std::string& expected) {
        return errorResponse(415, "Expected Content-Type " + expected);
    }

    static Response error(const std::string& message) {
        return errorResponse(500, message);
    }

private:
    static Response errorResponse(int status, const std::string& message) {
        nlohmann::json body = {{"status", "error"}, {"message", message}};
        return {status, "application/json", body.dump()};
    }
};

} // namespace http
} // namespace intentcluster
