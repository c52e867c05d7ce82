#pragma once

#include <string>
#include <vector>
#include <functional>

namespace intentcluster {
namespace http {

// One form field or uploaded file of a multipart/form-data body
struct MultipartPart {
    std::string name;           // form field name
    std::string filename;       // original filename (empty if not a file)
    std::string content_type;   // MIME type of the content
    std::string data;           // content, up to the CRLF before the next delimiter

    bool isFile() const { return !filename.empty(); }
};

// Splits multipart/form-data bodies (RFC 7578) and Content-Type values
class MultipartParser {
public:
    // Parts in body order. The boundary is given without the leading "--".
    // Segments without a header block are skipped; an absent boundary gives no parts.
    static std::vector<MultipartPart> parse(const std::string& body, const std::string& boundary);

    // Lower-cased media type of a Content-Type value; boundary receives the
    // boundary parameter, or is cleared when there is none
    static std::string parseContentType(const std::string& content_type, std::string& boundary);

    // In-place helpers shared with the request head parser
    static void trim(std::string& s);
    static void toLower(std::string& s);

private:
    // Headers and content of one part (text between two delimiter lines)
    static bool parsePart(const std::string& segment, MultipartPart& part);

    // key=value pairs after the first ';', keys lower-cased, quotes removed
    static void forEachParameter(const std::string& value,
                                 const std::function<void(const std::string&, const std::string&)>& fn);
};

} // namespace http
} // namespace intentcluster
