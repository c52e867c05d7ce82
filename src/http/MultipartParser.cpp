#include "http/MultipartParser.hpp"
#include <cctype>
#include <sstream>

namespace intentcluster {
namespace http {

void MultipartParser::trim(std::string& s) {
    size_t start = 0;
    size_t end = s.size();
    while (start < end && (s[start] == ' ' || s[start] == '\t')) ++start;
    while (end > start && (s[end - 1] == ' ' || s[end - 1] == '\t' ||
                            s[end - 1] == '\r' || s[end - 1] == '\n')) --end;
    s = s.substr(start, end - start);
}

void MultipartParser::toLower(std::string& s) {
    for (char& c : s) {
        c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    }
}

void MultipartParser::forEachParameter(
    const std::string& value,
    const std::function<void(const std::string&, const std::string&)>& fn) {
    auto semicolon = value.find(';');
    if (semicolon == std::string::npos) {
        return;
    }

    std::string params = value.substr(semicolon + 1);
    while (!params.empty()) {
        auto next_semi = params.find(';');
        std::string token = (next_semi == std::string::npos) ? params : params.substr(0, next_semi);
        params = (next_semi == std::string::npos) ? "" : params.substr(next_semi + 1);

        trim(token);
        if (token.empty()) continue;

        auto eq = token.find('=');
        if (eq == std::string::npos) continue;

        std::string key = token.substr(0, eq);
        std::string val = token.substr(eq + 1);
        trim(key);
        trim(val);
        toLower(key);

        // Remove surrounding quotes
        if (val.size() >= 2 && val.front() == '"' && val.back() == '"') {
            val = val.substr(1, val.size() - 2);
        }

        fn(key, val);
    }
}

std::string MultipartParser::parseContentType(const std::string& content_type, std::string& boundary) {
    boundary.clear();

    std::string media_type = content_type.substr(0, content_type.find(';'));
    trim(media_type);
    toLower(media_type);

    forEachParameter(content_type, [&boundary](const std::string& key, const std::string& val) {
        if (key == "boundary" && boundary.empty()) {
            boundary = val;
        }
    });

    return media_type;
}

bool MultipartParser::parsePart(const std::string& segment, MultipartPart& part) {
    size_t blank = segment.find("\r\n\r\n");
    if (blank == std::string::npos) return false;

    std::istringstream headers(segment.substr(0, blank));
    std::string line;
    while (std::getline(headers, line)) {
        auto colon = line.find(':');
        if (colon == std::string::npos) continue;

        std::string header = line.substr(0, colon);
        std::string value = line.substr(colon + 1);
        trim(header);
        trim(value);
        toLower(header);

        if (header == "content-disposition") {
            forEachParameter(value, [&part](const std::string& key, const std::string& val) {
                if (key == "name") part.name = val;
                else if (key == "filename") part.filename = val;
            });
        } else if (header == "content-type") {
            part.content_type = value;
        }
    }

    part.data = segment.substr(blank + 4);
    return true;
}

std::vector<MultipartPart> MultipartParser::parse(const std::string& body,
                                                   const std::string& boundary) {
    std::vector<MultipartPart> parts;
    if (boundary.empty()) return parts;

    // Every delimiter after the first is preceded by CRLF
    const std::string delimiter = "\r\n--" + boundary;
    const std::string padded = "\r\n" + body;

    size_t cursor = padded.find(delimiter);
    while (cursor != std::string::npos) {
        cursor += delimiter.size();
        if (padded.compare(cursor, 2, "--") == 0) break;  // close delimiter

        size_t line_end = padded.find("\r\n", cursor);
        if (line_end == std::string::npos) break;

        size_t next = padded.find(delimiter, line_end);
        size_t segment_end = (next == std::string::npos) ? padded.size() : next;

        MultipartPart part;
        if (parsePart(padded.substr(line_end + 2, segment_end - line_end - 2), part)) {
            parts.push_back(std::move(part));
        }
        cursor = next;
    }

    return parts;
}

} // namespace http
} // namespace intentcluster
