#pragma once

#include <string>
#include <vector>
#include <optional>

namespace intentcluster {

class TextExtractor {
public:
    // Extract utterances from file based on extension (.txt, .text, .json)
    static std::optional<std::vector<std::string>> extractFromFile(const std::string& filePath);

    // One utterance per line; blank lines and lines starting with '#' are skipped.
    // std::nullopt if the content is not valid UTF-8.
    static std::optional<std::vector<std::string>> extractFromText(const std::string& content);

    // A JSON array of strings, or an object with an "utterances" array
    static std::optional<std::vector<std::string>> extractFromJson(const std::string& content);

    // Choose the format from a file name, falling back to content sniffing
    static std::optional<std::vector<std::string>> extractFromUpload(const std::string& filename,
                                                                     const std::string& content);

private:
    // Get file extension (lowercase)
    static std::string getExtension(const std::string& filePath);

    static std::optional<std::string> readFile(const std::string& filePath);
};

} // namespace intentcluster
