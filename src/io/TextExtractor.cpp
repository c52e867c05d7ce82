#include "io/TextExtractor.hpp"
#include "nlp/Utf8.hpp"
#include <algorithm>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <sstream>
#include <nlohmann/json.hpp>

namespace intentcluster {

std::string TextExtractor::getExtension(const std::string& filePath) {
    std::filesystem::path p(filePath);
    std::string ext = p.extension().string();
    std::transform(ext.begin(), ext.end(), ext.begin(), ::tolower);
    return ext;
}

std::optional<std::string> TextExtractor::readFile(const std::string& filePath) {
    std::ifstream file(filePath, std::ios::binary);
    if (!file.is_open()) {
        return std::nullopt;
    }

    std::stringstream buffer;
    buffer << file.rdbuf();
    return buffer.str();
}

std::optional<std::vector<std::string>> TextExtractor::extractFromText(const std::string& content) {
    if (!nlp::isValidUtf8(content)) {
        std::cerr << "Text input is not valid UTF-8" << std::endl;
        return std::nullopt;
    }

    std::vector<std::string> utterances;
    std::istringstream stream(content);
    std::string line;

    while (std::getline(stream, line)) {
        if (!line.empty() && line.back() == '\r') line.pop_back();

        size_t first = line.find_first_not_of(" \t");
        if (first == std::string::npos) continue;
        if (line[first] == '#') continue;

        size_t last = line.find_last_not_of(" \t");
        utterances.push_back(line.substr(first, last - first + 1));
    }

    return utterances;
}

std::optional<std::vector<std::string>> TextExtractor::extractFromJson(const std::string& content) {
    nlohmann::json j;
    try {
        j = nlohmann::json::parse(content);
    } catch (const nlohmann::json::parse_error& e) {
        std::cerr << "JSON parse error: " << e.what() << std::endl;
        return std::nullopt;
    }

    const nlohmann::json* list = &j;
    if (j.is_object()) {
        if (!j.contains("utterances")) {
            std::cerr << "JSON input has no 'utterances' array" << std::endl;
            return std::nullopt;
        }
        list = &j["utterances"];
    }

    if (!list->is_array()) {
        std::cerr << "JSON input must be an array of strings" << std::endl;
        return std::nullopt;
    }

    std::vector<std::string> utterances;
    utterances.reserve(list->size());
    for (const auto& item : *list) {
        if (!item.is_string()) {
            std::cerr << "JSON input contains a non-string utterance: " << item.dump() << std::endl;
            return std::nullopt;
        }
        utterances.push_back(item.get<std::string>());
    }

    return utterances;
}

std::optional<std::vector<std::string>> TextExtractor::extractFromUpload(const std::string& filename,
                                                                         const std::string& content) {
    std::string ext = getExtension(filename);

    if (ext == ".json") {
        return extractFromJson(content);
    } else if (ext == ".txt" || ext == ".text") {
        return extractFromText(content);
    } else if (ext.empty()) {
        size_t first = content.find_first_not_of(" \t\r\n");
        if (first != std::string::npos && (content[first] == '[' || content[first] == '{')) {
            return extractFromJson(content);
        }
        return extractFromText(content);
    }

    // Unsupported format
    return std::nullopt;
}

std::optional<std::vector<std::string>> TextExtractor::extractFromFile(const std::string& filePath) {
    std::string ext = getExtension(filePath);
    if (ext != ".json" && ext != ".txt" && ext != ".text") {
        std::cerr << "Unsupported input format: " << filePath << std::endl;
        return std::nullopt;
    }

    auto content = readFile(filePath);
    if (!content) {
        std::cerr << "Cannot open input file: " << filePath << std::endl;
        return std::nullopt;
    }

    return extractFromUpload(filePath, *content);
}

} // namespace intentcluster
