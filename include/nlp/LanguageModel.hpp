#pragma once

#include <string>
#include <unordered_map>
#include <unordered_set>
#include <nlohmann/json.hpp>

namespace intentcluster {
namespace nlp {

/**
 * Read-only linguistic resource used by the normalizer.
 * Created once at start-up and shared by every pipeline run.
 */
class LanguageModel {
public:
    // Built-in English resource
    static LanguageModel english();

    // Load a resource from a JSON file, throws std::runtime_error on failure.
    // With "extend": true the file is merged into the built-in English resource.
    static LanguageModel fromJsonFile(const std::string& path);
    static LanguageModel fromJson(const nlohmann::json& j);

    bool isStopWord(const std::string& word) const;

    // Base form for an irregular inflection, empty if the word is regular
    std::string irregularLemma(const std::string& word) const;

    // Replacement for a split-off clitic ("n't" -> "not"), empty if unknown
    std::string expandContraction(const std::string& clitic) const;

    size_t stopWordCount() const { return stopWords_.size(); }
    size_t irregularCount() const { return irregular_.size(); }

private:
    std::unordered_set<std::string> stopWords_;
    std::unordered_map<std::string, std::string> irregular_;
    std::unordered_map<std::string, std::string> contractions_;

    void merge(const nlohmann::json& j);
};

} // namespace nlp
} // namespace intentcluster
