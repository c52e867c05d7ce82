#pragma once

#include <cstdint>
#include <string>
#include <nlohmann/json.hpp>
#include "config.hpp"
#include "core/IntentPipeline.hpp"

namespace intentcluster {

// JSON integer that fits in an int. False for non-integers and for values
// outside the int range, which nlohmann's get<int>() would silently wrap.
bool jsonToInt(const nlohmann::json& value, int& out);

struct Settings {
    ClusteringParams params;
    uint16_t port = DEFAULT_PORT;
    std::string languageFile;  // empty: built-in English resource
    bool verbose = false;

    // Defaults overridden by the keys present in the file. A missing file
    // keeps the defaults silently; an unreadable or malformed one is reported
    // on stderr and also keeps the defaults.
    static Settings loadFromJson(const std::string& path = CONFIG_FILE_PATH);

    // Apply the keys present in j, throws std::runtime_error on bad values
    void merge(const nlohmann::json& j);

    nlohmann::json to_json() const;
};

} // namespace intentcluster
