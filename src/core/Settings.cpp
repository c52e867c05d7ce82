#include "core/Settings.hpp"
#include <filesystem>
#include <fstream>
#include <iostream>
#include <limits>
#include <stdexcept>

namespace intentcluster {

bool jsonToInt(const nlohmann::json& value, int& out) {
    if (value.is_number_unsigned()) {
        auto v = value.get<uint64_t>();
        if (v > static_cast<uint64_t>(std::numeric_limits<int>::max())) return false;
        out = static_cast<int>(v);
        return true;
    }
    if (value.is_number_integer()) {
        auto v = value.get<int64_t>();
        if (v < std::numeric_limits<int>::min() || v > std::numeric_limits<int>::max()) return false;
        out = static_cast<int>(v);
        return true;
    }
    return false;
}

void Settings::merge(const nlohmann::json& j) {
    if (!j.is_object()) {
        throw std::runtime_error("Configuration must be a JSON object");
    }

    try {
        if (j.contains("eps")) {
            params.eps = j["eps"].get<double>();
        }
        if (j.contains("min_pts")) {
            int value = 0;
            if (!jsonToInt(j["min_pts"], value) || value < 1) {
                throw std::runtime_error("min_pts must be an integer between 1 and " +
                                         std::to_string(std::numeric_limits<int>::max()) +
                                         ", got " + j["min_pts"].dump());
            }
            params.minPts = value;
        }
        if (j.contains("cluster_space")) {
            params.space = clusterSpaceFromString(j["cluster_space"].get<std::string>());
        }
        if (j.contains("port")) {
            int value = 0;
            if (!jsonToInt(j["port"], value) || value <= 0 || value > 65535) {
                throw std::runtime_error("port must be an integer between 1 and 65535, got " + j["port"].dump());
            }
            port = static_cast<uint16_t>(value);
        }
        languageFile = j.value("language_file", languageFile);
        verbose = j.value("verbose", verbose);
    } catch (const nlohmann::json::type_error& e) {
        throw std::runtime_error(std::string("Invalid configuration value: ") + e.what());
    } catch (const std::invalid_argument& e) {
        throw std::runtime_error(e.what());
    }
}

Settings Settings::loadFromJson(const std::string& path) {
    Settings settings;
    if (!std::filesystem::exists(path)) {
        return settings;
    }

    std::ifstream file(path);
    if (!file.is_open()) {
        std::cerr << "Failed to open config file: " << path << ", using defaults" << std::endl;
        return settings;
    }

    nlohmann::json j;
    try {
        file >> j;
        Settings loaded;
        loaded.merge(j);
        settings = loaded;
    } catch (const nlohmann::json::parse_error& e) {
        std::cerr << "JSON parse error in " << path << ": " << e.what() << ", using defaults" << std::endl;
    } catch (const std::runtime_error& e) {
        std::cerr << "Config error in " << path << ": " << e.what() << ", using defaults" << std::endl;
    }

    return settings;
}

nlohmann::json Settings::to_json() const {
    return {
        {"eps", params.eps},
        {"min_pts", params.minPts},
        {"cluster_space", to_string(params.space)},
        {"port", port},
        {"language_file", languageFile},
        {"verbose", verbose}
    };
}

} // namespace intentcluster
