#pragma once

#include <cstddef>
#include <cstdint>

// Built-in defaults, overridden by the JSON config file and then by CLI flags
constexpr const char* CONFIG_FILE_PATH = "intentcluster.json";

constexpr double DEFAULT_EPS = 0.5;
constexpr int DEFAULT_MIN_PTS = 2;
constexpr uint16_t DEFAULT_PORT = 8080;

// Upper bound for a single HTTP request body
constexpr size_t MAX_BODY_SIZE = 8 * 1024 * 1024;
