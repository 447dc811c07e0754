#pragma once

#include <filesystem>
#include <string>

#include "common.hpp"

#define SPASERVE_DEFAULT_HOST "0.0.0.0"
#define SPASERVE_DEFAULT_PORT 8080

struct ServerConfig {
    std::string host = SPASERVE_DEFAULT_HOST;
    int port = SPASERVE_DEFAULT_PORT; // 0 binds an ephemeral port
    std::filesystem::path root;
    LogLevel log_level = LOG_DEBUG;
};

// Defaults, then the JSON file named by DEV_SERVER_CONFIG, then the
// DEV_SERVER_* environment variables. Throws std::runtime_error on invalid input.
ServerConfig LoadConfig();

ServerConfig DefaultConfig();
void ApplyConfigFile(ServerConfig &config, const std::filesystem::path &file);
void ApplyEnvironment(ServerConfig &config);
void ValidateConfig(ServerConfig &config);

int ParsePort(const std::string &value);
std::filesystem::path GetBinaryPath();
