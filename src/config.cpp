#include "config.hpp"
#include "common.h"

#include <spdlog/spdlog.h>

#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <fstream>
#include <limits.h>
#include <stdexcept>
#include <unistd.h>
#include <vector>

namespace {
const char *GetEnv(const char *name) {
    const char *value = std::getenv(name);
    if (value && *value) {
        return value;
    }
    return nullptr;
}
} // namespace

// ─────────────────────────────────────
std::filesystem::path GetBinaryPath() {
    char buf[PATH_MAX];
    ssize_t len = readlink("/proc/self/exe", buf, sizeof(buf) - 1);
    if (len == -1) {
        throw std::runtime_error("cannot resolve executable path: " +
                                 std::string(std::strerror(errno)));
    }
    buf[len] = '\0';

    std::filesystem::path binDir(buf);
    binDir = binDir.parent_path();

    if (binDir.filename() == "bin") {
        binDir = binDir.parent_path() / "share" / "spaserve";
    }

    // Fallbacks if assets are not in the computed path
    const std::vector<std::filesystem::path> candidates = {binDir, "/usr/local/share/spaserve",
                                                           "/usr/share/spaserve"};

    for (const auto &p : candidates) {
        std::error_code ec;
        if (std::filesystem::exists(p / "index.html", ec)) {
            return p;
        }
    }

    return binDir;
}

// ─────────────────────────────────────
int ParsePort(const std::string &value) {
    if (value.empty()) {
        throw std::runtime_error("invalid port: empty value");
    }

    errno = 0;
    char *end = nullptr;
    const long port = std::strtol(value.c_str(), &end, 10);
    if (errno != 0 || end == value.c_str() || *end != '\0' || port < 0 || port > 65535) {
        throw std::runtime_error("invalid port: '" + value + "'");
    }
    return static_cast<int>(port);
}

// ─────────────────────────────────────
ServerConfig DefaultConfig() {
    ServerConfig config;
    config.root = GetBinaryPath();
    return config;
}

// ─────────────────────────────────────
void ApplyConfigFile(ServerConfig &config, const std::filesystem::path &file) {
    std::ifstream in(file, std::ios::binary);
    if (!in) {
        throw std::runtime_error("cannot open config file: " + file.string());
    }
    std::string body((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());

    json data = parse_json_or_throw(body, "invalid config file " + file.string());
    if (!data.is_object()) {
        throw std::runtime_error("invalid config file " + file.string() + ": expected an object");
    }

    config.host = get_string(data, "host", config.host);

    if (const std::optional<long long> port = get_integer(data, "port")) {
        if (*port < 0 || *port > 65535) {
            throw std::runtime_error("invalid port: " + std::to_string(*port));
        }
        config.port = static_cast<int>(*port);
    }

    const std::string root = get_string(data, "root", "");
    if (!root.empty()) {
        std::filesystem::path rootPath(root);
        // relative roots are taken relative to the config file
        if (rootPath.is_relative()) {
            rootPath = file.parent_path() / rootPath;
        }
        config.root = rootPath;
    }

    const std::string level = get_string(data, "log_level", "");
    if (!level.empty() && !ParseLogLevel(level, config.log_level)) {
        throw std::runtime_error("invalid log_level: '" + level + "'");
    }
}

// ─────────────────────────────────────
void ApplyEnvironment(ServerConfig &config) {
    if (const char *host = GetEnv("DEV_SERVER_HOST")) {
        config.host = host;
    }
    if (const char *port = GetEnv("DEV_SERVER_PORT")) {
        config.port = ParsePort(port);
    }
    if (const char *root = GetEnv("DEV_SERVER_ROOT")) {
        config.root = root;
    }
    if (const char *level = GetEnv("DEV_SERVER_LOG_LEVEL")) {
        if (!ParseLogLevel(level, config.log_level)) {
            throw std::runtime_error("invalid DEV_SERVER_LOG_LEVEL: '" + std::string(level) + "'");
        }
    }
}

// ─────────────────────────────────────
void ValidateConfig(ServerConfig &config) {
    if (config.host.empty()) {
        throw std::runtime_error("host must not be empty");
    }

    std::error_code ec;
    std::filesystem::path root = std::filesystem::absolute(config.root, ec);
    if (ec) {
        throw std::runtime_error("invalid content root " + config.root.string() + ": " +
                                 ec.message());
    }
    root = root.lexically_normal();
    if (!root.has_filename() && root != root.root_path()) {
        root = root.parent_path();
    }

    if (!std::filesystem::is_directory(root, ec)) {
        throw std::runtime_error("content root is not a directory: " + root.string());
    }
    config.root = root;
}

// ─────────────────────────────────────
ServerConfig LoadConfig() {
    ServerConfig config = DefaultConfig();

    if (const char *file = GetEnv("DEV_SERVER_CONFIG")) {
        spdlog::debug("Loading config file {}", file);
        ApplyConfigFile(config, file);
    }

    ApplyEnvironment(config);
    ValidateConfig(config);
    return config;
}
