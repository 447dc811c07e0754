#include "common.h"
#include "common.hpp"

#include <spdlog/spdlog.h>

#include <limits>
#include <stdexcept>
#include <strings.h>

// ─────────────────────────────────────
json parse_json_or_throw(const std::string &body, const std::string &origin) {
    try {
        return json::parse(body);
    } catch (const json::parse_error &e) {
        throw std::runtime_error(origin + ": " + e.what());
    }
}

// ─────────────────────────────────────
std::optional<long long> get_integer(const json &j, const std::string &key) {
    if (!j.contains(key)) return std::nullopt;

    const json &value = j.at(key);
    if (!value.is_number()) {
        spdlog::warn("Key '{}' is not a number, ignoring it", key);
        return std::nullopt;
    }
    if (value.is_number_float()) {
        throw std::runtime_error("'" + key + "' must be an integer, got " + value.dump());
    }
    if (value.is_number_unsigned() &&
        value.get<unsigned long long>() >
            static_cast<unsigned long long>(std::numeric_limits<long long>::max())) {
        throw std::runtime_error("'" + key + "' is out of range: " + value.dump());
    }
    return value.get<long long>();
}

// ─────────────────────────────────────
std::string get_string(const json &j, const std::string &key, const std::string &fallback) {
    if (!j.contains(key)) return fallback;
    if (j.at(key).is_string()) return j.at(key).get<std::string>();
    spdlog::warn("Key '{}' is not a string, keeping '{}'", key, fallback);
    return fallback;
}

// ─────────────────────────────────────
const char *ResponseModeName(ResponseMode mode) {
    switch (mode) {
    case DIRECT_FILE:
        return "DirectFile";
    case DIRECTORY_INDEX:
        return "DirectoryIndex";
    case FALLBACK:
        return "Fallback";
    }
    return "Unknown";
}

// ─────────────────────────────────────
bool ParseLogLevel(const std::string &name, LogLevel &out) {
    if (strcasecmp(name.c_str(), "debug") == 0) {
        out = LOG_DEBUG;
    } else if (strcasecmp(name.c_str(), "info") == 0) {
        out = LOG_INFO;
    } else if (strcasecmp(name.c_str(), "off") == 0) {
        out = LOG_OFF;
    } else {
        return false;
    }
    return true;
}
