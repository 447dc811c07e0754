#pragma once

#include <nlohmann/json.hpp>

#include <optional>
#include <string>

using json = nlohmann::json;

// Parses body, prefixing parse errors with origin. Throws std::runtime_error.
json parse_json_or_throw(const std::string &body, const std::string &origin);

// Integer value of key, or nullopt when the key is absent or not a number.
// Throws std::runtime_error for fractional or out-of-range numbers.
std::optional<long long> get_integer(const json &j, const std::string &key);

std::string get_string(const json &j, const std::string &key, const std::string &fallback);
