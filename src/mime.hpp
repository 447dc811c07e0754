#pragma once

#include <filesystem>
#include <string>

// Content-Type for a file, by extension (case-insensitive).
// Unknown extensions map to application/octet-stream.
std::string GuessContentType(const std::filesystem::path &file);
