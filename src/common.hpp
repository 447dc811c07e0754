#pragma once

#include <string>

enum LogLevel { LOG_DEBUG, LOG_INFO, LOG_OFF };

enum ResponseMode { DIRECT_FILE = 1, DIRECTORY_INDEX = 2, FALLBACK = 3 };

enum ResolveStatus { RESOLVE_OK = 0, RESOLVE_NOT_FOUND = 1, RESOLVE_IO_ERROR = 2 };

const char *ResponseModeName(ResponseMode mode);
bool ParseLogLevel(const std::string &name, LogLevel &out);
