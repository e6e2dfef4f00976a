#pragma once
/*
===========================================================
Fragment 1.1 - Core: Logging
FILE: cpp/safcast/core/logging.hpp
===========================================================
Purpose:
  - Minimal logging used by every safcast module and the CLI.
  - Centralizes stdout/stderr policy.

Hardening:
  - Logging MUST NOT throw (noexcept API).
  - Thread-safe: batch workers may log concurrently.
  - WARN/ERROR go to stderr, DEBUG/INFO to stdout.
===========================================================
*/

#include <string>
#include <string_view>

namespace safcast {

enum class LogLevel : int { DEBUG = 0, INFO = 1, WARN = 2, ERROR = 3 };

// Set global logging verbosity (default INFO).
void set_log_level(LogLevel lvl) noexcept;

LogLevel get_log_level() noexcept;

// True if a message at `lvl` would be emitted. Lets callers skip building
// expensive DEBUG strings.
bool log_enabled(LogLevel lvl) noexcept;

// Accepts debug|info|warn|warning|error (case-insensitive).
bool parse_log_level(std::string_view text, LogLevel* out) noexcept;

const char* to_string(LogLevel lvl) noexcept;

// Core logging call. Never throws.
void log(LogLevel lvl, const std::string& msg) noexcept;

inline void log_debug(const std::string& msg) noexcept { log(LogLevel::DEBUG, msg); }
inline void log_info(const std::string& msg) noexcept { log(LogLevel::INFO, msg); }
inline void log_warn(const std::string& msg) noexcept { log(LogLevel::WARN, msg); }
inline void log_error(const std::string& msg) noexcept { log(LogLevel::ERROR, msg); }

} // namespace safcast
