#pragma once
/*
================================================================================
Fragment 1.2 - Core: Error Codes + Exception (Engine-Wide)
FILE: cpp/safcast/core/error.hpp

Purpose:
  - One exception type for every failure the model can report, tagged with a
    stable ErrorCode so callers (CLI, tests, batch runner) can branch on the
    category instead of parsing messages.
  - File/line/function captured at the throw site for auditability.

Rules:
  - The model either returns a complete result or throws. No partial tables.
  - Validate first: throw before any computation touches the inputs.
================================================================================
*/

#include <sstream>
#include <stdexcept>
#include <string>
#include <utility>

namespace safcast {

// Keep these values stable once public (exit codes and logs refer to them).
enum class ErrorCode : int {
  kInvalidInput    = 1,
  kUnknownScenario = 2,
  kMalformedSeries = 3,
  kInvalidConfig   = 4,
  kParseError      = 5,
  kIoError         = 6,
  kInternal        = 7,
};

inline const char* to_string(ErrorCode c) noexcept {
  switch (c) {
    case ErrorCode::kInvalidInput:    return "InvalidInput";
    case ErrorCode::kUnknownScenario: return "UnknownScenario";
    case ErrorCode::kMalformedSeries: return "MalformedSeries";
    case ErrorCode::kInvalidConfig:   return "InvalidConfig";
    case ErrorCode::kParseError:      return "ParseError";
    case ErrorCode::kIoError:         return "IoError";
    case ErrorCode::kInternal:        return "Internal";
    default:                          return "Unknown";
  }
}

class Error final : public std::runtime_error {
 public:
  Error(ErrorCode code,
        std::string message,
        const char* file,
        int line,
        const char* function)
      : std::runtime_error(build_what(code, message, file, line, function)),
        code_(code),
        message_(std::move(message)),
        file_(file ? file : ""),
        function_(function ? function : ""),
        line_(line) {}

  ErrorCode code() const noexcept { return code_; }
  const std::string& message() const noexcept { return message_; }
  const std::string& file() const noexcept { return file_; }
  const std::string& function() const noexcept { return function_; }
  int line() const noexcept { return line_; }

 private:
  static std::string build_what(ErrorCode code,
                                const std::string& msg,
                                const char* file,
                                int line,
                                const char* func) {
    std::ostringstream oss;
    oss << "[safcast::Error code=" << to_string(code) << "(" << static_cast<int>(code) << ")] "
        << msg;
    if (file && *file) {
      oss << " @ " << file << ":" << line;
      if (func && *func) oss << " (" << func << ")";
    }
    return oss.str();
  }

  ErrorCode code_;
  std::string message_;
  std::string file_;
  std::string function_;
  int line_;
};

[[noreturn]] inline void throw_error(ErrorCode code,
                                     std::string message,
                                     const char* file,
                                     int line,
                                     const char* function) {
  throw Error(code, std::move(message), file, line, function);
}

inline void ensure(bool ok,
                   ErrorCode code,
                   std::string message,
                   const char* file,
                   int line,
                   const char* function) {
  if (!ok) {
    throw_error(code, std::move(message), file, line, function);
  }
}

}  // namespace safcast

#define SAFCAST_THROW(CODE, MSG) ::safcast::throw_error((CODE), (MSG), __FILE__, __LINE__, __func__)
#define SAFCAST_ENSURE(EXPR, CODE, MSG) ::safcast::ensure((EXPR), (CODE), (MSG), __FILE__, __LINE__, __func__)
