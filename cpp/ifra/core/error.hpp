#pragma once
/*
===============================================================================
Core: Error
File: cpp/ifra/core/error.hpp
===============================================================================

One exception type for the whole library. Recoverable findings (unresolved
materials, incomplete compositions, truncated nesting) are NOT errors; they
are reported in ComplianceResult. Errors are reserved for input that cannot
be evaluated at all and for broken internal invariants.

  kInvalidArgument  caller-supplied value outside its domain (dosage, settings)
  kInvalidNumeric   NaN / infinite / negative quantity in a formula entry
  kParseError       reference JSON, settings JSON or formula CSV malformed
  kIoError          file cannot be opened or read
  kInvariant        internal consistency check failed
===============================================================================
*/

#include <sstream>
#include <stdexcept>
#include <string>
#include <utility>

namespace ifra {

enum class ErrorCode : int {
  kInvalidArgument = 1,
  kInvalidNumeric  = 2,
  kParseError      = 3,
  kIoError         = 4,
  kInvariant       = 5,
};

inline const char* to_string(ErrorCode c) noexcept {
  switch (c) {
    case ErrorCode::kInvalidArgument: return "InvalidArgument";
    case ErrorCode::kInvalidNumeric:  return "InvalidNumeric";
    case ErrorCode::kParseError:      return "ParseError";
    case ErrorCode::kIoError:         return "IoError";
    case ErrorCode::kInvariant:       return "Invariant";
    default:                          return "Unknown";
  }
}

// Errors the user can fix by correcting an input file or argument.
inline bool is_input_error(ErrorCode c) noexcept {
  return c == ErrorCode::kInvalidArgument || c == ErrorCode::kInvalidNumeric ||
         c == ErrorCode::kParseError || c == ErrorCode::kIoError;
}

struct ThrowSite {
  const char* file = "";
  int line = 0;
  const char* function = "";
};

class Error final : public std::runtime_error {
 public:
  Error(ErrorCode code, std::string message, ThrowSite site = {})
      : std::runtime_error(format(code, message, site)),
        code_(code),
        message_(std::move(message)),
        site_(site) {}

  ErrorCode code() const noexcept { return code_; }

  // Message without the code prefix or throw site.
  const std::string& message() const noexcept { return message_; }
  const ThrowSite& site() const noexcept { return site_; }

 private:
  static std::string format(ErrorCode code, const std::string& msg, const ThrowSite& site) {
    std::ostringstream oss;
    oss << "ifra " << to_string(code) << ": " << msg;
    if (site.file && *site.file) oss << " [" << site.file << ":" << site.line << "]";
    return oss.str();
  }

  ErrorCode code_;
  std::string message_;
  ThrowSite site_;
};

[[noreturn]] inline void throw_error(ErrorCode code, std::string message, ThrowSite site) {
  throw Error(code, std::move(message), site);
}

inline void ensure(bool ok, ErrorCode code, std::string message, ThrowSite site) {
  if (!ok) throw_error(code, std::move(message), site);
}

}  // namespace ifra

#define IFRA_THROW_SITE ::ifra::ThrowSite{__FILE__, __LINE__, __func__}
#define IFRA_THROW(CODE, MSG) ::ifra::throw_error((CODE), (MSG), IFRA_THROW_SITE)
#define IFRA_ENSURE(EXPR, CODE, MSG) ::ifra::ensure((EXPR), (CODE), (MSG), IFRA_THROW_SITE)
