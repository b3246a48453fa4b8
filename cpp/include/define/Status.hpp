#pragma once

#include <string>
#include <utility>

namespace MsBin {

// ============================================================================
// ERROR KINDS
// ============================================================================
//
// StructuralFormat: file missing where mandatory, record count inconsistent
//                   with file size, malformed sidecar
// Decode:           short read / impossible value inside one data file
// Configuration:    mandatory index absent, field count vs. default layout
//
enum class ErrorKind {
  None,
  StructuralFormat,
  Decode,
  Configuration
};

inline const char *error_kind_to_string(ErrorKind kind) {
  switch (kind) {
  case ErrorKind::None:
    return "ok";
  case ErrorKind::StructuralFormat:
    return "structural format error";
  case ErrorKind::Decode:
    return "decode error";
  case ErrorKind::Configuration:
    return "configuration error";
  default:
    return "unknown error";
  }
}

class Status {
public:
  Status() = default;
  Status(ErrorKind kind, std::string message)
      : kind_(kind), message_(std::move(message)) {}

  static Status Ok() { return Status(); }
  static Status StructuralFormat(std::string message) { return Status(ErrorKind::StructuralFormat, std::move(message)); }
  static Status Decode(std::string message) { return Status(ErrorKind::Decode, std::move(message)); }
  static Status Configuration(std::string message) { return Status(ErrorKind::Configuration, std::move(message)); }

  bool ok() const { return kind_ == ErrorKind::None; }
  ErrorKind kind() const { return kind_; }
  const std::string &message() const { return message_; }

  // "<kind>: <message>"
  std::string to_string() const {
    if (ok())
      return "ok";
    return std::string(error_kind_to_string(kind_)) + ": " + message_;
  }

private:
  ErrorKind kind_ = ErrorKind::None;
  std::string message_;
};

} // namespace MsBin
