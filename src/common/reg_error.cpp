#include "common/reg_error.hpp"
#include <sstream>
#include <utility>

namespace pc {

const char* ToString(ErrorKind kind) {
  switch (kind) {
    case ErrorKind::kOutOfRange:        return "OutOfRange";
    case ErrorKind::kArityMismatch:     return "ArityMismatch";
    case ErrorKind::kReadOnlyViolation: return "ReadOnlyViolation";
    case ErrorKind::kMissingField:      return "MissingField";
    case ErrorKind::kUnknownKind:       return "UnknownKind";
    case ErrorKind::kUnknownName:       return "UnknownName";
    case ErrorKind::kLengthMismatch:    return "LengthMismatch";
    case ErrorKind::kValidationError:   return "ValidationError";
  }
  return "unknown";
}

RegisterError::RegisterError(ErrorKind kind, const std::string& message)
  : std::runtime_error(std::string(ToString(kind)) + ": " + message),
    kind_(kind) {}

RegisterError::RegisterError(std::vector<Violation> violations)
  : std::runtime_error(FormatViolations(violations)),
    kind_(AggregateKind(violations)),
    violations_(std::move(violations)) {}

bool RegisterError::HasViolation(const std::string& field) const {
  for (const auto& v : violations_) {
    if (v.field == field) return true;
  }
  return false;
}

bool RegisterError::HasViolation(const std::string& field, ErrorKind kind) const {
  for (const auto& v : violations_) {
    if (v.field == field && v.kind == kind) return true;
  }
  return false;
}

ErrorKind RegisterError::AggregateKind(const std::vector<Violation>& v) {
  if (v.empty()) return ErrorKind::kValidationError;
  for (const auto& item : v) {
    if (item.kind != ErrorKind::kMissingField) return ErrorKind::kValidationError;
  }
  return ErrorKind::kMissingField;
}

std::string RegisterError::FormatViolations(const std::vector<Violation>& v) {
  std::ostringstream oss;
  oss << ToString(AggregateKind(v)) << ": " << v.size() << " violation(s)";
  for (const auto& item : v) {
    oss << "\n  - " << item.field << " [" << ToString(item.kind) << "] " << item.message;
  }
  return oss.str();
}

} // namespace pc
