// common/reg_error.hpp
#pragma once
#include <stdexcept>
#include <string>
#include <vector>

namespace pc {

/* Failure taxonomy of the register layer.
 * Structural errors (kUnknownKind, kUnknownName, kLengthMismatch) are thrown as
 * soon as they are found. Data errors are collected during one validation pass
 * and surfaced together as kValidationError (or kMissingField when absent
 * fields are the only problem).
 */
enum class ErrorKind {
  kOutOfRange,
  kArityMismatch,
  kReadOnlyViolation,
  kMissingField,
  kUnknownKind,
  kUnknownName,
  kLengthMismatch,
  kValidationError
};

const char* ToString(ErrorKind kind);

// One per-field problem found while validating.
struct Violation {
  std::string field;    // model name of the offending field
  ErrorKind   kind = ErrorKind::kOutOfRange;
  std::string message;
};

class RegisterError : public std::runtime_error {
public:
  RegisterError(ErrorKind kind, const std::string& message);

  // Aggregate of a validation pass. kind() is kMissingField if every
  // violation is a missing field, kValidationError otherwise.
  explicit RegisterError(std::vector<Violation> violations);

  ErrorKind kind() const { return kind_; }
  const std::vector<Violation>& violations() const { return violations_; }

  bool HasViolation(const std::string& field) const;
  bool HasViolation(const std::string& field, ErrorKind kind) const;

private:
  static ErrorKind AggregateKind(const std::vector<Violation>& v);
  static std::string FormatViolations(const std::vector<Violation>& v);

  ErrorKind              kind_;
  std::vector<Violation> violations_;
};

} // namespace pc
