#pragma once
#include <stdexcept>
#include <string>

enum class ErrorKind {
  InvalidParameter,
  ProviderUnavailable,
  SerializationFailure,
  ConfirmationTimeout,
  LedgerRejection
};

const char* ErrorKindName(ErrorKind kind);

// Failure recorded as a value inside submission outcomes and execution results.
struct ErrorInfo {
  ErrorKind kind = ErrorKind::ProviderUnavailable;
  std::string message;
  std::string source; // provider id or signature the failure belongs to

  std::string ToString() const;
};

// Thrown only for invalid input or total infrastructure unavailability.
class EngineError : public std::runtime_error {
public:
  EngineError(ErrorKind kind, const std::string& message);
  ErrorKind Kind() const { return kind_; }
  ErrorInfo Info() const;
private:
  ErrorKind kind_;
};

inline EngineError InvalidParameter(const std::string& message) {
  return EngineError(ErrorKind::InvalidParameter, message);
}
