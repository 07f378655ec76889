#include "common/errors.hpp"

const char* ErrorKindName(ErrorKind kind) {
  switch (kind) {
    case ErrorKind::InvalidParameter: return "InvalidParameter";
    case ErrorKind::ProviderUnavailable: return "ProviderUnavailable";
    case ErrorKind::SerializationFailure: return "SerializationFailure";
    case ErrorKind::ConfirmationTimeout: return "ConfirmationTimeout";
    case ErrorKind::LedgerRejection: return "LedgerRejection";
  }
  return "Unknown";
}

std::string ErrorInfo::ToString() const {
  std::string out = ErrorKindName(kind);
  if (!source.empty()) out += " [" + source + "]";
  if (!message.empty()) out += ": " + message;
  return out;
}

EngineError::EngineError(ErrorKind kind, const std::string& message)
  : std::runtime_error(std::string(ErrorKindName(kind)) + ": " + message), kind_(kind) {}

ErrorInfo EngineError::Info() const {
  ErrorInfo info;
  info.kind = kind_;
  info.message = what();
  return info;
}
