#include "common/errors.hpp"

OracleError::OracleError(ErrorKind kind, const std::string& message)
  : std::runtime_error(std::string(ErrorKindName(kind)) + ": " + message), kind_(kind) {}

const char* ErrorKindName(ErrorKind kind) {
  switch (kind) {
    case ErrorKind::InvalidCoordinate: return "InvalidCoordinate";
    case ErrorKind::InvalidPrecision: return "InvalidPrecision";
    case ErrorKind::InvalidKey: return "InvalidKey";
    case ErrorKind::MissingKey: return "MissingKey";
    case ErrorKind::LocationUnavailable: return "LocationUnavailable";
    case ErrorKind::RandomnessUnavailable: return "RandomnessUnavailable";
    case ErrorKind::InvalidGeohash: return "InvalidGeohash";
    case ErrorKind::InvalidSignature: return "InvalidSignature";
    case ErrorKind::UsageError: return "UsageError";
  }
  return "Unknown";
}

int ExitCodeFor(ErrorKind kind) {
  switch (kind) {
    case ErrorKind::UsageError: return 2;
    case ErrorKind::InvalidCoordinate: return 3;
    case ErrorKind::InvalidPrecision: return 4;
    case ErrorKind::InvalidKey: return 5;
    case ErrorKind::MissingKey: return 6;
    case ErrorKind::LocationUnavailable: return 7;
    case ErrorKind::RandomnessUnavailable: return 8;
    case ErrorKind::InvalidGeohash: return 9;
    case ErrorKind::InvalidSignature: return 10;
  }
  return 1;
}
