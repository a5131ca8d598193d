#pragma once
#include <stdexcept>
#include <string>

enum class ErrorKind {
  InvalidCoordinate,
  InvalidPrecision,
  InvalidKey,
  MissingKey,
  LocationUnavailable,
  RandomnessUnavailable,
  InvalidGeohash,
  InvalidSignature,
  UsageError
};

// Every failure of a documented operation surfaces as an OracleError.
class OracleError : public std::runtime_error {
public:
  OracleError(ErrorKind kind, const std::string& message);
  ErrorKind Kind() const { return kind_; }
private:
  ErrorKind kind_;
};

const char* ErrorKindName(ErrorKind kind);
// Distinct non-zero process exit code per kind.
int ExitCodeFor(ErrorKind kind);
