#pragma once
#include "crypto/hasher.hpp"
#include <optional>
#include <string>
#include <vector>

enum class Command { Generate, Run, Verify, Help };

struct CommandLine {
  Command command = Command::Help;
  // run
  std::optional<std::string> key;
  int accuracy = 6;
  bool with_geohash = false;
  // run and verify
  std::string hash = Crypto::kDefaultHasherName;
  // verify
  std::string public_key;
  std::string geohash;
  std::string signature;
  std::string challenge;
};

// Options take the form --name=value or --name value.
// Throws OracleError(UsageError) for unknown commands or options, or missing values,
// and OracleError(InvalidPrecision) for a non-numeric --accuracy.
CommandLine ParseCommandLine(const std::vector<std::string>& args);
CommandLine ParseCommandLine(int argc, const char* const argv[]);

std::string UsageText();
