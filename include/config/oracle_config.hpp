#pragma once
#include "common/logger.hpp"
#include "location/ipinfo_provider.hpp"
#include <string>

struct OracleConfig {
  IpInfoSettings location;
  std::string log_file = "geoattest.log";
  LogLevel log_level = LogLevel::INFO;
};

constexpr const char* kOracleKeyEnv = "ORACLE_KEY";

// Reads IPINFO_URL, IPINFO_TOKEN, LOCATION_TIMEOUT_MS, LOCATION_MAX_ATTEMPTS,
// LOG_FILE and LOG_LEVEL through ConfigManager. The secret key is not part of it.
OracleConfig LoadOracleConfig();
