#include "config/oracle_config.hpp"
#include "common/config_manager.hpp"
#include <algorithm>

OracleConfig LoadOracleConfig() {
  OracleConfig cfg;
  cfg.location.url = ConfigManager::Get("IPINFO_URL").value_or(cfg.location.url);
  if (auto t = ConfigManager::Get("IPINFO_TOKEN")) cfg.location.token = *t;
  cfg.location.timeout_ms = std::max(100, ConfigManager::GetIntOr("LOCATION_TIMEOUT_MS", cfg.location.timeout_ms));
  cfg.location.max_attempts = std::clamp(ConfigManager::GetIntOr("LOCATION_MAX_ATTEMPTS", cfg.location.max_attempts), 1, 5);
  cfg.log_file = ConfigManager::Get("LOG_FILE").value_or(cfg.log_file);
  if (auto lvl = ConfigManager::Get("LOG_LEVEL")) cfg.log_level = LogLevelFromString(*lvl, cfg.log_level);
  return cfg;
}
