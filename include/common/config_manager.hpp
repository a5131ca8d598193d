#pragma once
#include <string>
#include <unordered_map>
#include <optional>

// Key/value settings from a .env file, overridden by the process environment.
class ConfigManager {
public:
  static void Initialize(const std::string& env_path = ".env");
  static std::optional<std::string> Get(const std::string& key);
  static int GetIntOr(const std::string& key, int default_value);
  // Wipes and drops a cached .env value once it has been read.
  static void Forget(const std::string& key);
  // Test hook: replaces a .env value without touching the file.
  static void Set(const std::string& key, const std::string& value);
  static void Clear();
private:
  static std::unordered_map<std::string, std::string> cache_;
  static void LoadEnvFile(const std::string& env_path);
};
