#include "common/config_manager.hpp"
#include "common/logger.hpp"
#include <cryptopp/misc.h>
#include <cctype>
#include <cstdlib>
#include <fstream>
#include <stdexcept>

std::unordered_map<std::string, std::string> ConfigManager::cache_;

static inline std::string TrimWhitespace(const std::string& input) {
  auto start = input.begin();
  while (start != input.end() && std::isspace(static_cast<unsigned char>(*start))) ++start;
  auto end = input.end();
  while (end != start && std::isspace(static_cast<unsigned char>(*(end - 1)))) --end;
  return std::string(start, end);
}

static inline std::string StripQuotes(const std::string& v) {
  if (v.size() >= 2 && ((v.front() == '"' && v.back() == '"') || (v.front() == '\'' && v.back() == '\'')))
    return v.substr(1, v.size() - 2);
  return v;
}

void ConfigManager::Initialize(const std::string& env_path) {
  cache_.clear();
  LoadEnvFile(env_path);
}

void ConfigManager::LoadEnvFile(const std::string& env_path) {
  std::ifstream file(env_path);
  if (!file.is_open()) {
    Logger::Debug(".env file not found: " + env_path);
    return;
  }
  std::string line;
  while (std::getline(file, line)) {
    line = TrimWhitespace(line);
    if (line.empty() || line[0] == '#') continue;
    if (line.rfind("export ", 0) == 0) line = TrimWhitespace(line.substr(7));
    auto pos = line.find('=');
    if (pos == std::string::npos) continue;
    std::string key = TrimWhitespace(line.substr(0, pos));
    std::string value = StripQuotes(TrimWhitespace(line.substr(pos + 1)));
    if (!key.empty()) cache_[key] = value;
  }
}

std::optional<std::string> ConfigManager::Get(const std::string& key) {
  if (const char* env = std::getenv(key.c_str())) {
    if (*env != '\0') return std::string(env);
  }
  auto it = cache_.find(key);
  if (it == cache_.end() || it->second.empty()) return std::nullopt;
  return it->second;
}

int ConfigManager::GetIntOr(const std::string& key, int default_value) {
  auto v = Get(key);
  if (!v) return default_value;
  try {
    size_t used = 0;
    int parsed = std::stoi(*v, &used);
    if (used == v->size()) return parsed;
  } catch (const std::logic_error&) {
  }
  Logger::Warning("Ignoring non-integer value for " + key);
  return default_value;
}

void ConfigManager::Set(const std::string& key, const std::string& value) { cache_[key] = value; }

void ConfigManager::Forget(const std::string& key) {
  auto it = cache_.find(key);
  if (it == cache_.end()) return;
  if (!it->second.empty()) CryptoPP::SecureWipeBuffer(&it->second[0], it->second.size());
  cache_.erase(it);
}

void ConfigManager::Clear() { cache_.clear(); }
