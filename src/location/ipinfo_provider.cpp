#include "location/ipinfo_provider.hpp"
#include "net/http_client.hpp"
#include "common/errors.hpp"
#include "common/logger.hpp"
#include <chrono>
#include <cstdlib>
#include <thread>
#include <unordered_map>
#include <nlohmann/json.hpp>

static double ParseComponent(const std::string& text, const char* what) {
  const char* begin = text.c_str();
  while (*begin == ' ' || *begin == '\t') ++begin;
  char* end = nullptr;
  const double v = std::strtod(begin, &end);
  while (end && (*end == ' ' || *end == '\t')) ++end;
  if (end == begin || end == nullptr || *end != '\0')
    throw OracleError(ErrorKind::LocationUnavailable, std::string("invalid ") + what + " '" + text + "'");
  return v;
}

Coordinate ParseIpInfoBody(const std::string& body) {
  std::string loc;
  try {
    const auto j = nlohmann::json::parse(body);
    if (!j.is_object() || !j.contains("loc") || !j["loc"].is_string())
      throw OracleError(ErrorKind::LocationUnavailable, "response has no \"loc\" field");
    loc = j["loc"].get<std::string>();
  } catch (const nlohmann::json::exception& e) {
    throw OracleError(ErrorKind::LocationUnavailable, std::string("unparsable response: ") + e.what());
  }
  const auto comma = loc.find(',');
  if (comma == std::string::npos || loc.find(',', comma + 1) != std::string::npos)
    throw OracleError(ErrorKind::LocationUnavailable, "invalid location format: " + loc);
  Coordinate c;
  c.latitude = ParseComponent(loc.substr(0, comma), "latitude");
  c.longitude = ParseComponent(loc.substr(comma + 1), "longitude");
  if (!IsValidCoordinate(c.latitude, c.longitude))
    throw OracleError(ErrorKind::LocationUnavailable, "location out of range: " + loc);
  return c;
}

IpInfoLocationProvider::IpInfoLocationProvider(HttpClient& http, IpInfoSettings settings)
  : http_(http), settings_(std::move(settings)) {
  if (settings_.max_attempts < 1) settings_.max_attempts = 1;
}

Coordinate IpInfoLocationProvider::FetchOnce() {
  std::unordered_map<std::string, std::string> headers{{"Accept", "application/json"}};
  if (settings_.token) headers["Authorization"] = "Bearer " + *settings_.token;
  const HttpResponse resp = http_.Get(settings_.url, headers, settings_.timeout_ms);
  if (resp.status == 0)
    throw OracleError(ErrorKind::LocationUnavailable, "request to " + settings_.url + " failed: " + resp.error);
  if (resp.status != 200)
    throw OracleError(ErrorKind::LocationUnavailable, "request to " + settings_.url + " returned HTTP " + std::to_string(resp.status));
  return ParseIpInfoBody(resp.body);
}

Coordinate IpInfoLocationProvider::CurrentLocation() {
  for (int attempt = 1;; ++attempt) {
    try {
      Coordinate c = FetchOnce();
      Logger::Debug("Location lookup succeeded on attempt " + std::to_string(attempt));
      return c;
    } catch (const OracleError& e) {
      if (attempt >= settings_.max_attempts) throw;
      Logger::Warning(std::string("Location lookup attempt ") + std::to_string(attempt) + " failed: " + e.what());
      std::this_thread::sleep_for(std::chrono::milliseconds(settings_.retry_delay_ms * attempt));
    }
  }
}
