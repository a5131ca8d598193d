#pragma once
#include "location/location_provider.hpp"
#include <optional>
#include <string>

class HttpClient;

struct IpInfoSettings {
  std::string url = "https://ipinfo.io/json";
  std::optional<std::string> token;
  int timeout_ms = 5000;
  int max_attempts = 1;
  int retry_delay_ms = 250;
};

// Parses an ipinfo.io body, e.g. {"loc":"57.6491,10.4074",...}.
// Throws OracleError(LocationUnavailable) for malformed JSON, a missing or
// malformed "loc", or coordinates out of range.
Coordinate ParseIpInfoBody(const std::string& body);

// IP geolocation through a single HTTPS GET per attempt.
class IpInfoLocationProvider : public LocationProvider {
public:
  IpInfoLocationProvider(HttpClient& http, IpInfoSettings settings);
  Coordinate CurrentLocation() override;
private:
  Coordinate FetchOnce();
  HttpClient& http_;
  IpInfoSettings settings_;
};
