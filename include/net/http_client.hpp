#pragma once
#include <string>
#include <unordered_map>

struct HttpResponse {
  long status = 0;        // 0 when the transfer itself failed
  std::string body;
  std::string error;      // transport error text, empty on success
};

class HttpClient {
public:
  virtual ~HttpClient() = default;
  virtual HttpResponse Get(const std::string& url,
                           const std::unordered_map<std::string, std::string>& headers,
                           int timeout_ms) = 0;
};

// Factory for a libcurl-based client with TLS peer verification on.
HttpClient* CreateCurlHttpClient();
