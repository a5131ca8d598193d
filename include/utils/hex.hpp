#pragma once
#include <string>
#include <vector>
#include <optional>
#include <cstddef>
#include <cryptopp/misc.h>

inline std::string Strip0x(const std::string& s) {
  if (s.rfind("0x", 0) == 0 || s.rfind("0X", 0) == 0) return s.substr(2);
  return s;
}

inline int HexDigitValue(char c) {
  if (c >= '0' && c <= '9') return c - '0';
  if (c >= 'a' && c <= 'f') return 10 + c - 'a';
  if (c >= 'A' && c <= 'F') return 10 + c - 'A';
  return -1;
}

// Strict decode of 0x-prefixed or bare hex. nullopt on odd length or a non-hex digit.
// Key material passes through here, so the working copy and any partial output
// are wiped before returning.
inline std::optional<std::vector<unsigned char>> TryHexToBytes(const std::string& hex) {
  std::string s = Strip0x(hex);
  std::optional<std::vector<unsigned char>> result;
  if (s.size() % 2 == 0) {
    std::vector<unsigned char> out(s.size() / 2);
    bool ok = true;
    for (size_t i = 0; ok && i < s.size(); i += 2) {
      int hi = HexDigitValue(s[i]), lo = HexDigitValue(s[i + 1]);
      if (hi < 0 || lo < 0) ok = false;
      else out[i / 2] = static_cast<unsigned char>((hi << 4) | lo);
    }
    if (ok) result = std::move(out);
    else CryptoPP::SecureWipeBuffer(out.data(), out.size());
  }
  if (!s.empty()) CryptoPP::SecureWipeBuffer(&s[0], s.size());
  return result;
}

// Lowercase, two digits per byte, leading zero bytes kept.
inline std::string BytesToHex(const unsigned char* data, size_t len) {
  static const char* hex = "0123456789abcdef";
  std::string out;
  out.reserve(len * 2);
  for (size_t i = 0; i < len; ++i) { unsigned char b = data[i]; out += hex[b >> 4]; out += hex[b & 0xF]; }
  return out;
}

inline std::string BytesToHex0x(const std::vector<unsigned char>& data) {
  return "0x" + BytesToHex(data.data(), data.size());
}
