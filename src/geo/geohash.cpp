#include "geo/geohash.hpp"
#include "common/errors.hpp"
#include <cstdint>
#include <cstring>
#include <sstream>

namespace Geohash {
  static_assert(sizeof(uint64_t) * 8 >= kMaxPrecision * kBitsPerChar, "hash bits do not fit in 64 bits");

  static int AlphabetIndex(char c) {
    const char* p = std::strchr(kAlphabet, c);
    if (c == '\0' || p == nullptr) return -1;
    return static_cast<int>(p - kAlphabet);
  }

  bool IsValidPrecision(int precision) {
    return precision >= kMinPrecision && precision <= kMaxPrecision;
  }

  std::string Encode(double latitude, double longitude, int precision) {
    if (!IsValidPrecision(precision)) {
      throw OracleError(ErrorKind::InvalidPrecision, "precision " + std::to_string(precision) + " outside [1,12]");
    }
    if (!IsValidCoordinate(latitude, longitude)) {
      std::ostringstream oss;
      oss << "coordinate (" << latitude << ", " << longitude << ") out of range";
      throw OracleError(ErrorKind::InvalidCoordinate, oss.str());
    }
    double lat_lo = kLatitudeMin, lat_hi = kLatitudeMax;
    double lon_lo = kLongitudeMin, lon_hi = kLongitudeMax;
    uint64_t bits = 0;
    bool lon_bit = true;
    const int total_bits = precision * kBitsPerChar;
    for (int i = 0; i < total_bits; ++i) {
      if (lon_bit) {
        const double mid = lon_lo + (lon_hi - lon_lo) / 2;
        if (longitude >= mid) { bits = (bits << 1) | 1; lon_lo = mid; }
        else { bits <<= 1; lon_hi = mid; }
      } else {
        const double mid = lat_lo + (lat_hi - lat_lo) / 2;
        if (latitude >= mid) { bits = (bits << 1) | 1; lat_lo = mid; }
        else { bits <<= 1; lat_hi = mid; }
      }
      lon_bit = !lon_bit;
    }
    std::string out;
    out.reserve(precision);
    for (int i = 0; i < precision; ++i) {
      const unsigned idx = static_cast<unsigned>((bits >> ((precision - 1 - i) * kBitsPerChar)) & 0x1F);
      out.push_back(kAlphabet[idx]);
    }
    return out;
  }

  bool IsValid(const std::string& hash) {
    if (hash.empty() || hash.size() > static_cast<size_t>(kMaxPrecision)) return false;
    for (char c : hash) {
      if (AlphabetIndex(c) < 0) return false;
    }
    return true;
  }

  Bounds DecodeBounds(const std::string& hash) {
    if (!IsValid(hash)) throw OracleError(ErrorKind::InvalidGeohash, "not a geohash: '" + hash + "'");
    Bounds b{kLatitudeMin, kLatitudeMax, kLongitudeMin, kLongitudeMax};
    bool lon_bit = true;
    for (char c : hash) {
      const int idx = AlphabetIndex(c);
      for (int bit = kBitsPerChar - 1; bit >= 0; --bit) {
        const bool set = ((idx >> bit) & 1) != 0;
        if (lon_bit) {
          const double mid = b.min_lon + (b.max_lon - b.min_lon) / 2;
          if (set) b.min_lon = mid; else b.max_lon = mid;
        } else {
          const double mid = b.min_lat + (b.max_lat - b.min_lat) / 2;
          if (set) b.min_lat = mid; else b.max_lat = mid;
        }
        lon_bit = !lon_bit;
      }
    }
    return b;
  }

  Coordinate Decode(const std::string& hash) {
    const Bounds b = DecodeBounds(hash);
    return Coordinate{b.min_lat + (b.max_lat - b.min_lat) / 2, b.min_lon + (b.max_lon - b.min_lon) / 2};
  }

  bool Contains(const std::string& area, const std::string& hash) {
    if (!IsValid(area) || !IsValid(hash)) return false;
    return hash.size() >= area.size() && hash.compare(0, area.size(), area) == 0;
  }
}
