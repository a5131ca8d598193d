#pragma once
#include "geo/coordinate.hpp"
#include <string>

namespace Geohash {
  constexpr int kMinPrecision = 1;
  constexpr int kMaxPrecision = 12;
  constexpr int kBitsPerChar = 5;
  constexpr const char* kAlphabet = "0123456789bcdefghjkmnpqrstuvwxyz";

  struct Bounds {
    double min_lat;
    double max_lat;
    double min_lon;
    double max_lon;
  };

  bool IsValidPrecision(int precision);

  // Standard interleaved-bit geohash, longitude bit first, precision characters long.
  // Throws OracleError(InvalidPrecision) outside [1,12] and OracleError(InvalidCoordinate)
  // for latitude outside [-90,90] or longitude outside [-180,180].
  std::string Encode(double latitude, double longitude, int precision);
  inline std::string Encode(const Coordinate& c, int precision) { return Encode(c.latitude, c.longitude, precision); }

  // Non-empty, at most kMaxPrecision characters, all from kAlphabet (lowercase only).
  bool IsValid(const std::string& hash);

  // Cell covered by hash. Throws OracleError(InvalidGeohash) if !IsValid(hash).
  Bounds DecodeBounds(const std::string& hash);
  // Centre of the cell.
  Coordinate Decode(const std::string& hash);

  // True if the cell named by hash lies inside the cell named by area.
  bool Contains(const std::string& area, const std::string& hash);
}
