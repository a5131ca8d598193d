#pragma once

struct Coordinate {
  double latitude = 0.0;
  double longitude = 0.0;
};

constexpr double kLatitudeMin = -90.0;
constexpr double kLatitudeMax = 90.0;
constexpr double kLongitudeMin = -180.0;
constexpr double kLongitudeMax = 180.0;

// False for NaN as well as out-of-range values.
inline bool IsValidCoordinate(double latitude, double longitude) {
  return latitude >= kLatitudeMin && latitude <= kLatitudeMax &&
         longitude >= kLongitudeMin && longitude <= kLongitudeMax;
}
