#pragma once
#include "geo/coordinate.hpp"

class LocationProvider {
public:
  virtual ~LocationProvider() = default;
  // Blocks until a position is known. Throws OracleError(LocationUnavailable).
  virtual Coordinate CurrentLocation() = 0;
};
