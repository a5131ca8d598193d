#pragma once
#include <string>
#include <vector>

namespace Attestation {
  // Bytes that are hashed and signed for a geohash claim: the ASCII characters of
  // the geohash, in order, with no length prefix, padding, terminator or case folding.
  // Throws OracleError(InvalidGeohash) unless Geohash::IsValid(geohash).
  std::vector<unsigned char> CanonicalPayload(const std::string& geohash);
}
