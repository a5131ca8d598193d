#include "attestation/canonical_payload.hpp"
#include "common/errors.hpp"
#include "geo/geohash.hpp"

namespace Attestation {
  std::vector<unsigned char> CanonicalPayload(const std::string& geohash) {
    if (!Geohash::IsValid(geohash)) {
      throw OracleError(ErrorKind::InvalidGeohash, "refusing to canonicalize '" + geohash + "'");
    }
    return std::vector<unsigned char>(geohash.begin(), geohash.end());
  }
}
