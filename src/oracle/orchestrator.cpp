#include "oracle/orchestrator.hpp"
#include "attestation/canonical_payload.hpp"
#include "common/errors.hpp"
#include "common/logger.hpp"
#include "geo/geohash.hpp"
#include "location/location_provider.hpp"
#include "utils/hex.hpp"

Orchestrator::Orchestrator(LocationProvider& location,
                           const Crypto::Hasher& hasher,
                           const Crypto::Signer& signer,
                           const Crypto::Verifier& verifier,
                           Crypto::KeyPairGenerator& keygen)
  : location_(location), hasher_(hasher), signer_(signer), verifier_(verifier), keygen_(keygen) {}

Crypto::KeyPair Orchestrator::Generate() {
  Crypto::KeyPair kp = keygen_.Generate();
  Logger::Info("Generated key pair, public key " + BytesToHex0x(kp.public_key));
  return kp;
}

LocationAttestation Orchestrator::Run(Crypto::SecretKey key, int precision) {
  if (!Geohash::IsValidPrecision(precision))
    throw OracleError(ErrorKind::InvalidPrecision, "precision " + std::to_string(precision) + " outside [1,12]");
  if (key.size() != Crypto::kSecretKeySize)
    throw OracleError(ErrorKind::InvalidKey, "secret key must be 32 bytes");

  const Coordinate here = location_.CurrentLocation();
  const std::string geohash = Geohash::Encode(here, precision);
  Logger::Info("Encoded current location at precision " + std::to_string(precision));
  Logger::Debug("Geohash " + geohash);
  return SignGeohash(key, geohash);
}

LocationAttestation Orchestrator::SignGeohash(const Crypto::SecretKey& key, const std::string& geohash) const {
  LocationAttestation out;
  out.geohash = geohash;
  out.digest_algorithm = hasher_.Name();
  out.digest = hasher_.Hash(Attestation::CanonicalPayload(geohash));
  out.signature = signer_.Sign(key, out.digest);
  Logger::Info("Signed " + out.digest_algorithm + " digest " + BytesToHex0x(out.digest));
  return out;
}

bool Orchestrator::Verify(const Crypto::Bytes& public_key, const std::string& geohash,
                          const Crypto::Bytes& signature, const std::string& challenge) const {
  if (!Geohash::IsValid(geohash)) {
    Logger::Info("Rejecting claim: malformed geohash");
    return false;
  }
  if (!challenge.empty() && !Geohash::Contains(challenge, geohash)) {
    Logger::Info("Rejecting claim: geohash outside challenge " + challenge);
    return false;
  }
  const Crypto::Bytes digest = hasher_.Hash(Attestation::CanonicalPayload(geohash));
  const bool ok = verifier_.Verify(public_key, digest, signature);
  Logger::Info(std::string("Signature ") + (ok ? "valid" : "invalid") + " for public key " + BytesToHex0x(public_key));
  return ok;
}
