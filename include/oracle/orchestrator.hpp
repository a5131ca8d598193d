#pragma once
#include "crypto/hasher.hpp"
#include "crypto/keypair_generator.hpp"
#include "crypto/signer.hpp"
#include <string>

class LocationProvider;

// Result of a successful run. The signature covers Hash(CanonicalPayload(geohash)).
struct LocationAttestation {
  std::string geohash;
  std::string digest_algorithm;
  Crypto::Bytes digest;
  Crypto::Bytes signature;
};

// Wires location -> geohash -> canonical payload -> digest -> signature.
// Holds references only; every collaborator must outlive the orchestrator.
class Orchestrator {
public:
  Orchestrator(LocationProvider& location,
               const Crypto::Hasher& hasher,
               const Crypto::Signer& signer,
               const Crypto::Verifier& verifier,
               Crypto::KeyPairGenerator& keygen);

  Crypto::KeyPair Generate();

  // All-or-nothing. The key is taken by value and wiped when this call returns.
  // Precision is checked before the location lookup.
  LocationAttestation Run(Crypto::SecretKey key, int precision);

  // Signs an already known geohash; the pipeline minus the lookup.
  LocationAttestation SignGeohash(const Crypto::SecretKey& key, const std::string& geohash) const;

  // True iff signature is valid for geohash under public_key and, when challenge is
  // non-empty, geohash lies inside the challenge cell. Never throws on bad input.
  bool Verify(const Crypto::Bytes& public_key, const std::string& geohash,
              const Crypto::Bytes& signature, const std::string& challenge = "") const;
private:
  LocationProvider& location_;
  const Crypto::Hasher& hasher_;
  const Crypto::Signer& signer_;
  const Crypto::Verifier& verifier_;
  Crypto::KeyPairGenerator& keygen_;
};
