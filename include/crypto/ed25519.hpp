#pragma once
#include "crypto/signer.hpp"

namespace Crypto {
  // RFC 8032 Ed25519 (pure, no prehash). Any 32-byte seed is a valid secret key.
  class Ed25519Signer : public Signer {
  public:
    Bytes Sign(const SecretKey& secret, const Bytes& message) const override;
    Bytes DerivePublicKey(const SecretKey& secret) const override;
  };

  class Ed25519Verifier : public Verifier {
  public:
    bool Verify(const Bytes& public_key, const Bytes& message, const Bytes& signature) const override;
  };
}
