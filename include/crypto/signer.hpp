#pragma once
#include "crypto/hasher.hpp"
#include <cryptopp/secblock.h>

namespace Crypto {
  constexpr size_t kSecretKeySize = 32;
  constexpr size_t kPublicKeySize = 32;
  constexpr size_t kSignatureSize = 64;

  // Secret bytes live in a SecByteBlock so they are wiped when the owner goes away.
  using SecretKey = CryptoPP::SecByteBlock;

  struct KeyPair {
    SecretKey secret;
    Bytes public_key;
  };

  class Signer {
  public:
    virtual ~Signer() = default;
    // Deterministic. Throws OracleError(InvalidKey) for a malformed secret.
    virtual Bytes Sign(const SecretKey& secret, const Bytes& message) const = 0;
    virtual Bytes DerivePublicKey(const SecretKey& secret) const = 0;
  };

  class Verifier {
  public:
    virtual ~Verifier() = default;
    // Total: malformed keys or signatures verify false, never throw.
    virtual bool Verify(const Bytes& public_key, const Bytes& message, const Bytes& signature) const = 0;
  };
}
