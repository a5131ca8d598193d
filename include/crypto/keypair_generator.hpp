#pragma once
#include "crypto/signer.hpp"
#include "crypto/random_source.hpp"

namespace Crypto {
  class KeyPairGenerator {
  public:
    virtual ~KeyPairGenerator() = default;
    virtual KeyPair Generate() = 0;
  };

  // Draws a fresh 32-byte seed from the random source and derives the public key
  // through the signer.
  class SeedKeyPairGenerator : public KeyPairGenerator {
  public:
    SeedKeyPairGenerator(RandomSource& random, const Signer& signer);
    KeyPair Generate() override;
  private:
    RandomSource& random_;
    const Signer& signer_;
  };
}
