#include "crypto/keypair_generator.hpp"

namespace Crypto {
  SeedKeyPairGenerator::SeedKeyPairGenerator(RandomSource& random, const Signer& signer)
    : random_(random), signer_(signer) {}

  KeyPair SeedKeyPairGenerator::Generate() {
    KeyPair kp;
    kp.secret.CleanNew(kSecretKeySize);
    random_.Fill(kp.secret.data(), kp.secret.size());
    kp.public_key = signer_.DerivePublicKey(kp.secret);
    return kp;
  }
}
