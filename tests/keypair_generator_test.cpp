#include "crypto/keypair_generator.hpp"
#include "crypto/ed25519.hpp"
#include "common/errors.hpp"
#include "test_doubles.hpp"
#include <gtest/gtest.h>

TEST(SeedKeyPairGenerator, DerivesPublicKeyFromInjectedSeed) {
  FixedRandomSource random(Hex(kRfcSecretHex));
  Crypto::Ed25519Signer signer;
  Crypto::SeedKeyPairGenerator gen(random, signer);
  const Crypto::KeyPair kp = gen.Generate();
  EXPECT_EQ(Crypto::Bytes(kp.secret.begin(), kp.secret.end()), Hex(kRfcSecretHex));
  EXPECT_EQ(kp.public_key, Hex(kRfcPublicHex));
}

TEST(SeedKeyPairGenerator, GeneratedPairSignsAndVerifies) {
  Crypto::OsRandomSource random;
  Crypto::Ed25519Signer signer;
  Crypto::Ed25519Verifier verifier;
  Crypto::SeedKeyPairGenerator gen(random, signer);
  const Crypto::KeyPair a = gen.Generate();
  const Crypto::KeyPair b = gen.Generate();
  EXPECT_NE(a.public_key, b.public_key);

  const Crypto::Bytes msg(32, 7);
  const Crypto::Bytes sig = signer.Sign(a.secret, msg);
  EXPECT_TRUE(verifier.Verify(a.public_key, msg, sig));
  EXPECT_FALSE(verifier.Verify(b.public_key, msg, sig));
}

TEST(SeedKeyPairGenerator, PropagatesMissingRandomness) {
  BrokenRandomSource random;
  Crypto::Ed25519Signer signer;
  Crypto::SeedKeyPairGenerator gen(random, signer);
  try {
    gen.Generate();
    FAIL() << "generated a key without randomness";
  } catch (const OracleError& e) {
    EXPECT_EQ(e.Kind(), ErrorKind::RandomnessUnavailable);
  }
}
