#include "oracle/orchestrator.hpp"
#include "crypto/blake2b.hpp"
#include "crypto/ed25519.hpp"
#include "crypto/keccak.hpp"
#include "wallet/key_source.hpp"
#include "common/errors.hpp"
#include "test_doubles.hpp"
#include <gtest/gtest.h>

namespace {
// Ed25519(RFC 8032 test 1 secret, BLAKE2b-256("u4pruy")).
const char* kU4pruySignatureHex =
  "15445f871449e597794455357f48d40517d2098f441f5badcd5a438bff442cb8"
  "148eac8f4e38d59c4907fedb314ebc5682b68fa1958f446794cb484f0dbcd00d";
}

class OrchestratorTest : public ::testing::Test {
protected:
  FixedLocationProvider location_{Coordinate{57.64911, 10.40744}};
  FixedRandomSource random_{Hex(kRfcSecretHex)};
  Crypto::Blake2b256Hasher hasher_;
  Crypto::Ed25519Signer signer_;
  Crypto::Ed25519Verifier verifier_;
  Crypto::SeedKeyPairGenerator keygen_{random_, signer_};
  Orchestrator orchestrator_{location_, hasher_, signer_, verifier_, keygen_};

  Crypto::SecretKey Key() const { return KeySource::ParseSecretKeyHex(kRfcSecretHex); }
};

TEST_F(OrchestratorTest, RunProducesKnownSignature) {
  const LocationAttestation att = orchestrator_.Run(Key(), 6);
  EXPECT_EQ(att.geohash, "u4pruy");
  EXPECT_EQ(att.digest_algorithm, "blake2b-256");
  EXPECT_EQ(att.digest, Hex("ac02cc725112b24bbaa984d49446b30ab918ea099abd8c4b0a4a50c7b0a789f5"));
  EXPECT_EQ(att.signature, Hex(kU4pruySignatureHex));
  EXPECT_EQ(location_.calls, 1);
}

TEST_F(OrchestratorTest, RunIsDeterministic) {
  EXPECT_EQ(orchestrator_.Run(Key(), 9).signature, orchestrator_.Run(Key(), 9).signature);
}

TEST_F(OrchestratorTest, OutputVerifiesAgainstClaimedGeohash) {
  const LocationAttestation att = orchestrator_.Run(Key(), 8);
  const Crypto::Bytes pub = Hex(kRfcPublicHex);
  EXPECT_TRUE(orchestrator_.Verify(pub, att.geohash, att.signature));
  EXPECT_TRUE(orchestrator_.Verify(pub, att.geohash, att.signature, "u4p"));
  EXPECT_FALSE(orchestrator_.Verify(pub, att.geohash, att.signature, "u4q"));
  EXPECT_FALSE(orchestrator_.Verify(pub, att.geohash.substr(0, 7), att.signature));
  EXPECT_FALSE(orchestrator_.Verify(pub, "not a geohash", att.signature));
}

TEST_F(OrchestratorTest, InvalidPrecisionFailsBeforeLookup) {
  for (int p : {0, 13}) {
    try {
      orchestrator_.Run(Key(), p);
      FAIL() << "precision " << p << " accepted";
    } catch (const OracleError& e) {
      EXPECT_EQ(e.Kind(), ErrorKind::InvalidPrecision);
    }
  }
  EXPECT_EQ(location_.calls, 0);
}

TEST_F(OrchestratorTest, ShortKeyFailsBeforeLookup) {
  EXPECT_THROW(orchestrator_.Run(Crypto::SecretKey(8), 6), OracleError);
  EXPECT_EQ(location_.calls, 0);
}

TEST_F(OrchestratorTest, LocationFailureAbortsRun) {
  FailingLocationProvider failing;
  Orchestrator orchestrator(failing, hasher_, signer_, verifier_, keygen_);
  try {
    orchestrator.Run(Key(), 6);
    FAIL() << "run succeeded without a location";
  } catch (const OracleError& e) {
    EXPECT_EQ(e.Kind(), ErrorKind::LocationUnavailable);
  }
  EXPECT_EQ(failing.calls, 1);
}

TEST_F(OrchestratorTest, OutOfRangeLocationIsInvalidCoordinate) {
  FixedLocationProvider bogus(Coordinate{91.0, 0.0});
  Orchestrator orchestrator(bogus, hasher_, signer_, verifier_, keygen_);
  try {
    orchestrator.Run(Key(), 6);
    FAIL();
  } catch (const OracleError& e) {
    EXPECT_EQ(e.Kind(), ErrorKind::InvalidCoordinate);
  }
}

TEST_F(OrchestratorTest, GenerateUsesInjectedKeyMaterial) {
  const Crypto::KeyPair kp = orchestrator_.Generate();
  EXPECT_EQ(kp.public_key, Hex(kRfcPublicHex));
}

TEST_F(OrchestratorTest, AlternativeHasherChangesDigestNotPipeline) {
  Crypto::Keccak256Hasher keccak;
  Orchestrator orchestrator(location_, keccak, signer_, verifier_, keygen_);
  const LocationAttestation att = orchestrator.Run(Key(), 6);
  EXPECT_EQ(att.geohash, "u4pruy");
  EXPECT_EQ(att.digest_algorithm, "keccak-256");
  EXPECT_NE(att.signature, Hex(kU4pruySignatureHex));
  EXPECT_TRUE(orchestrator.Verify(Hex(kRfcPublicHex), "u4pruy", att.signature));
  EXPECT_FALSE(orchestrator_.Verify(Hex(kRfcPublicHex), "u4pruy", att.signature));
}
