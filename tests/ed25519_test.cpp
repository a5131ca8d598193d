#include "crypto/ed25519.hpp"
#include "common/errors.hpp"
#include "wallet/key_source.hpp"
#include "test_doubles.hpp"
#include <gtest/gtest.h>

using Crypto::Bytes;

class Ed25519Test : public ::testing::Test {
protected:
  Crypto::SecretKey secret_ = KeySource::ParseSecretKeyHex(kRfcSecretHex);
  Bytes public_ = Hex(kRfcPublicHex);
  Crypto::Ed25519Signer signer_;
  Crypto::Ed25519Verifier verifier_;
};

TEST_F(Ed25519Test, Rfc8032EmptyMessage) {
  EXPECT_EQ(signer_.DerivePublicKey(secret_), public_);
  EXPECT_EQ(signer_.Sign(secret_, Bytes{}),
            Hex("e5564300c360ac729086e2cc806e828a84877f1eb8e5d974d873e065224901555fb8821590a33bacc61e39701cf9b46bd25bf5f0595bbe24655141438e7a100b"));
}

TEST_F(Ed25519Test, Rfc8032OneByteMessage) {
  const Crypto::SecretKey sk = KeySource::ParseSecretKeyHex("4ccd089b28ff96da9db6c346ec114e0f5b8a319f35aba624da8cf6ed4fb8a6fb");
  const Bytes pk = Hex("3d4017c3e843895a92b70aa74d1b7ebc9c982ccf2ec4968cc0cd55f12af4660c");
  const Bytes sig = signer_.Sign(sk, Bytes{0x72});
  EXPECT_EQ(signer_.DerivePublicKey(sk), pk);
  EXPECT_EQ(sig, Hex("92a009a9f0d4cab8720e820b5f642540a2b27b5416503f8fb3762223ebdb69da085ac1e43e15996e458f3613d0f11d8c387b2eaeb4302aeeb00d291612bb0c00"));
  EXPECT_TRUE(verifier_.Verify(pk, Bytes{0x72}, sig));
}

TEST_F(Ed25519Test, SigningIsDeterministic) {
  const Bytes msg(32, 0xab);
  EXPECT_EQ(signer_.Sign(secret_, msg), signer_.Sign(secret_, msg));
  EXPECT_EQ(signer_.Sign(secret_, msg).size(), Crypto::kSignatureSize);
}

TEST_F(Ed25519Test, VerifyRejectsAnySingleByteChange) {
  const Bytes msg(32, 0x11);
  const Bytes sig = signer_.Sign(secret_, msg);
  ASSERT_TRUE(verifier_.Verify(public_, msg, sig));

  Bytes bad_sig = sig; bad_sig[10] ^= 0x01;
  Bytes bad_msg = msg; bad_msg[0] ^= 0x80;
  Bytes bad_pub = public_; bad_pub[31] ^= 0x02;
  EXPECT_FALSE(verifier_.Verify(public_, msg, bad_sig));
  EXPECT_FALSE(verifier_.Verify(public_, bad_msg, sig));
  EXPECT_FALSE(verifier_.Verify(bad_pub, msg, sig));
}

TEST_F(Ed25519Test, VerifyIsTotalOnMalformedInput) {
  const Bytes msg{'x'};
  const Bytes sig = signer_.Sign(secret_, msg);
  EXPECT_FALSE(verifier_.Verify(Bytes{}, msg, sig));
  EXPECT_FALSE(verifier_.Verify(Bytes(31, 1), msg, sig));
  EXPECT_FALSE(verifier_.Verify(public_, msg, Bytes{}));
  EXPECT_FALSE(verifier_.Verify(public_, msg, Bytes(63, 0)));
  EXPECT_FALSE(verifier_.Verify(Bytes(32, 0xff), msg, sig));
  EXPECT_FALSE(verifier_.Verify(public_, msg, Bytes(64, 0xff)));
}

TEST_F(Ed25519Test, WrongKeySizeIsInvalidKey) {
  Crypto::SecretKey short_key(16);
  try {
    signer_.Sign(short_key, Bytes{1});
    FAIL() << "short key accepted";
  } catch (const OracleError& e) {
    EXPECT_EQ(e.Kind(), ErrorKind::InvalidKey);
  }
}

namespace {
// Adds L to the little-endian scalar half of a signature.
Bytes WithScalarPlusGroupOrder(Bytes sig) {
  static const unsigned char order[32] = {
    0xed, 0xd3, 0xf5, 0x5c, 0x1a, 0x63, 0x12, 0x58, 0xd6, 0x9c, 0xf7, 0xa2, 0xde, 0xf9, 0xde, 0x14,
    0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x10};
  unsigned carry = 0;
  for (size_t i = 0; i < 32; ++i) {
    const unsigned sum = sig[32 + i] + order[i] + carry;
    sig[32 + i] = static_cast<unsigned char>(sum & 0xff);
    carry = sum >> 8;
  }
  return sig;
}
}

TEST_F(Ed25519Test, VerifyRejectsNonCanonicalScalar) {
  const Bytes sig = signer_.Sign(secret_, Bytes{});
  ASSERT_TRUE(verifier_.Verify(public_, Bytes{}, sig));

  const Bytes twin = WithScalarPlusGroupOrder(sig);
  EXPECT_EQ(twin, Hex("e5564300c360ac729086e2cc806e828a84877f1eb8e5d974d873e06522490155"
                      "4c8c7872aa064e049dbb3013fbf29380d25bf5f0595bbe24655141438e7a101b"));
  EXPECT_EQ(twin[63] & 0xe0, 0);
  EXPECT_FALSE(verifier_.Verify(public_, Bytes{}, twin));

  Bytes scalar_is_order(sig.begin(), sig.begin() + 32);
  scalar_is_order.resize(64, 0);
  EXPECT_FALSE(verifier_.Verify(public_, Bytes{}, WithScalarPlusGroupOrder(scalar_is_order)));
}
