#include "crypto/ed25519.hpp"
#include "common/errors.hpp"
#include "common/logger.hpp"
#include <cryptopp/cryptlib.h>
#include <cryptopp/xed25519.h>

namespace Crypto {
  // Group order L = 2^252 + 27742317777372353535851937790883648493, little-endian.
  static const unsigned char kGroupOrder[32] = {
    0xed, 0xd3, 0xf5, 0x5c, 0x1a, 0x63, 0x12, 0x58, 0xd6, 0x9c, 0xf7, 0xa2, 0xde, 0xf9, 0xde, 0x14,
    0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x10};

  // S is the little-endian scalar in signature[32..64). Crypto++ reduces it mod L
  // instead of rejecting it, which would let R||(S+L) verify.
  static bool IsCanonicalScalar(const unsigned char* s) {
    for (int i = 31; i >= 0; --i) {
      if (s[i] < kGroupOrder[i]) return true;
      if (s[i] > kGroupOrder[i]) return false;
    }
    return false;
  }

  static void RequireSecretSize(const SecretKey& secret) {
    if (secret.size() != kSecretKeySize)
      throw OracleError(ErrorKind::InvalidKey, "Ed25519 secret key must be 32 bytes, got " + std::to_string(secret.size()));
  }

  Bytes Ed25519Signer::Sign(const SecretKey& secret, const Bytes& message) const {
    RequireSecretSize(secret);
    try {
      CryptoPP::ed25519Signer signer(secret.data());
      Bytes sig(signer.MaxSignatureLength());
      // Ed25519 nonces are derived from the key and message; the RNG is never consulted.
      const size_t len = signer.SignMessage(CryptoPP::NullRNG(), message.data(), message.size(), sig.data());
      sig.resize(len);
      return sig;
    } catch (const CryptoPP::Exception& e) {
      throw OracleError(ErrorKind::InvalidKey, std::string("Ed25519 signing failed: ") + e.what());
    }
  }

  Bytes Ed25519Signer::DerivePublicKey(const SecretKey& secret) const {
    RequireSecretSize(secret);
    try {
      CryptoPP::ed25519Signer signer(secret.data());
      const auto& key = dynamic_cast<const CryptoPP::ed25519PrivateKey&>(signer.GetPrivateKey());
      const CryptoPP::byte* pub = key.GetPublicKeyBytePtr();
      return Bytes(pub, pub + kPublicKeySize);
    } catch (const CryptoPP::Exception& e) {
      throw OracleError(ErrorKind::InvalidKey, std::string("Ed25519 key derivation failed: ") + e.what());
    }
  }

  bool Ed25519Verifier::Verify(const Bytes& public_key, const Bytes& message, const Bytes& signature) const {
    if (public_key.size() != kPublicKeySize || signature.size() != kSignatureSize) return false;
    if (!IsCanonicalScalar(signature.data() + 32)) return false;
    try {
      CryptoPP::ed25519Verifier verifier(public_key.data());
      return verifier.VerifyMessage(message.data(), message.size(), signature.data(), signature.size());
    } catch (const CryptoPP::Exception& e) {
      Logger::Debug(std::string("Ed25519 verification rejected input: ") + e.what());
      return false;
    }
  }
}
