#include "crypto/keccak.hpp"
#include <cryptopp/keccak.h>

namespace Crypto {
  Bytes Keccak256Hasher::Hash(const Bytes& message) const {
    CryptoPP::Keccak_256 hash;
    Bytes digest(kDigestSize);
    hash.CalculateDigest(digest.data(), message.data(), message.size());
    return digest;
  }
}
