#include "crypto/blake2b.hpp"
#include "common/errors.hpp"
#include <cryptopp/blake2.h>

namespace Crypto {
  Blake2b256Hasher::Blake2b256Hasher(const Bytes& key) {
    if (key.empty() || key.size() > kMaxKeySize)
      throw OracleError(ErrorKind::InvalidKey, "BLAKE2b key must be 1-64 bytes, got " + std::to_string(key.size()));
    key_.Assign(key.data(), key.size());
  }

  std::string Blake2b256Hasher::Name() const {
    return Keyed() ? std::string(kName) + "-keyed" : std::string(kName);
  }

  Bytes Blake2b256Hasher::Hash(const Bytes& message) const {
    Bytes digest(kDigestSize);
    if (Keyed()) {
      CryptoPP::BLAKE2b hash(key_.data(), key_.size(), nullptr, 0, nullptr, 0, false, kDigestSize);
      hash.CalculateDigest(digest.data(), message.data(), message.size());
    } else {
      CryptoPP::BLAKE2b hash(false, kDigestSize);
      hash.CalculateDigest(digest.data(), message.data(), message.size());
    }
    return digest;
  }
}
