#pragma once
#include "crypto/hasher.hpp"
#include <cryptopp/secblock.h>

namespace Crypto {
  // BLAKE2b truncated to a 32-byte digest. Unkeyed unless a key is supplied;
  // the mode cannot change after construction.
  class Blake2b256Hasher : public Hasher {
  public:
    static constexpr const char* kName = "blake2b-256";
    static constexpr size_t kMaxKeySize = 64;
    Blake2b256Hasher() = default;
    // Keyed mode. Throws OracleError(InvalidKey) unless 1 <= key.size() <= 64.
    explicit Blake2b256Hasher(const Bytes& key);
    std::string Name() const override;
    Bytes Hash(const Bytes& message) const override;
    bool Keyed() const { return !key_.empty(); }
  private:
    CryptoPP::SecByteBlock key_;
  };
}
