#pragma once
#include "crypto/hasher.hpp"
#include <string>

namespace Crypto {
  // Keccak-256 with the pre-FIPS padding, as used by Ethereum tooling.
  class Keccak256Hasher : public Hasher {
  public:
    static constexpr const char* kName = "keccak-256";
    std::string Name() const override { return kName; }
    Bytes Hash(const Bytes& message) const override;
  };
}
