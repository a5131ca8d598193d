#include "crypto/hasher.hpp"
#include "crypto/blake2b.hpp"
#include "crypto/keccak.hpp"
#include "common/errors.hpp"

namespace Crypto {
  std::unique_ptr<Hasher> CreateHasher(const std::string& name) {
    if (name == Blake2b256Hasher::kName) return std::unique_ptr<Hasher>(new Blake2b256Hasher());
    if (name == Keccak256Hasher::kName) return std::unique_ptr<Hasher>(new Keccak256Hasher());
    throw OracleError(ErrorKind::UsageError, "unknown digest algorithm '" + name + "'");
  }
}
