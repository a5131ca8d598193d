#pragma once
#include <memory>
#include <string>
#include <vector>

namespace Crypto {
  using Bytes = std::vector<unsigned char>;

  constexpr size_t kDigestSize = 32;
  // Digest algorithm used when the caller names none. Verifiers assume this.
  constexpr const char* kDefaultHasherName = "blake2b-256";

  class Hasher {
  public:
    virtual ~Hasher() = default;
    virtual std::string Name() const = 0;
    // Always kDigestSize bytes.
    virtual Bytes Hash(const Bytes& message) const = 0;
  };

  // "blake2b-256" or "keccak-256". Throws OracleError(UsageError) for anything else.
  std::unique_ptr<Hasher> CreateHasher(const std::string& name);
}
