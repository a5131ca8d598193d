#pragma once
#include <cstddef>

namespace Crypto {
  class RandomSource {
  public:
    virtual ~RandomSource() = default;
    // Fills out[0..len) or throws OracleError(RandomnessUnavailable).
    virtual void Fill(unsigned char* out, size_t len) = 0;
  };

  // Operating system CSPRNG (/dev/urandom, getrandom or CryptGenRandom via Crypto++).
  class OsRandomSource : public RandomSource {
  public:
    void Fill(unsigned char* out, size_t len) override;
  };
}
