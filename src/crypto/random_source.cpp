#include "crypto/random_source.hpp"
#include "common/errors.hpp"
#include <cryptopp/osrng.h>

namespace Crypto {
  void OsRandomSource::Fill(unsigned char* out, size_t len) {
    try {
      CryptoPP::OS_GenerateRandomBlock(false, out, len);
    } catch (const CryptoPP::Exception& e) {
      throw OracleError(ErrorKind::RandomnessUnavailable, std::string("OS random source failed: ") + e.what());
    }
  }
}
