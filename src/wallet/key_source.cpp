#include "wallet/key_source.hpp"
#include "common/errors.hpp"
#include "utils/hex.hpp"
#include <cryptopp/misc.h>

namespace KeySource {
  static Crypto::Bytes DecodeKey(const std::string& hex, size_t expected, const char* what) {
    auto bytes = TryHexToBytes(hex);
    if (!bytes) throw OracleError(ErrorKind::InvalidKey, std::string(what) + " is not valid hex");
    if (bytes->size() != expected) {
      const size_t got = bytes->size();
      CryptoPP::SecureWipeBuffer(bytes->data(), bytes->size());
      throw OracleError(ErrorKind::InvalidKey, std::string(what) + " must be " + std::to_string(expected) +
                                               " bytes, got " + std::to_string(got));
    }
    return std::move(*bytes);
  }

  Crypto::SecretKey ParseSecretKeyHex(const std::string& hex) {
    Crypto::Bytes raw = DecodeKey(hex, Crypto::kSecretKeySize, "secret key");
    Crypto::SecretKey key(raw.data(), raw.size());
    CryptoPP::SecureWipeBuffer(raw.data(), raw.size());
    return key;
  }

  Crypto::SecretKey ResolveSecretKey(const std::optional<std::string>& flag_value,
                                     const std::optional<std::string>& env_value) {
    if (flag_value && !flag_value->empty()) return ParseSecretKeyHex(*flag_value);
    if (env_value && !env_value->empty()) return ParseSecretKeyHex(*env_value);
    throw OracleError(ErrorKind::MissingKey, "no key given; pass --key=<hex> or set ORACLE_KEY");
  }

  void WipeKeyText(std::optional<std::string>& text) {
    if (!text) return;
    if (!text->empty()) CryptoPP::SecureWipeBuffer(&(*text)[0], text->size());
    text.reset();
  }

  std::string FormatKeyHex(const unsigned char* data, size_t len) {
    return "0x" + BytesToHex(data, len);
  }
}
