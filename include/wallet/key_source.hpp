#pragma once
#include "crypto/signer.hpp"
#include <optional>
#include <string>

namespace KeySource {
  // 0x-prefixed or bare hex, exactly 64 digits. Throws OracleError(InvalidKey).
  Crypto::SecretKey ParseSecretKeyHex(const std::string& hex);

  // The flag value wins over the environment value. A flag that is present but
  // malformed is an error rather than a reason to fall back.
  // Throws OracleError(MissingKey) when both are absent or empty.
  Crypto::SecretKey ResolveSecretKey(const std::optional<std::string>& flag_value,
                                     const std::optional<std::string>& env_value);

  // Zeroes the text in place and resets it to nullopt.
  void WipeKeyText(std::optional<std::string>& text);

  // Lowercase 0x-prefixed hex, 2 digits per byte, leading zeros kept.
  std::string FormatKeyHex(const unsigned char* data, size_t len);
}
