#pragma once
#include "crypto/signer.hpp"
#include "oracle/orchestrator.hpp"
#include <string>

namespace OutputFormat {
  // "Private=0x<64 hex>\nPublic=0x<64 hex>"
  std::string FormatKeyPair(const Crypto::KeyPair& kp);

  // JSON array of the raw signature bytes, e.g. [12,255,...], no whitespace.
  std::string FormatSignatureJson(const Crypto::Bytes& signature);

  // {"geohash":"u4pruy","signature":[...]}
  std::string FormatAttestationJson(const LocationAttestation& attestation);

  // Accepts the JSON array form (values 0-255) or 0x/bare hex.
  // Throws OracleError(InvalidSignature) for anything else. Length is not checked.
  Crypto::Bytes ParseSignature(const std::string& text);
}
