#include "oracle/output_format.hpp"
#include "common/errors.hpp"
#include "utils/hex.hpp"
#include "wallet/key_source.hpp"
#include <nlohmann/json.hpp>

namespace OutputFormat {
  std::string FormatKeyPair(const Crypto::KeyPair& kp) {
    return "Private=" + KeySource::FormatKeyHex(kp.secret.data(), kp.secret.size()) + "\n" +
           "Public=" + KeySource::FormatKeyHex(kp.public_key.data(), kp.public_key.size());
  }

  std::string FormatSignatureJson(const Crypto::Bytes& signature) {
    return nlohmann::json(signature).dump();
  }

  std::string FormatAttestationJson(const LocationAttestation& attestation) {
    nlohmann::json j;
    j["geohash"] = attestation.geohash;
    j["signature"] = attestation.signature;
    return j.dump();
  }

  Crypto::Bytes ParseSignature(const std::string& text) {
    const auto first = text.find_first_not_of(" \t\r\n");
    if (first != std::string::npos && text[first] == '[') {
      Crypto::Bytes out;
      try {
        const auto j = nlohmann::json::parse(text);
        for (const auto& v : j) {
          if (!v.is_number_unsigned() || v.get<unsigned>() > 255)
            throw OracleError(ErrorKind::InvalidSignature, "signature array holds a non-byte value");
          out.push_back(static_cast<unsigned char>(v.get<unsigned>()));
        }
      } catch (const nlohmann::json::exception& e) {
        throw OracleError(ErrorKind::InvalidSignature, std::string("unparsable signature array: ") + e.what());
      }
      return out;
    }
    auto bytes = TryHexToBytes(text);
    if (!bytes || bytes->empty()) throw OracleError(ErrorKind::InvalidSignature, "signature is neither a JSON byte array nor hex");
    return *bytes;
  }
}
