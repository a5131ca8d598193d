#include "cli/app.hpp"
#include "common/errors.hpp"
#include "common/logger.hpp"
#include "crypto/ed25519.hpp"
#include "crypto/keypair_generator.hpp"
#include "location/location_provider.hpp"
#include "oracle/orchestrator.hpp"
#include "oracle/output_format.hpp"
#include "utils/hex.hpp"
#include "wallet/key_source.hpp"
#include <ostream>

namespace {
int DoGenerate(Orchestrator& orchestrator, std::ostream& out) {
  const Crypto::KeyPair kp = orchestrator.Generate();
  out << OutputFormat::FormatKeyPair(kp) << '\n';
  return 0;
}

int DoRun(const CommandLine& cmd, Orchestrator& orchestrator, Crypto::SecretKey key, std::ostream& out) {
  const LocationAttestation att = orchestrator.Run(std::move(key), cmd.accuracy);
  out << (cmd.with_geohash ? OutputFormat::FormatAttestationJson(att)
                           : OutputFormat::FormatSignatureJson(att.signature)) << '\n';
  return 0;
}

int DoVerify(const CommandLine& cmd, Orchestrator& orchestrator, std::ostream& out) {
  // Text that is not hex is a usage mistake; hex of the wrong length is a key that
  // does not verify.
  const auto pub = TryHexToBytes(cmd.public_key);
  if (!pub) throw OracleError(ErrorKind::InvalidKey, "public key is not valid hex");
  const Crypto::Bytes sig = OutputFormat::ParseSignature(cmd.signature);
  const bool ok = orchestrator.Verify(*pub, cmd.geohash, sig, cmd.challenge);
  out << (ok ? "valid" : "invalid") << '\n';
  return ok ? 0 : 1;
}
}

int RunApp(CommandLine& cmd, AppContext& ctx, std::ostream& out, std::ostream& err) {
  try {
    // Resolve the key before anything touches the network.
    Crypto::SecretKey key;
    if (cmd.command == Command::Run) key = KeySource::ResolveSecretKey(cmd.key, ctx.env_key);
    KeySource::WipeKeyText(cmd.key);
    KeySource::WipeKeyText(ctx.env_key);

    if (cmd.command == Command::Help) {
      out << UsageText();
      return 0;
    }

    const std::unique_ptr<Crypto::Hasher> hasher = Crypto::CreateHasher(cmd.hash);
    Crypto::Ed25519Signer signer;
    Crypto::Ed25519Verifier verifier;
    Orchestrator orchestrator(ctx.location, *hasher, signer, verifier, ctx.keygen);

    switch (cmd.command) {
      case Command::Generate: return DoGenerate(orchestrator, out);
      case Command::Run: return DoRun(cmd, orchestrator, std::move(key), out);
      case Command::Verify: return DoVerify(cmd, orchestrator, out);
      case Command::Help: break;
    }
    return 0;
  } catch (const OracleError& e) {
    KeySource::WipeKeyText(cmd.key);
    KeySource::WipeKeyText(ctx.env_key);
    Logger::Error(e.what());
    err << "Error: " << e.what() << '\n';
    if (e.Kind() == ErrorKind::UsageError) err << UsageText();
    return ExitCodeFor(e.Kind());
  } catch (const std::exception& e) {
    KeySource::WipeKeyText(cmd.key);
    KeySource::WipeKeyText(ctx.env_key);
    Logger::Critical(std::string("Unexpected failure: ") + e.what());
    err << "Error: " << e.what() << '\n';
    return 1;
  }
}
