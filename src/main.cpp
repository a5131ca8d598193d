#include "cli/app.hpp"
#include "cli/command_line.hpp"
#include "common/config_manager.hpp"
#include "common/errors.hpp"
#include "common/logger.hpp"
#include "config/oracle_config.hpp"
#include "crypto/ed25519.hpp"
#include "crypto/keypair_generator.hpp"
#include "crypto/random_source.hpp"
#include "location/ipinfo_provider.hpp"
#include "net/http_client.hpp"
#include <iostream>
#include <memory>

int main(int argc, char** argv) {
  int rc = 1;
  try {
    ConfigManager::Initialize(".env");
    const OracleConfig cfg = LoadOracleConfig();
    Logger::Initialize(cfg.log_file, cfg.log_level);
    Logger::Info("geoattest starting");

    CommandLine cmd = ParseCommandLine(argc, argv);

    std::unique_ptr<HttpClient> http(CreateCurlHttpClient());
    IpInfoLocationProvider location(*http, cfg.location);
    Crypto::OsRandomSource random;
    Crypto::Ed25519Signer signer;
    Crypto::SeedKeyPairGenerator keygen(random, signer);

    // The key is read here, once, and travels as an explicit argument from now on.
    AppContext ctx{location, keygen, ConfigManager::Get(kOracleKeyEnv)};
    ConfigManager::Forget(kOracleKeyEnv);
    rc = RunApp(cmd, ctx, std::cout, std::cerr);
  } catch (const OracleError& e) {
    std::cerr << "Error: " << e.what() << std::endl;
    if (e.Kind() == ErrorKind::UsageError) std::cerr << UsageText();
    Logger::Error(e.what());
    rc = ExitCodeFor(e.Kind());
  } catch (const std::exception& e) {
    std::cerr << "CRITICAL ERROR: " << e.what() << std::endl;
    Logger::Critical(e.what());
    rc = 1;
  }
  Logger::Info("geoattest exiting with code " + std::to_string(rc));
  Logger::Shutdown();
  return rc;
}
