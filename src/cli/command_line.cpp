#include "cli/command_line.hpp"
#include "common/errors.hpp"
#include <cstdlib>
#include <cerrno>
#include <climits>

namespace {
struct Option {
  std::string name;
  std::optional<std::string> value;
};

Option SplitOption(const std::string& arg) {
  const auto eq = arg.find('=');
  if (eq == std::string::npos) return Option{arg.substr(2), std::nullopt};
  return Option{arg.substr(2, eq - 2), arg.substr(eq + 1)};
}

int ParseAccuracy(const std::string& text) {
  errno = 0;
  char* end = nullptr;
  const long v = std::strtol(text.c_str(), &end, 10);
  if (text.empty() || end == text.c_str() || *end != '\0' || errno == ERANGE || v < INT_MIN || v > INT_MAX)
    throw OracleError(ErrorKind::InvalidPrecision, "accuracy '" + text + "' is not an integer");
  return static_cast<int>(v);
}

Command ParseCommand(const std::string& name) {
  if (name == "generate") return Command::Generate;
  if (name == "run") return Command::Run;
  if (name == "verify") return Command::Verify;
  if (name == "help" || name == "--help" || name == "-h") return Command::Help;
  throw OracleError(ErrorKind::UsageError, "unknown command '" + name + "'");
}
}

CommandLine ParseCommandLine(const std::vector<std::string>& args) {
  CommandLine cl;
  if (args.empty()) throw OracleError(ErrorKind::UsageError, "no command given");
  cl.command = ParseCommand(args[0]);

  for (size_t i = 1; i < args.size(); ++i) {
    const std::string& arg = args[i];
    if (arg.rfind("--", 0) != 0) throw OracleError(ErrorKind::UsageError, "unexpected argument '" + arg + "'");
    Option opt = SplitOption(arg);
    if (opt.name == "with-geohash" && cl.command == Command::Run) {
      if (opt.value) throw OracleError(ErrorKind::UsageError, "--with-geohash takes no value");
      cl.with_geohash = true;
      continue;
    }
    if (!opt.value) {
      if (i + 1 >= args.size()) throw OracleError(ErrorKind::UsageError, "--" + opt.name + " needs a value");
      opt.value = args[++i];
    }
    const std::string& v = *opt.value;
    const bool run = cl.command == Command::Run;
    const bool verify = cl.command == Command::Verify;
    if (run && opt.name == "key") cl.key = v;
    else if (run && opt.name == "accuracy") cl.accuracy = ParseAccuracy(v);
    else if ((run || verify) && opt.name == "hash") cl.hash = v;
    else if (verify && opt.name == "public") cl.public_key = v;
    else if (verify && opt.name == "geohash") cl.geohash = v;
    else if (verify && opt.name == "signature") cl.signature = v;
    else if (verify && opt.name == "challenge") cl.challenge = v;
    else throw OracleError(ErrorKind::UsageError, "unknown option --" + opt.name + " for " + args[0]);
  }

  if (cl.command == Command::Verify) {
    if (cl.public_key.empty()) throw OracleError(ErrorKind::UsageError, "verify needs --public");
    if (cl.geohash.empty()) throw OracleError(ErrorKind::UsageError, "verify needs --geohash");
    if (cl.signature.empty()) throw OracleError(ErrorKind::UsageError, "verify needs --signature");
  }
  return cl;
}

CommandLine ParseCommandLine(int argc, const char* const argv[]) {
  std::vector<std::string> args;
  for (int i = 1; i < argc; ++i) args.emplace_back(argv[i]);
  return ParseCommandLine(args);
}

std::string UsageText() {
  return
    "usage:\n"
    "  geoattest generate\n"
    "  geoattest run [--key=<hex>] [--accuracy=<1-12>] [--hash=<name>] [--with-geohash]\n"
    "  geoattest verify --public=<hex> --geohash=<hash> --signature=<json|hex>\n"
    "                   [--challenge=<geohash prefix>] [--hash=<name>]\n"
    "\n"
    "The run key falls back to the ORACLE_KEY environment variable.\n"
    "Digest algorithms: blake2b-256 (default), keccak-256.\n";
}
