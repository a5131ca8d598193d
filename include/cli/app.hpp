#pragma once
#include "cli/command_line.hpp"
#include <iosfwd>
#include <optional>
#include <string>

class LocationProvider;
namespace Crypto { class KeyPairGenerator; }

// Boundary collaborators resolved once by main and handed in explicitly.
struct AppContext {
  LocationProvider& location;
  Crypto::KeyPairGenerator& keygen;
  std::optional<std::string> env_key;
};

// Executes one command. Results go to out, human-readable errors to err.
// Returns the process exit code: 0 on success, ExitCodeFor(kind) on failure,
// 1 for an invalid signature in verify. The secret key text in cmd.key and
// ctx.env_key is wiped and cleared once it has been decoded.
int RunApp(CommandLine& cmd, AppContext& ctx, std::ostream& out, std::ostream& err);
