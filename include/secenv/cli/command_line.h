#pragma once

#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "secenv/error.h"
#include "secenv/orchestrator/key_resolver.h"

namespace secenv::cli {

// sysexits-style process exit codes.
inline constexpr int kExitOk = 0;
inline constexpr int kExitUsage = 64;
inline constexpr int kExitIO = 74;
inline constexpr int kExitAuth = 77;

struct CommandArgs {
  orchestrator::KeyOptions key;
  std::optional<std::filesystem::path> output;
  std::optional<std::string> github_token;
  std::optional<std::string> github_repo;
  std::vector<std::string> positional;
};

// Parses argv[index..argc) into |out|. Accepts "--flag value" and
// "--flag=value"; a value of the first form may not itself start with "--".
// Returns false and sets |error| on a missing value or an unknown flag.
bool ParseCommandArgs(int argc, const char* const* argv, int index, CommandArgs& out,
                      std::string& error);

std::string_view DomainPrefix(ErrorDomain domain);

// "<Domain> error: <message>". Context frames are already part of what().
std::string FormatErrorLine(const Error& err);

int ExitCodeFor(const Error& err);

}  // namespace secenv::cli
