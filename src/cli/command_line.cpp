#include "secenv/cli/command_line.h"

#include <utility>

namespace secenv::cli {

bool ParseCommandArgs(int argc, const char* const* argv, int index, CommandArgs& out,
                      std::string& error) {
  for (int i = index; i < argc; ++i) {
    std::string_view arg = argv[i];
    if (arg.rfind("--", 0) != 0) {
      out.positional.emplace_back(arg);
      continue;
    }
    std::string_view name = arg;
    std::optional<std::string> value;
    if (auto eq = arg.find('='); eq != std::string_view::npos) {
      name = arg.substr(0, eq);
      value = std::string(arg.substr(eq + 1));
    } else if (i + 1 < argc && std::string_view(argv[i + 1]).rfind("--", 0) != 0) {
      value = std::string(argv[++i]);
    }
    if (!value || value->empty()) {
      error = std::string(name) + " requires a value.";
      return false;
    }
    if (name == "--key") {
      out.key.password = std::move(*value);
    } else if (name == "--key-file") {
      out.key.key_file = std::filesystem::path(*value);
    } else if (name == "--output") {
      out.output = std::filesystem::path(*value);
    } else if (name == "--github-token") {
      out.github_token = std::move(*value);
    } else if (name == "--github-repo") {
      out.github_repo = std::move(*value);
    } else {
      error = "unknown option " + std::string(name);
      return false;
    }
  }
  return true;
}

std::string_view DomainPrefix(ErrorDomain domain) {
  switch (domain) {
  case ErrorDomain::IO:
    return "I/O error";
  case ErrorDomain::Security:
    return "Security error";
  case ErrorDomain::Crypto:
    return "Cryptography error";
  case ErrorDomain::Validation:
    return "Validation error";
  case ErrorDomain::Config:
    return "Configuration error";
  case ErrorDomain::Remote:
    return "Remote error";
  case ErrorDomain::State:
    return "State error";
  case ErrorDomain::Internal:
    return "Internal error";
  }
  return "Error";
}

std::string FormatErrorLine(const Error& err) {
  std::string line(DomainPrefix(err.domain));
  line.append(": ");
  line.append(err.what());
  return line;
}

int ExitCodeFor(const Error& err) {
  switch (err.domain) {
  case ErrorDomain::Security:
  case ErrorDomain::Crypto:
    return kExitAuth;
  case ErrorDomain::Validation:
  case ErrorDomain::Config:
    return kExitUsage;
  case ErrorDomain::IO:
  case ErrorDomain::Remote:
  case ErrorDomain::State:
  case ErrorDomain::Internal:
  default:
    return kExitIO;
  }
}

}  // namespace secenv::cli
