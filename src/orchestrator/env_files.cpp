#include "secenv/orchestrator/env_files.h"

#include <algorithm>
#include <array>
#include <string_view>
#include <system_error>

#include "secenv/common.h"
#include "secenv/core/container.h"
#include "secenv/error.h"
#include "secenv/errors.h"

namespace secenv::orchestrator {
namespace {

constexpr std::string_view kEnvPrefix = ".env";
constexpr std::array<std::string_view, 3> kExcludedSuffixes = {".example", ".template",
                                                              core::kContainerExtension};

bool EndsWith(std::string_view value, std::string_view suffix) {
  return value.size() >= suffix.size() && value.substr(value.size() - suffix.size()) == suffix;
}

bool HasEnvFileShape(std::string_view name) {
  if (name.rfind(kEnvPrefix, 0) != 0) {
    return false;
  }
  for (auto suffix : kExcludedSuffixes) {
    if (EndsWith(name, suffix)) {
      return false;
    }
  }
  return true;
}

// Printable form of a raw file name; bytes outside ASCII become \xNN.
std::string EscapeName(std::string_view name) {
  static constexpr char kHex[] = "0123456789abcdef";
  std::string out;
  for (char ch : name) {
    const auto byte = static_cast<uint8_t>(ch);
    if (byte >= 0x20 && byte < 0x7F) {
      out.push_back(ch);
    } else {
      out += "\\x";
      out.push_back(kHex[byte >> 4]);
      out.push_back(kHex[byte & 0x0F]);
    }
  }
  return out;
}

}  // namespace

bool IsEligibleEnvFileName(const std::string& name) {
  return HasEnvFileShape(name) && core::IsValidEntryName(name);
}

std::vector<std::string> FindEnvFiles(const std::filesystem::path& project_root) {
  std::vector<std::string> names;
  std::error_code ec;
  std::filesystem::directory_iterator it(project_root, ec);
  if (ec) {
    throw Error(ErrorDomain::IO, errors::io::kReadFailed,
                "Unable to list " + PathToUtf8String(project_root) + ": " + ec.message(), ec.value());
  }
  for (; it != std::filesystem::directory_iterator(); it.increment(ec)) {
    if (ec) {
      break;
    }
    std::error_code type_ec;
    if (!it->is_regular_file(type_ec) || type_ec) {
      continue;
    }
    auto name = PathToUtf8String(it->path().filename());
    if (!HasEnvFileShape(name)) {
      continue;
    }
    // A container entry name must be UTF-8.
    if (!IsValidUtf8(name)) {
      throw Error(ErrorDomain::Validation, errors::validation::kInvalidFileName,
                  std::string(errors::msg::kEnvFileNameNotUtf8) + ": '" + EscapeName(name) + "'");
    }
    if (core::IsValidEntryName(name)) {
      names.push_back(std::move(name));
    }
  }
  if (ec) {
    throw Error(ErrorDomain::IO, errors::io::kReadFailed,
                "Unable to list " + PathToUtf8String(project_root) + ": " + ec.message(), ec.value());
  }
  std::sort(names.begin(), names.end());
  return names;
}

}  // namespace secenv::orchestrator
