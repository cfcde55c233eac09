#include "secenv/cli/command_line.h"
#include "secenv/error.h"
#include "secenv/orchestrator/io_util.h"

#include <cassert>
#include <cstddef>
#include <iostream>
#include <string>
#include <vector>

#include "test_support.h"

namespace {

using secenv::cli::CommandArgs;
using secenv::cli::ParseCommandArgs;

bool Parse(const std::vector<const char*>& argv, CommandArgs& out, std::string& error) {
  return ParseCommandArgs(static_cast<int>(argv.size()), argv.data(), 0, out, error);
}

void TestBothFlagForms() {
  CommandArgs args;
  std::string error;
  assert(Parse({"--key", "Str0ng!Pass99", "--output=out.secenv", "backup.secenv"}, args, error));
  assert(args.key.password && *args.key.password == "Str0ng!Pass99");
  assert(args.output && *args.output == "out.secenv");
  assert((args.positional == std::vector<std::string>{"backup.secenv"}));
}

void TestFlagIsNotTakenAsValue() {
  CommandArgs args;
  std::string error;
  assert(!Parse({"--key", "--key-file", "k1.key"}, args, error));
  assert(!args.key.password.has_value());
  assert(error == "--key requires a value.");

  // The "=" form may carry a value that starts with dashes.
  CommandArgs explicit_value;
  assert(Parse({"--key=--Str0ng!Pass99"}, explicit_value, error));
  assert(*explicit_value.key.password == "--Str0ng!Pass99");
}

void TestMissingAndUnknownFlags() {
  CommandArgs args;
  std::string error;
  assert(!Parse({"--output"}, args, error));
  assert(error == "--output requires a value.");
  assert(!Parse({"--output="}, args, error));
  assert(!Parse({"--colour", "red"}, args, error));
  assert(error == "unknown option --colour");
}

std::size_t CountOccurrences(const std::string& text, const std::string& needle) {
  std::size_t count = 0;
  for (auto pos = text.find(needle); pos != std::string::npos; pos = text.find(needle, pos + 1)) {
    ++count;
  }
  return count;
}

void TestErrorLinePrintsContextOnce() {
  secenv::testing::TempDir temp("secenv_cli_");
  bool raised = false;
  try {
    (void)secenv::orchestrator::ReadFileBytes(temp.path() / "missing.key");
  } catch (const secenv::Error& err) {
    raised = true;
    assert(!err.context.empty());
    const auto line = secenv::cli::FormatErrorLine(err);
    assert(line.rfind("I/O error: ", 0) == 0);
    assert(CountOccurrences(line, err.context.front()) == 1);
    assert(secenv::cli::ExitCodeFor(err) == secenv::cli::kExitIO);
  }
  assert(raised);
}

void TestExitCodes() {
  using secenv::ErrorDomain;
  assert(secenv::cli::ExitCodeFor(secenv::DecryptionFailureError("x")) == secenv::cli::kExitAuth);
  assert(secenv::cli::ExitCodeFor(secenv::FormatError("x")) == secenv::cli::kExitUsage);
  assert(secenv::cli::ExitCodeFor(secenv::Error(ErrorDomain::Remote, 0, "x")) == secenv::cli::kExitIO);
  assert(secenv::cli::FormatErrorLine(secenv::Error(ErrorDomain::Remote, 0, "gone")) == "Remote error: gone");
}

} // namespace

int main() {
  TestBothFlagForms();
  TestFlagIsNotTakenAsValue();
  TestMissingAndUnknownFlags();
  TestErrorLinePrintsContextOnce();
  TestExitCodes();
  std::cout << "command line tests ok\n";
  return 0;
}
