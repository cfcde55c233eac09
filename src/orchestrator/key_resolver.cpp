#include "secenv/orchestrator/key_resolver.h"

#include "secenv/common.h"
#include "secenv/error.h"
#include "secenv/errors.h"
#include "secenv/orchestrator/io_util.h"
#include "secenv/security/zeroizer.h"

namespace secenv::orchestrator {

core::KeyMaterial ResolveKey(const KeyOptions& options) {
  if (options.password && options.key_file) {
    throw KeyConfigError(KeyConfigReason::kMutuallyExclusive, errors::config::kKeyConflict,
                         std::string(errors::msg::kKeyMutuallyExclusive));
  }
  if (options.key_file) {
    std::vector<uint8_t> bytes;
    try {
      bytes = ReadFileBytes(*options.key_file);
    } catch (const Error& err) {
      throw KeyConfigError(KeyConfigReason::kUnreadable, errors::config::kKeyUnreadable,
                           std::string(errors::msg::kKeyFileUnreadable) + ": " +
                               PathToUtf8String(*options.key_file),
                           err.native_code);
    }
    security::Zeroizer::ScopeWiper<uint8_t> guard(std::span<uint8_t>(bytes.data(), bytes.size()));
    return core::KeyMaterial::FromRawKey(bytes);
  }
  if (options.password) {
    return core::KeyMaterial::FromPassword(*options.password);
  }
  throw KeyConfigError(KeyConfigReason::kMissing, errors::config::kKeyMissing,
                       std::string(errors::msg::kKeyMissing));
}

}  // namespace secenv::orchestrator
