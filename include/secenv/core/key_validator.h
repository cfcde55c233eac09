#pragma once

#include <cstdint>
#include <set>
#include <string>
#include <string_view>

#include "secenv/error.h"

namespace secenv::core {

enum class PasswordRequirement : std::uint8_t {
  kMinLength,
  kUppercase,
  kLowercase,
  kDigit,
  kSpecial,
  kNotCommon
};

inline constexpr std::size_t kMinPasswordLength = 12;
inline constexpr int kStrongPasswordScore = 5;
inline constexpr int kMaxPasswordScore = 6;

struct PasswordStrength {
  bool strong{false};
  int score{0};
  std::set<PasswordRequirement> unmet;
  std::string message;
};

// Raised when a password fails the strength gate in front of key derivation.
// Never raised for key-file material.
struct WeakKeyError : public Error {
  PasswordStrength strength;
  explicit WeakKeyError(PasswordStrength s);
};

const char* RequirementName(PasswordRequirement requirement);

// Scores |password| against the fixed policy. One point per satisfied
// requirement; strong when at most one requirement is unmet. Pure.
PasswordStrength ValidatePassword(std::string_view password);

// Throws WeakKeyError when ValidatePassword reports a weak password.
void EnforcePasswordPolicy(std::string_view password);

}  // namespace secenv::core
