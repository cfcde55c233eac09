#include "secenv/core/key_validator.h"

#include <algorithm>
#include <array>
#include <cctype>

#include "secenv/errors.h"

namespace secenv::core {
namespace {

constexpr std::string_view kSpecialCharacters = "!@#$%^&*()_+-=[]{};':\"\\|,.<>/?";

constexpr std::array<std::string_view, 4> kCommonPasswords = {
    "password", "password123", "123456789", "qwerty"};

constexpr std::array<PasswordRequirement, 6> kRequirementOrder = {
    PasswordRequirement::kMinLength, PasswordRequirement::kUppercase,
    PasswordRequirement::kLowercase, PasswordRequirement::kDigit,
    PasswordRequirement::kSpecial,   PasswordRequirement::kNotCommon};

bool ContainsCommonPassword(std::string_view password) {
  std::string lowered(password);
  std::transform(lowered.begin(), lowered.end(), lowered.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return std::any_of(kCommonPasswords.begin(), kCommonPasswords.end(),
                     [&](std::string_view common) { return lowered.find(common) != std::string::npos; });
}

std::string BuildMessage(const PasswordStrength& strength) {
  if (strength.strong) {
    return std::string(errors::msg::kStrongPassword);
  }
  std::string message(errors::msg::kWeakPassword);
  message += ". Requirements: ";
  bool first = true;
  for (auto requirement : kRequirementOrder) {
    if (strength.unmet.count(requirement) == 0) {
      continue;
    }
    if (!first) {
      message += ", ";
    }
    message += RequirementName(requirement);
    first = false;
  }
  return message;
}

}  // namespace

WeakKeyError::WeakKeyError(PasswordStrength s)
    : Error(ErrorDomain::Security, errors::security::kWeakKey, "Security Error: " + s.message),
      strength(std::move(s)) {}

const char* RequirementName(PasswordRequirement requirement) {
  switch (requirement) {
  case PasswordRequirement::kMinLength:
    return "min length";
  case PasswordRequirement::kUppercase:
    return "has upper";
  case PasswordRequirement::kLowercase:
    return "has lower";
  case PasswordRequirement::kDigit:
    return "has number";
  case PasswordRequirement::kSpecial:
    return "has special";
  case PasswordRequirement::kNotCommon:
    return "not common";
  }
  return "unknown";
}

PasswordStrength ValidatePassword(std::string_view password) {
  bool has_upper = false;
  bool has_lower = false;
  bool has_digit = false;
  bool has_special = false;
  for (unsigned char ch : password) {
    if (ch >= 'A' && ch <= 'Z') {
      has_upper = true;
    } else if (ch >= 'a' && ch <= 'z') {
      has_lower = true;
    } else if (ch >= '0' && ch <= '9') {
      has_digit = true;
    } else if (kSpecialCharacters.find(static_cast<char>(ch)) != std::string_view::npos) {
      has_special = true;
    }
  }

  PasswordStrength strength;
  auto check = [&strength](bool met, PasswordRequirement requirement) {
    if (met) {
      ++strength.score;
    } else {
      strength.unmet.insert(requirement);
    }
  };
  check(password.size() >= kMinPasswordLength, PasswordRequirement::kMinLength);
  check(has_upper, PasswordRequirement::kUppercase);
  check(has_lower, PasswordRequirement::kLowercase);
  check(has_digit, PasswordRequirement::kDigit);
  check(has_special, PasswordRequirement::kSpecial);
  check(!ContainsCommonPassword(password), PasswordRequirement::kNotCommon);

  strength.strong = strength.score >= kStrongPasswordScore;
  strength.message = BuildMessage(strength);
  return strength;
}

void EnforcePasswordPolicy(std::string_view password) {
  auto strength = ValidatePassword(password);
  if (!strength.strong) {
    throw WeakKeyError(std::move(strength));
  }
}

}  // namespace secenv::core
