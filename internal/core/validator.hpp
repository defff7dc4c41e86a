#pragma once

#include <optional>
#include <string>
#include <string_view>

namespace registry::core {

class SignatureVerifier;

enum class ValidationError {
  MissingFields,
  InvalidEthAddress,
  InvalidRgbAddress,
  SignatureVerificationFailed,
};

// Stable machine-readable name, e.g. "missing_fields".
const char* ToString(ValidationError reason);

// Human-readable message returned to callers.
const char* ReasonMessage(ValidationError reason);

struct RegistrationCandidate {
  std::string eth_address;
  std::string rgb_address;
  std::string signature;
  std::string message;
};

struct ValidationResult {
  std::optional<ValidationError> error;

  static ValidationResult Valid() {
    return {};
  }

  static ValidationResult Invalid(ValidationError reason) {
    return {reason};
  }

  explicit operator bool() const {
    return !error.has_value();
  }
};

// "0x" followed by exactly 40 hex digits, either case.
bool IsEthAddress(std::string_view address);

// Taproot human-readable prefix only; no bech32m checksum validation.
bool IsTaprootAddress(std::string_view address);

/*
  Checks, in order, stopping at the first failure:
    1. all four fields present and non-empty
    2. eth_address format
    3. rgb_address prefix
    4. verifier accepts (message, signature, eth_address)

  Pure: no I/O, no shared state.
*/
ValidationResult Validate(const RegistrationCandidate& candidate, const SignatureVerifier& verifier);

} // namespace registry::core
