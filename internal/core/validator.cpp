#include "internal/core/validator.hpp"

#include <cctype>

#include "internal/core/signature_verifier.hpp"

namespace registry::core {

namespace {

constexpr std::size_t      kEthAddressLength = 42;
constexpr std::string_view kEthPrefix        = "0x";
constexpr std::string_view kTaprootPrefix    = "bc1";

} // namespace

const char* ToString(ValidationError reason) {
  switch (reason) {
    case ValidationError::MissingFields:
      return "missing_fields";
    case ValidationError::InvalidEthAddress:
      return "invalid_eth_address";
    case ValidationError::InvalidRgbAddress:
      return "invalid_rgb_address";
    case ValidationError::SignatureVerificationFailed:
      return "signature_verification_failed";
  }
  return "unknown";
}

const char* ReasonMessage(ValidationError reason) {
  switch (reason) {
    case ValidationError::MissingFields:
      return "Missing required fields";
    case ValidationError::InvalidEthAddress:
      return "Invalid ETH address format";
    case ValidationError::InvalidRgbAddress:
      return "Invalid RGB address format - must be a Taproot address starting with bc1";
    case ValidationError::SignatureVerificationFailed:
      return "Signature verification failed";
  }
  return "Validation failed";
}

bool IsEthAddress(std::string_view address) {
  if (address.size() != kEthAddressLength || address.substr(0, kEthPrefix.size()) != kEthPrefix) {
    return false;
  }
  for (char c : address.substr(kEthPrefix.size())) {
    if (!std::isxdigit(static_cast<unsigned char>(c))) {
      return false;
    }
  }
  return true;
}

bool IsTaprootAddress(std::string_view address) {
  return address.substr(0, kTaprootPrefix.size()) == kTaprootPrefix;
}

ValidationResult Validate(const RegistrationCandidate& candidate, const SignatureVerifier& verifier) {
  if (candidate.eth_address.empty() || candidate.rgb_address.empty() || candidate.signature.empty() || candidate.message.empty()) {
    return ValidationResult::Invalid(ValidationError::MissingFields);
  }

  if (!IsEthAddress(candidate.eth_address)) {
    return ValidationResult::Invalid(ValidationError::InvalidEthAddress);
  }

  if (!IsTaprootAddress(candidate.rgb_address)) {
    return ValidationResult::Invalid(ValidationError::InvalidRgbAddress);
  }

  if (!verifier.Verify(candidate.message, candidate.signature, candidate.eth_address)) {
    return ValidationResult::Invalid(ValidationError::SignatureVerificationFailed);
  }

  return ValidationResult::Valid();
}

} // namespace registry::core
