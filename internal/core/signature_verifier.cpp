#include "internal/core/signature_verifier.hpp"

namespace registry::core {

bool LengthSignatureVerifier::Verify(std::string_view, std::string_view signature, std::string_view) const {
  return signature.size() >= kMinSignatureLength;
}

} // namespace registry::core
