#pragma once

#include <cstddef>
#include <string_view>

namespace registry::core {

/*
  Capability that decides whether `signature` over `message` was produced
  by the holder of `claimed_address`.

  The validator only depends on this interface, so a verifier that
  recovers the secp256k1 signer can replace the length check without
  touching the validation order.
*/
class SignatureVerifier {
 public:
  virtual ~SignatureVerifier() = default;

  virtual bool Verify(std::string_view message, std::string_view signature, std::string_view claimed_address) const = 0;
};

/*
  Placeholder verifier: accepts any signature of at least kMinSignatureLength
  characters. Performs no cryptographic check and ignores the message and
  claimed address.
*/
class LengthSignatureVerifier final : public SignatureVerifier {
 public:
  static constexpr std::size_t kMinSignatureLength = 100;

  bool Verify(std::string_view message, std::string_view signature, std::string_view claimed_address) const override;
};

} // namespace registry::core
