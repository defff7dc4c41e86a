#pragma once

#include <memory>

namespace registry::core {
class RegistrationStore;
class SignatureVerifier;
}

namespace registry::service {

/*
  Dependency container shared by all services.
*/
struct ServiceContext {
  std::shared_ptr<registry::core::RegistrationStore> store;
  std::shared_ptr<const registry::core::SignatureVerifier> verifier;
};

}
