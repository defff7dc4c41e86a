#pragma once

#include "api/registry/v1.hpp"
#include "service_context.hpp"

namespace registry::service {

/*
  Transport-independent intake logic shared by the HTTP and gRPC
  adapters.

  Errors are thrown as registry::util exceptions:
    ValidationFailed  - rejected before reaching the store
    AlreadyExists     - the address pair is already registered
    StoreUnavailable  - storage failure; what() is internal detail
*/
class RegistrationService {
public:
  static constexpr const char* kPongMessage = "Pong!";

  explicit RegistrationService(ServiceContext ctx);

  registry::v1::SubmitResponse Submit(const registry::v1::SubmitRequest& req);

  registry::v1::ListRegistrationsResponse List(const registry::v1::ListRegistrationsRequest& req);

  registry::v1::PingResponse Ping(const registry::v1::PingRequest& req);

private:
  ServiceContext ctx_;
};

}
