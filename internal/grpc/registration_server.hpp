#pragma once

#include <memory>
#include <grpcpp/grpcpp.h>

#include "api/registry/v1.hpp"
#include "internal/service/registration_service.hpp"

namespace registry::grpc {

class RegistrationServer final : public registry::v1::RegistrationService::Service {
public:
  explicit RegistrationServer(std::shared_ptr<registry::service::RegistrationService> svc);

  ::grpc::Status Submit(::grpc::ServerContext*,
                        const registry::v1::SubmitRequest*,
                        registry::v1::SubmitResponse*) override;

  ::grpc::Status ListRegistrations(::grpc::ServerContext*,
                                   const registry::v1::ListRegistrationsRequest*,
                                   registry::v1::ListRegistrationsResponse*) override;

  ::grpc::Status Ping(::grpc::ServerContext*,
                      const registry::v1::PingRequest*,
                      registry::v1::PingResponse*) override;

private:
  std::shared_ptr<registry::service::RegistrationService> service_;
};

}
