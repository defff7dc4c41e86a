#include "registration_server.hpp"
#include "grpc_error.hpp"

namespace registry::grpc {

RegistrationServer::RegistrationServer(std::shared_ptr<registry::service::RegistrationService> svc)
    : service_(std::move(svc)) {}

::grpc::Status RegistrationServer::Submit(::grpc::ServerContext*,
                                          const registry::v1::SubmitRequest* req,
                                          registry::v1::SubmitResponse* resp) {
  try {
    *resp = service_->Submit(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status RegistrationServer::ListRegistrations(::grpc::ServerContext*,
                                                     const registry::v1::ListRegistrationsRequest* req,
                                                     registry::v1::ListRegistrationsResponse* resp) {
  try {
    *resp = service_->List(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status RegistrationServer::Ping(::grpc::ServerContext*,
                                        const registry::v1::PingRequest* req,
                                        registry::v1::PingResponse* resp) {
  *resp = service_->Ping(*req);
  return ::grpc::Status::OK;
}

}
