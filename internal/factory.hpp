#pragma once

#include <memory>
#include <vector>

#include <grpcpp/grpcpp.h>

#include "config/config.pb.h"

namespace registry::core {
class RegistrationStore;
}
namespace registry::db {
class Repository;
}
namespace registry::http {
class RegistrationHandler;
}
namespace registry::service {
class RegistrationService;
}

namespace registry::factory {

/*
  Application

  Owns all long-lived objects used by the server.
  Everything here lives for the lifetime of the process.
*/
struct Application {
  std::shared_ptr<registry::core::RegistrationStore>     store;
  std::shared_ptr<registry::service::RegistrationService> registration_service;
  std::shared_ptr<registry::http::RegistrationHandler>   http_handler;

  // empty when grpc is disabled
  std::vector<std::unique_ptr<::grpc::Service>> grpc_services;
};

/*
  Build

  Constructs the entire backend based on runtime config.

  NOTE:
  This is the composition root of the application.
  It is the ONLY place allowed to know concrete DB types.
*/
Application Build(const registry::runtime::config::RuntimeConfig& config);

// Exposed for tests that need a repository without the rest of the graph.
std::shared_ptr<registry::db::Repository> BuildRepository(const registry::runtime::config::RuntimeConfig& config);

} // namespace registry::factory
