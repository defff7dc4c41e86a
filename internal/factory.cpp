#include "factory.hpp"

#include <filesystem>
#include <memory>
#include <stdexcept>
#include <string>

#include "internal/core/registration_store.hpp"
#include "internal/core/signature_verifier.hpp"
#include "internal/db/api/repository.hpp"
#include "internal/db/memory/memory_repository.hpp"
#include "internal/db/sqlite/sqlite_db.hpp"
#include "internal/db/sqlite/sqlite_repository.hpp"
#include "internal/grpc/registration_server.hpp"
#include "internal/http/registration_handler.hpp"
#include "internal/observability/logging.hpp"
#include "internal/service/registration_service.hpp"
#include "internal/service/service_context.hpp"

namespace registry::factory {

using registry::observability::StringField;

namespace {

void EnsureParentDirectory(const std::string& path) {
  const auto parent = std::filesystem::path(path).parent_path();
  if (parent.empty()) {
    return;
  }

  std::error_code ec;
  std::filesystem::create_directories(parent, ec);
  if (ec) {
    throw std::runtime_error("create database directory " + parent.string() + ": " + ec.message());
  }
}

} // namespace

std::shared_ptr<db::Repository> BuildRepository(const registry::runtime::config::RuntimeConfig& config) {
  const auto& database = config.database();
  if (database.has_sqlite()) {
    const auto& sqlite = database.sqlite();
    EnsureParentDirectory(sqlite.path());

    db::sqlite::SqliteOptions options;
    if (!sqlite.synchronous().empty()) {
      options.synchronous = sqlite.synchronous();
    }
    if (sqlite.busy_timeout_ms() > 0) {
      options.busy_timeout_ms = static_cast<int>(sqlite.busy_timeout_ms());
    }

    auto sqlite_db = std::make_shared<db::sqlite::SqliteDB>(sqlite.path(), options);
    REGISTRY_LOG_INFO("Database initialized", {StringField("backend", "sqlite"), StringField("path", sqlite.path())});
    return std::make_shared<db::sqlite::SqliteRepository>(std::move(sqlite_db));
  }

  if (database.has_memory()) {
    REGISTRY_LOG_WARN("Database initialized", {StringField("backend", "memory"), StringField("durable", "false")});
    return std::make_shared<db::memory::MemoryRepository>();
  }

  throw std::runtime_error("no database backend configured");
}

/*
    Build full application dependency graph
*/
Application Build(const registry::runtime::config::RuntimeConfig& config) {
  Application app;

  // ------------------------------------------------------------------
  // Core components
  // ------------------------------------------------------------------
  app.store = std::make_shared<core::RegistrationStore>(BuildRepository(config));

  // ------------------------------------------------------------------
  // Services
  // ------------------------------------------------------------------
  service::ServiceContext ctx;
  ctx.store    = app.store;
  ctx.verifier = std::make_shared<core::LengthSignatureVerifier>();

  app.registration_service = std::make_shared<service::RegistrationService>(ctx);

  // ------------------------------------------------------------------
  // Transports
  // ------------------------------------------------------------------
  app.http_handler = std::make_shared<http::RegistrationHandler>(app.registration_service);

  if (config.grpc().enabled()) {
    app.grpc_services.push_back(std::make_unique<grpc::RegistrationServer>(app.registration_service));
  }

  return app;
}

} // namespace registry::factory
