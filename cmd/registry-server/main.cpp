#include <chrono>
#include <csignal>
#include <cstdint>
#include <iostream>
#include <memory>
#include <string>
#include <thread>

#include "internal/config/config_loader.hpp"
#include "internal/core/registration_store.hpp"
#include "internal/factory.hpp"
#include "internal/http/http_server.hpp"
#include "internal/observability/logging.hpp"
#include "internal/runtime/server.hpp"

using registry::observability::BoolField;
using registry::observability::StringField;

static volatile std::sig_atomic_t g_running = 1;

void HandleSignal(int) {
  g_running = 0;
}

int main(int argc, char** argv) {
  std::string config_path;
  if (argc == 1) {
    // defaults + environment
  } else if (argc == 2 && std::string(argv[1]) != "--config") {
    config_path = argv[1];
  } else if (argc == 3 && std::string(argv[1]) == "--config") {
    config_path = argv[2];
  } else {
    std::cerr << "Usage: registry-server [<config.yaml> | --config <config.yaml>]" << std::endl;
    return 1;
  }

  try {
    // ------------------------------------------------------------
    // Load configuration
    // ------------------------------------------------------------
    auto config = config_path.empty() ? registry::config::ConfigLoader::Defaults()
                                      : registry::config::ConfigLoader::LoadFromYaml(config_path);
    registry::config::ConfigLoader::ApplyEnvironment(config);
    registry::config::ConfigLoader::Validate(config);

    registry::observability::InitializeLogging(config);

    // ------------------------------------------------------------
    // Build application (dependency graph)
    // ------------------------------------------------------------
    auto app = registry::factory::Build(config);

    // ------------------------------------------------------------
    // Start servers
    // ------------------------------------------------------------
    registry::http::HttpServer http_server(config.http().host(), static_cast<uint16_t>(config.http().port()), config.http().threads(),
                                           app.http_handler);

    std::unique_ptr<registry::runtime::Server> grpc_server;
    if (!app.grpc_services.empty()) {
      grpc_server = std::make_unique<registry::runtime::Server>(config.grpc().bind_address(), std::move(app.grpc_services));
    }

    // Register signal handlers before starting servers to avoid race window.
    std::signal(SIGINT, HandleSignal);
    std::signal(SIGTERM, HandleSignal);

    http_server.Start();
    if (grpc_server) {
      grpc_server->Start();
    }

    const std::string origin =
        config.http().origin().empty() ? "http://localhost:" + std::to_string(http_server.Port()) : config.http().origin();
    REGISTRY_LOG_INFO("Registry server started", {StringField("submit", "POST " + origin + "/submit"),
                                                  StringField("health", "GET " + origin + "/ping"),
                                                  BoolField("grpc", grpc_server != nullptr)});

    while (g_running) std::this_thread::sleep_for(std::chrono::milliseconds(200));

    REGISTRY_LOG_INFO("Shutting down registry server");

    if (grpc_server) {
      grpc_server->Stop();
    }
    http_server.Stop();
    app.store->Close();

    registry::observability::ShutdownLogging();
  } catch (const std::exception& e) {
    REGISTRY_LOG_ERROR("Fatal error", {StringField("error", e.what())});
    registry::observability::ShutdownLogging();
    return 2;
  }

  return 0;
}
