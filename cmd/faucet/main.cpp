#include <chrono>
#include <csignal>
#include <cstdlib>
#include <iostream>
#include <string>
#include <thread>

#include "internal/config/config_loader.hpp"
#include "internal/factory.hpp"
#include "internal/observability/logging.hpp"
#include "internal/observability/metrics.hpp"
#include "internal/observability/tracing.hpp"
#include "internal/runtime/http_server.hpp"

#if FAUCET_WITH_GRPC
#include "internal/runtime/server.hpp"
#endif

static volatile std::sig_atomic_t g_running = 1;

void HandleSignal(int) {
  g_running = 0;
}

static void ShutdownObservability() {
  faucet::observability::ShutdownMetrics();
  faucet::observability::ShutdownTracing();
  faucet::observability::ShutdownLogging();
}

int main(int argc, char** argv) {
  std::string config_path;
  if (argc == 2) {
    config_path = argv[1];
  } else if (argc == 3 && std::string(argv[1]) == "--config") {
    config_path = argv[2];
  } else if (argc == 1) {
    if (const char* path = std::getenv("FAUCET_CONFIG")) {
      config_path = path;
    }
  } else {
    std::cerr << "Usage: faucet [<config.yaml> | --config <config.yaml>]\n"
              << "Without a file, configuration comes from FAUCET_* environment variables." << std::endl;
    return 1;
  }

  faucet::runtime::config::RuntimeConfig config;
  try {
    // ------------------------------------------------------------
    // Load configuration
    // ------------------------------------------------------------
    config = config_path.empty() ? faucet::config::ConfigLoader::LoadFromEnvironment()
                                 : faucet::config::ConfigLoader::LoadFromYaml(config_path);
    faucet::config::ConfigLoader::Validate(config);
  } catch (const std::exception& e) {
    std::cerr << e.what() << std::endl;
    return 1;
  }

  try {
    faucet::observability::InitializeLogging(config);
    faucet::observability::InitializeTracing(config);
    faucet::observability::InitializeMetrics(config);

    // ------------------------------------------------------------
    // Build application (dependency graph)
    // ------------------------------------------------------------
    auto app = faucet::factory::Build(config);

    // ------------------------------------------------------------
    // Start servers
    // ------------------------------------------------------------
    faucet::runtime::HttpServer http(config.server().bind_host(), static_cast<std::uint16_t>(config.server().port()), app.service);

#if FAUCET_WITH_GRPC
    std::unique_ptr<faucet::runtime::Server> grpc_server;
    if (!config.server().grpc_bind_address().empty()) {
      grpc_server = std::make_unique<faucet::runtime::Server>(config.server().grpc_bind_address(), std::move(app.grpc_services));
    }
#endif

    // Register signal handlers before starting servers to avoid race window.
    std::signal(SIGINT, HandleSignal);
    std::signal(SIGTERM, HandleSignal);

    http.Start();
#if FAUCET_WITH_GRPC
    if (grpc_server) grpc_server->Start();
#endif
    FAUCET_LOG_INFO("Faucet started", {faucet::observability::IntField("port", http.port()),
                                       faucet::observability::BoolField("disbursements_enabled", app.worker != nullptr)});

    while (g_running) std::this_thread::sleep_for(std::chrono::milliseconds(200));

    FAUCET_LOG_INFO("Shutting down faucet");

    // Stop the worker first: it abandons queued jobs, which releases callers
    // still waiting in the HTTP and gRPC handlers.
    if (app.worker) {
      app.worker->Stop(app.shutdown_drain_timeout);
    } else {
      app.queue->Shutdown();
    }
#if FAUCET_WITH_GRPC
    if (grpc_server) grpc_server->Stop();
#endif
    http.Stop();
    ShutdownObservability();
  } catch (const std::exception& e) {
    FAUCET_LOG_ERROR("Fatal error", {faucet::observability::ErrorField(e)});
    ShutdownObservability();
    return 2;
  }

  return 0;
}
