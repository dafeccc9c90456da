#pragma once

#include <memory>
#include <vector>

#include "config/config.pb.h"

#include "internal/chain/chain_client.hpp"
#include "internal/core/faucet_service.hpp"
#include "internal/dispatch/dispatch_worker.hpp"

#if FAUCET_WITH_GRPC
#include <grpcpp/impl/service_type.h>
#endif

namespace faucet::factory {

/*
  Application

  Owns all long-lived components used by the server.
  Everything here lives for the lifetime of the process.
*/
struct Application {
  std::shared_ptr<chain::ChainClient>       chain;
  std::shared_ptr<core::FaucetService>      service;
  std::shared_ptr<dispatch::DispatchQueue>  queue;
  // Null while the funding credential is invalid.
  std::shared_ptr<dispatch::DispatchWorker> worker;
  util::Millis                              shutdown_drain_timeout{10000};

#if FAUCET_WITH_GRPC
  std::vector<std::unique_ptr<::grpc::Service>> grpc_services;
#endif
};

/*
  Build

  Constructs the entire backend from the runtime config and starts the
  dispatch worker. This is the composition root of the application.

  An unusable funding key or an unreachable chain does not fail the build: the
  service comes up, refuses disbursements or retries reconciliation, and
  reports the condition through the health check.
*/
Application Build(const faucet::runtime::config::RuntimeConfig& config);

// Same wiring around an existing chain client.
Application Build(const faucet::runtime::config::RuntimeConfig& config, std::shared_ptr<chain::ChainClient> chain);

} // namespace faucet::factory
