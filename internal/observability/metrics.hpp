#pragma once

#include <cstddef>
#include <memory>
#include <optional>
#include <string_view>

#include "internal/chain/chain_error.hpp"
#include "internal/model/disbursement.hpp"
#include "internal/model/state_machine.hpp"

namespace faucet::runtime::config {
class RuntimeConfig;
}

namespace faucet::observability {

// Installs the OTLP meter provider when observability.metrics_enabled is set.
bool InitializeMetrics(const faucet::runtime::config::RuntimeConfig& config);
void ShutdownMetrics();

/*
  Process-wide faucet instruments:

    faucet.request.count / faucet.request.latency_ms    per inbound route
    faucet.admission.count                              per verdict
    faucet.disbursement.outcome.count                   per terminal state
    faucet.submission.attempt.count                     accepted or chain error kind
    faucet.dispatch.queue_depth                         observable gauge

  Every call is a no-op until a meter provider is installed.
*/
class Metrics {
 public:
  static Metrics& Instance();

  ~Metrics();

  void RecordRequest(std::string_view route, bool success, double latency_ms);
  void RecordAdmission(model::Verdict verdict);
  void RecordOutcome(model::JobState state);
  // nullopt for an attempt the node accepted.
  void RecordSubmissionAttempt(std::optional<chain::ChainErrorKind> failure);
  void SetQueueDepth(std::size_t depth);

 private:
  Metrics();

  struct Impl;
  std::unique_ptr<Impl> impl_;
};

} // namespace faucet::observability
