#pragma once

#include <chrono>
#include <string>

namespace faucet::runtime::config {
class RuntimeConfig;
}

namespace faucet::observability {

enum class Signal {
  kTraces,
  kMetrics,
};

/*
  Export settings for one OTLP signal, resolved from the observability section
  and the standard OTEL_* environment variables.

  Endpoint precedence: config, OTEL_EXPORTER_OTLP_<SIGNAL>_ENDPOINT,
  OTEL_EXPORTER_OTLP_ENDPOINT, then the collector default for the transport.
*/
struct OtlpSettings {
  bool                      enabled = false;
  std::string               service_name{"faucet"};
  std::string               endpoint;
  bool                      http   = false;
  bool                      secure = false;
  std::chrono::milliseconds export_interval{5000};
};

OtlpSettings ResolveOtlp(const faucet::runtime::config::RuntimeConfig& config, Signal signal);

} // namespace faucet::observability
