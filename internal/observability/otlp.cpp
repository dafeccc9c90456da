#include "otlp.hpp"

#include <cstdlib>

#include "config/config.pb.h"

namespace faucet::observability {

namespace {

std::string EnvOr(const char* name, std::string fallback) {
  const char* value = std::getenv(name);
  return value && *value ? std::string(value) : std::move(fallback);
}

} // namespace

OtlpSettings ResolveOtlp(const faucet::runtime::config::RuntimeConfig& config, Signal signal) {
  const auto& observability = config.observability();

  OtlpSettings settings;
  settings.enabled      = signal == Signal::kTraces ? observability.tracing_enabled() : observability.metrics_enabled();
  settings.http         = observability.transport() == faucet::runtime::config::OTLP_TRANSPORT_HTTP;
  settings.service_name = EnvOr("OTEL_SERVICE_NAME", settings.service_name);
  if (observability.export_interval_ms() > 0) {
    settings.export_interval = std::chrono::milliseconds(observability.export_interval_ms());
  }

  const char* signal_env = signal == Signal::kTraces ? "OTEL_EXPORTER_OTLP_TRACES_ENDPOINT" : "OTEL_EXPORTER_OTLP_METRICS_ENDPOINT";
  const char* path       = signal == Signal::kTraces ? "/v1/traces" : "/v1/metrics";

  settings.endpoint = observability.otlp_endpoint();
  if (settings.endpoint.empty()) {
    settings.endpoint = EnvOr(signal_env, EnvOr("OTEL_EXPORTER_OTLP_ENDPOINT", ""));
  }
  if (settings.endpoint.empty()) {
    settings.endpoint = settings.http ? std::string("http://localhost:4318") + path : "localhost:4317";
  }
  settings.secure = settings.endpoint.rfind("https://", 0) == 0;
  return settings;
}

} // namespace faucet::observability
