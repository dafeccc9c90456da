#pragma once

#include <cstdint>
#include <memory>
#include <string_view>

namespace faucet::runtime::config {
class RuntimeConfig;
}

namespace faucet::observability {

// Installs the OTLP tracer provider when observability.tracing_enabled is set.
// Returns false when tracing stays off, including builds without ENABLE_OTEL.
bool InitializeTracing(const faucet::runtime::config::RuntimeConfig& config);
void ShutdownTracing();

/*
  RAII span, active on the current thread until destroyed. Without a tracer
  provider every call is a no-op.
*/
class SpanScope {
 public:
  explicit SpanScope(std::string_view name);
  ~SpanScope();

  SpanScope(const SpanScope&)            = delete;
  SpanScope& operator=(const SpanScope&) = delete;

  void SetAttribute(std::string_view key, std::string_view value);
  void SetAttribute(std::string_view key, std::int64_t value);
  void RecordException(std::string_view description);

 private:
  struct Impl;
  std::unique_ptr<Impl> impl_;
};

} // namespace faucet::observability
