#include "tracing.hpp"

#include <string>

#include "internal/observability/logging.hpp"
#include "internal/observability/otlp.hpp"

#ifdef ENABLE_OTEL
#include <opentelemetry/exporters/otlp/otlp_grpc_exporter_factory.h>
#include <opentelemetry/exporters/otlp/otlp_grpc_exporter_options.h>
#include <opentelemetry/exporters/otlp/otlp_http_exporter_factory.h>
#include <opentelemetry/exporters/otlp/otlp_http_exporter_options.h>
#include <opentelemetry/sdk/resource/resource.h>
#include <opentelemetry/sdk/trace/batch_span_processor_factory.h>
#include <opentelemetry/sdk/trace/batch_span_processor_options.h>
#include <opentelemetry/sdk/trace/tracer_provider_factory.h>
#include <opentelemetry/trace/provider.h>
#endif

namespace faucet::observability {

#ifdef ENABLE_OTEL

namespace otlp      = opentelemetry::exporter::otlp;
namespace trace_api = opentelemetry::trace;
namespace sdktrace  = opentelemetry::sdk::trace;

namespace {

std::shared_ptr<sdktrace::TracerProvider>           g_provider;
opentelemetry::nostd::shared_ptr<trace_api::Tracer> g_tracer;

std::unique_ptr<sdktrace::SpanExporter> MakeExporter(const OtlpSettings& settings) {
  if (settings.http) {
    otlp::OtlpHttpExporterOptions options;
    options.url = settings.endpoint;
    return otlp::OtlpHttpExporterFactory::Create(options);
  }
  otlp::OtlpGrpcExporterOptions options;
  options.endpoint            = settings.endpoint;
  options.use_ssl_credentials = settings.secure;
  return otlp::OtlpGrpcExporterFactory::Create(options);
}

} // namespace

struct SpanScope::Impl {
  opentelemetry::nostd::shared_ptr<trace_api::Span> span;
  std::unique_ptr<trace_api::Scope>                 scope;
};

bool InitializeTracing(const faucet::runtime::config::RuntimeConfig& config) {
  const auto settings = ResolveOtlp(config, Signal::kTraces);
  if (!settings.enabled) {
    ShutdownTracing();
    return false;
  }

  auto processor = sdktrace::BatchSpanProcessorFactory::Create(MakeExporter(settings), sdktrace::BatchSpanProcessorOptions{});
  opentelemetry::sdk::resource::ResourceAttributes attributes = {{"service.name", settings.service_name}};
  auto resource = opentelemetry::sdk::resource::Resource::Create(attributes);

  g_provider = std::shared_ptr<sdktrace::TracerProvider>(sdktrace::TracerProviderFactory::Create(std::move(processor), resource));
  trace_api::Provider::SetTracerProvider(opentelemetry::nostd::shared_ptr<trace_api::TracerProvider>(g_provider));
  g_tracer = g_provider->GetTracer("faucet", "0.1.0");

  FAUCET_LOG_INFO("tracing enabled", {StringField("endpoint", settings.endpoint), BoolField("http", settings.http)});
  return true;
}

void ShutdownTracing() {
  if (g_provider) {
    g_provider->ForceFlush();
    g_provider->Shutdown();
  }
  g_provider.reset();
  g_tracer = nullptr;
}

SpanScope::SpanScope(std::string_view name) {
  if (!g_tracer) {
    return;
  }
  impl_        = std::make_unique<Impl>();
  impl_->span  = g_tracer->StartSpan(std::string(name));
  impl_->scope = std::make_unique<trace_api::Scope>(g_tracer->WithActiveSpan(impl_->span));
}

SpanScope::~SpanScope() {
  if (impl_) {
    impl_->scope.reset();
    impl_->span->End();
  }
}

void SpanScope::SetAttribute(std::string_view key, std::string_view value) {
  if (impl_) {
    impl_->span->SetAttribute(std::string(key), std::string(value));
  }
}

void SpanScope::SetAttribute(std::string_view key, std::int64_t value) {
  if (impl_) {
    impl_->span->SetAttribute(std::string(key), value);
  }
}

void SpanScope::RecordException(std::string_view description) {
  if (impl_) {
    impl_->span->AddEvent("exception", {{"exception.message", std::string(description)}});
    impl_->span->SetStatus(trace_api::StatusCode::kError, std::string(description));
  }
}

#else

struct SpanScope::Impl {};

bool InitializeTracing(const faucet::runtime::config::RuntimeConfig& config) {
  if (ResolveOtlp(config, Signal::kTraces).enabled) {
    FAUCET_LOG_WARN("tracing requested but this build has no OpenTelemetry support");
  }
  return false;
}

void ShutdownTracing() {
}

SpanScope::SpanScope(std::string_view) {
}

SpanScope::~SpanScope() = default;

void SpanScope::SetAttribute(std::string_view, std::string_view) {
}

void SpanScope::SetAttribute(std::string_view, std::int64_t) {
}

void SpanScope::RecordException(std::string_view) {
}

#endif

} // namespace faucet::observability
