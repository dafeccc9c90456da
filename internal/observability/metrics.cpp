#include "metrics.hpp"

#include <atomic>
#include <string>

#include "internal/observability/logging.hpp"
#include "internal/observability/otlp.hpp"

#ifdef ENABLE_OTEL
#include <opentelemetry/common/attribute_value.h>
#include <opentelemetry/context/context.h>
#include <opentelemetry/exporters/otlp/otlp_grpc_metric_exporter_factory.h>
#include <opentelemetry/exporters/otlp/otlp_grpc_metric_exporter_options.h>
#include <opentelemetry/exporters/otlp/otlp_http_metric_exporter_factory.h>
#include <opentelemetry/exporters/otlp/otlp_http_metric_exporter_options.h>
#include <opentelemetry/metrics/provider.h>
#include <opentelemetry/sdk/metrics/export/periodic_exporting_metric_reader_factory.h>
#include <opentelemetry/sdk/metrics/meter_provider.h>
#include <opentelemetry/sdk/resource/resource.h>
#endif

namespace faucet::observability {

#ifdef ENABLE_OTEL

namespace otlp        = opentelemetry::exporter::otlp;
namespace metrics_api = opentelemetry::metrics;
namespace sdkmetrics  = opentelemetry::sdk::metrics;

namespace {

using AttributePair = std::pair<opentelemetry::nostd::string_view, opentelemetry::common::AttributeValue>;
using Counter       = opentelemetry::nostd::shared_ptr<metrics_api::Counter<std::uint64_t>>;

std::shared_ptr<sdkmetrics::MeterProvider> g_provider;

std::unique_ptr<sdkmetrics::PushMetricExporter> MakeExporter(const OtlpSettings& settings) {
  if (settings.http) {
    otlp::OtlpHttpMetricExporterOptions options;
    options.url = settings.endpoint;
    return otlp::OtlpHttpMetricExporterFactory::Create(options);
  }
  otlp::OtlpGrpcMetricExporterOptions options;
  options.endpoint            = settings.endpoint;
  options.use_ssl_credentials = settings.secure;
  return otlp::OtlpGrpcMetricExporterFactory::Create(options);
}

// SDK releases differ on whether Add/Record take an explicit context.
template <typename Instrument, typename Value>
void AddOne(const Instrument& instrument, Value value, std::string_view key, std::string_view label) {
  const std::string                          label_text(label);
  const std::initializer_list<AttributePair> attributes = {{opentelemetry::nostd::string_view(key.data(), key.size()), label_text}};
  if constexpr (requires { instrument->Add(value, attributes, opentelemetry::context::Context{}); }) {
    instrument->Add(value, attributes, opentelemetry::context::Context{});
  } else {
    instrument->Add(value, attributes);
  }
}

} // namespace

struct Metrics::Impl {
  opentelemetry::nostd::shared_ptr<metrics_api::Meter>              meter;
  Counter                                                           requests;
  opentelemetry::nostd::shared_ptr<metrics_api::Histogram<double>>  latency_ms;
  Counter                                                           admissions;
  Counter                                                           outcomes;
  Counter                                                           attempts;
  opentelemetry::nostd::shared_ptr<metrics_api::ObservableInstrument> queue_depth_gauge;
  std::atomic<std::int64_t>                                         queue_depth{0};
};

bool InitializeMetrics(const faucet::runtime::config::RuntimeConfig& config) {
  const auto settings = ResolveOtlp(config, Signal::kMetrics);
  if (!settings.enabled) {
    ShutdownMetrics();
    return false;
  }

  sdkmetrics::PeriodicExportingMetricReaderOptions reader_options;
  reader_options.export_interval_millis = settings.export_interval;
  auto reader = sdkmetrics::PeriodicExportingMetricReaderFactory::Create(MakeExporter(settings), reader_options);

  opentelemetry::sdk::resource::ResourceAttributes attributes = {{"service.name", settings.service_name}};
  g_provider = std::make_shared<sdkmetrics::MeterProvider>(std::make_unique<sdkmetrics::ViewRegistry>(),
                                                           opentelemetry::sdk::resource::Resource::Create(attributes));
  g_provider->AddMetricReader(std::move(reader));
  metrics_api::Provider::SetMeterProvider(opentelemetry::nostd::shared_ptr<metrics_api::MeterProvider>(g_provider));

  FAUCET_LOG_INFO("metrics enabled", {StringField("endpoint", settings.endpoint), BoolField("http", settings.http)});
  return true;
}

void ShutdownMetrics() {
  if (g_provider) {
    g_provider->ForceFlush();
    g_provider->Shutdown();
  }
  g_provider.reset();
}

Metrics::Metrics() : impl_(std::make_unique<Impl>()) {
  impl_->meter = metrics_api::Provider::GetMeterProvider()->GetMeter("faucet", "0.1.0");

  impl_->requests   = impl_->meter->CreateUInt64Counter("faucet.request.count", "Inbound API requests", "1");
  impl_->latency_ms = impl_->meter->CreateDoubleHistogram("faucet.request.latency_ms", "Inbound API latency", "ms");
  impl_->admissions = impl_->meter->CreateUInt64Counter("faucet.admission.count", "Admission decisions by verdict", "1");
  impl_->outcomes   = impl_->meter->CreateUInt64Counter("faucet.disbursement.outcome.count", "Terminal job outcomes", "1");
  impl_->attempts   = impl_->meter->CreateUInt64Counter("faucet.submission.attempt.count", "Transaction submission attempts", "1");

  impl_->queue_depth_gauge = impl_->meter->CreateInt64ObservableGauge("faucet.dispatch.queue_depth", "Jobs waiting for the submitter", "1");
  impl_->queue_depth_gauge->AddCallback(
      [](metrics_api::ObserverResult result, void* state) {
        auto* impl     = static_cast<Impl*>(state);
        auto  observer = opentelemetry::nostd::get<opentelemetry::nostd::shared_ptr<metrics_api::ObserverResultT<std::int64_t>>>(result);
        observer->Observe(impl->queue_depth.load());
      },
      impl_.get());
}

void Metrics::RecordRequest(std::string_view route, bool success, double latency_ms) {
  AddOne(impl_->requests, static_cast<std::uint64_t>(1), "result", success ? "ok" : "error");
  const std::string                          route_text(route);
  const std::initializer_list<AttributePair> attributes = {{"route", route_text}};
  if constexpr (requires { impl_->latency_ms->Record(latency_ms, attributes, opentelemetry::context::Context{}); }) {
    impl_->latency_ms->Record(latency_ms, attributes, opentelemetry::context::Context{});
  } else {
    impl_->latency_ms->Record(latency_ms, attributes);
  }
}

void Metrics::RecordAdmission(model::Verdict verdict) {
  AddOne(impl_->admissions, static_cast<std::uint64_t>(1), "verdict", model::ToString(verdict));
}

void Metrics::RecordOutcome(model::JobState state) {
  AddOne(impl_->outcomes, static_cast<std::uint64_t>(1), "outcome", model::ToString(state));
}

void Metrics::RecordSubmissionAttempt(std::optional<chain::ChainErrorKind> failure) {
  AddOne(impl_->attempts, static_cast<std::uint64_t>(1), "result", failure ? chain::ToString(*failure) : "accepted");
}

void Metrics::SetQueueDepth(std::size_t depth) {
  impl_->queue_depth.store(static_cast<std::int64_t>(depth));
}

#else

struct Metrics::Impl {};

bool InitializeMetrics(const faucet::runtime::config::RuntimeConfig& config) {
  if (ResolveOtlp(config, Signal::kMetrics).enabled) {
    FAUCET_LOG_WARN("metrics requested but this build has no OpenTelemetry support");
  }
  return false;
}

void ShutdownMetrics() {
}

Metrics::Metrics() = default;

void Metrics::RecordRequest(std::string_view, bool, double) {
}

void Metrics::RecordAdmission(model::Verdict) {
}

void Metrics::RecordOutcome(model::JobState) {
}

void Metrics::RecordSubmissionAttempt(std::optional<chain::ChainErrorKind>) {
}

void Metrics::SetQueueDepth(std::size_t) {
}

#endif

Metrics::~Metrics() = default;

Metrics& Metrics::Instance() {
  static Metrics instance;
  return instance;
}

} // namespace faucet::observability
