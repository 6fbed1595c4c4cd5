#include "internal/observability/metrics.hpp"

#ifdef ENABLE_OTEL

#include <opentelemetry/common/attribute_value.h>
#include <opentelemetry/context/context.h>
#include <opentelemetry/exporters/otlp/otlp_grpc_metric_exporter_factory.h>
#include <opentelemetry/exporters/otlp/otlp_grpc_metric_exporter_options.h>
#include <opentelemetry/metrics/provider.h>
#include <opentelemetry/sdk/metrics/meter_provider.h>

#include <chrono>
#include <cstdlib>
#include <memory>
#include <utility>
#if __has_include(<opentelemetry/sdk/metrics/periodic_exporting_metric_reader_factory.h>)
#define TRUSTMEM_OTEL_METRIC_READER_FACTORY 1
#include <opentelemetry/sdk/metrics/periodic_exporting_metric_reader_factory.h>
#elif __has_include(<opentelemetry/sdk/metrics/export/periodic_exporting_metric_reader_factory.h>)
#define TRUSTMEM_OTEL_METRIC_READER_FACTORY 1
#include <opentelemetry/sdk/metrics/export/periodic_exporting_metric_reader_factory.h>
#elif __has_include(<opentelemetry/sdk/metrics/periodic_exporting_metric_reader.h>)
#include <opentelemetry/sdk/metrics/periodic_exporting_metric_reader.h>
#else
#include <opentelemetry/sdk/metrics/export/periodic_exporting_metric_reader.h>
#endif
#include <opentelemetry/sdk/resource/resource.h>

#include "config/config.pb.h"

namespace trustmem::observability {
namespace otlp        = opentelemetry::exporter::otlp;
namespace metrics_api = opentelemetry::metrics;
namespace sdkmetrics  = opentelemetry::sdk::metrics;
namespace resource    = opentelemetry::sdk::resource;

namespace {
using AttributePair = std::pair<opentelemetry::nostd::string_view, opentelemetry::common::AttributeValue>;
std::shared_ptr<sdkmetrics::MeterProvider> g_provider;

std::string ResolveEndpoint(const OtlpConfig& config) {
  if (!config.endpoint.empty()) {
    return config.endpoint;
  }

  if (const char* endpoint = std::getenv("OTEL_EXPORTER_OTLP_METRICS_ENDPOINT")) {
    return endpoint;
  }
  if (const char* endpoint = std::getenv("OTEL_EXPORTER_OTLP_ENDPOINT")) {
    return endpoint;
  }

  return "localhost:4317";
}

template <typename Provider>
void ConfigureResource(Provider& provider, const resource::Resource& res) {
  if constexpr (requires { provider.SetResource(res); }) {
    provider.SetResource(res);
  }
}

template <typename Provider>
void AddMetricReaderCompat(const std::shared_ptr<Provider>& provider, std::unique_ptr<sdkmetrics::MetricReader> reader) {
  if constexpr (requires { provider->AddMetricReader(std::move(reader)); }) {
    provider->AddMetricReader(std::move(reader));
  } else {
    provider->AddMetricReader(std::shared_ptr<sdkmetrics::MetricReader>(std::move(reader)));
  }
}

template <typename Instrument, typename Value, typename Attributes>
void AddWithAttributes(const opentelemetry::nostd::shared_ptr<Instrument>& instrument, Value value, Attributes&& attributes) {
  if constexpr (requires { instrument->Add(value, std::forward<Attributes>(attributes), opentelemetry::context::Context{}); }) {
    instrument->Add(value, std::forward<Attributes>(attributes), opentelemetry::context::Context{});
  } else {
    instrument->Add(value, std::forward<Attributes>(attributes));
  }
}

template <typename Instrument, typename Value, typename Attributes>
void RecordWithAttributes(const opentelemetry::nostd::shared_ptr<Instrument>& instrument, Value value, Attributes&& attributes) {
  if constexpr (requires { instrument->Record(value, std::forward<Attributes>(attributes), opentelemetry::context::Context{}); }) {
    instrument->Record(value, std::forward<Attributes>(attributes), opentelemetry::context::Context{});
  } else {
    instrument->Record(value, std::forward<Attributes>(attributes));
  }
}

} // namespace

struct Metrics::Impl {
  opentelemetry::nostd::shared_ptr<metrics_api::Meter> meter;

  opentelemetry::nostd::shared_ptr<metrics_api::Counter<std::uint64_t>> operation_count;
  opentelemetry::nostd::shared_ptr<metrics_api::Histogram<double>>      operation_latency_ms;
  opentelemetry::nostd::shared_ptr<metrics_api::Histogram<double>>      gc_duration_ms;
  opentelemetry::nostd::shared_ptr<metrics_api::Counter<std::uint64_t>> gc_decisions;
  opentelemetry::nostd::shared_ptr<metrics_api::Counter<std::uint64_t>> read_skipped;
  opentelemetry::nostd::shared_ptr<metrics_api::Counter<std::uint64_t>> audit_gaps;
};

bool InitializeMetrics(const OtlpConfig& config) {
  otlp::OtlpGrpcMetricExporterOptions options;
  options.endpoint            = ResolveEndpoint(config);
  options.use_ssl_credentials = !config.insecure;
  auto exporter               = otlp::OtlpGrpcMetricExporterFactory::Create(options);

  sdkmetrics::PeriodicExportingMetricReaderOptions reader_options;
  reader_options.export_interval_millis = std::chrono::milliseconds(1000);
#ifdef TRUSTMEM_OTEL_METRIC_READER_FACTORY
  auto reader = sdkmetrics::PeriodicExportingMetricReaderFactory::Create(std::move(exporter), reader_options);
#else
  auto reader = std::make_unique<sdkmetrics::PeriodicExportingMetricReader>(std::move(exporter), reader_options);
#endif

  resource::ResourceAttributes attrs = {{"service.name", config.service_name}};
  auto                         res   = resource::Resource::Create(attrs);
  g_provider = std::make_shared<sdkmetrics::MeterProvider>(std::unique_ptr<sdkmetrics::ViewRegistry>(new sdkmetrics::ViewRegistry()), res);
  ConfigureResource(*g_provider, res);
  AddMetricReaderCompat(g_provider, std::move(reader));

  metrics_api::Provider::SetMeterProvider(opentelemetry::nostd::shared_ptr<metrics_api::MeterProvider>(g_provider));
  return true;
}

bool InitializeMetrics(const trustmem::runtime::config::RuntimeConfig& config) {
  const auto& observability = config.observability();
  if (!observability.metrics_enabled()) {
    ShutdownMetrics();
    return false;
  }

  OtlpConfig otlp_config;
  otlp_config.endpoint = observability.otlp_endpoint();
  return InitializeMetrics(otlp_config);
}

void ShutdownMetrics() {
  if (g_provider) {
    g_provider->ForceFlush();
    g_provider->Shutdown();
  }
  g_provider.reset();
}

Metrics::Metrics() : impl_(std::make_unique<Impl>()) {
  auto provider = metrics_api::Provider::GetMeterProvider();
  impl_->meter  = provider->GetMeter("trust-memory", "0.1.0");

  impl_->operation_count      = impl_->meter->CreateUInt64Counter("trust_memory.operation.count", "1", "Bank operations by name and outcome");
  impl_->operation_latency_ms = impl_->meter->CreateDoubleHistogram("trust_memory.operation.latency_ms", "ms", "Bank operation latency in milliseconds");
  impl_->gc_duration_ms       = impl_->meter->CreateDoubleHistogram("trust_memory.gc.duration_ms", "ms", "Garbage collection run duration in milliseconds");
  impl_->gc_decisions         = impl_->meter->CreateUInt64Counter("trust_memory.gc.decisions", "1", "Artifacts archived or deleted by garbage collection");
  impl_->read_skipped         = impl_->meter->CreateUInt64Counter("trust_memory.read.skipped", "1", "Read candidates skipped because they could not be scored");
  impl_->audit_gaps           = impl_->meter->CreateUInt64Counter("trust_memory.ledger.audit_gaps", "1", "Ledger appends that failed after a committed write");
}

Metrics& Metrics::Instance() {
  static Metrics instance;
  return instance;
}

void Metrics::RecordOperation(std::string_view op, bool success) {
  if (!impl_ || !impl_->operation_count) {
    return;
  }

  const std::initializer_list<AttributePair> attributes = {{"op", std::string(op)}, {"success", success}};
  AddWithAttributes(impl_->operation_count, static_cast<std::uint64_t>(1), attributes);
}

void Metrics::ObserveOperationLatencyMs(std::string_view op, double latency_ms) {
  if (!impl_ || !impl_->operation_latency_ms) {
    return;
  }

  const std::initializer_list<AttributePair> attributes = {{"op", std::string(op)}};
  RecordWithAttributes(impl_->operation_latency_ms, latency_ms, attributes);
}

void Metrics::ObserveGcDurationMs(std::string_view policy, double duration_ms) {
  if (!impl_ || !impl_->gc_duration_ms) {
    return;
  }

  const std::initializer_list<AttributePair> attributes = {{"policy", std::string(policy)}};
  RecordWithAttributes(impl_->gc_duration_ms, duration_ms, attributes);
}

void Metrics::RecordGcDecisions(std::string_view policy, std::uint64_t archived, std::uint64_t deleted) {
  if (!impl_ || !impl_->gc_decisions) {
    return;
  }

  const std::initializer_list<AttributePair> archived_attrs = {{"policy", std::string(policy)}, {"decision", "archive"}};
  const std::initializer_list<AttributePair> deleted_attrs  = {{"policy", std::string(policy)}, {"decision", "delete"}};
  AddWithAttributes(impl_->gc_decisions, archived, archived_attrs);
  AddWithAttributes(impl_->gc_decisions, deleted, deleted_attrs);
}

void Metrics::RecordReadSkipped() {
  if (!impl_ || !impl_->read_skipped) {
    return;
  }
  AddWithAttributes(impl_->read_skipped, static_cast<std::uint64_t>(1), std::initializer_list<AttributePair>{});
}

void Metrics::RecordAuditGap() {
  if (!impl_ || !impl_->audit_gaps) {
    return;
  }
  AddWithAttributes(impl_->audit_gaps, static_cast<std::uint64_t>(1), std::initializer_list<AttributePair>{});
}

} // namespace trustmem::observability

#endif
