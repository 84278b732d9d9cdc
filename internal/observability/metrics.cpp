#include "internal/observability/spans.hpp"

#ifdef MODSTORE_WITH_OTEL

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

#include <chrono>
#include <cstdlib>
#include <memory>
#include <utility>

#include "config/config.pb.h"

namespace modstore::observability {
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

  return config.transport == OtlpTransport::kHttpProtobuf ? "http://localhost:4318/v1/metrics" : "localhost:4317";
}

resource::Resource BuildResource(const OtlpConfig& config) {
  resource::ResourceAttributes attrs = {{"service.name", config.service_name}};
  return resource::Resource::Create(attrs);
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

template <typename Instrument, typename Value>
void RecordValue(const opentelemetry::nostd::shared_ptr<Instrument>& instrument, Value value) {
  if constexpr (requires { instrument->Record(value, opentelemetry::context::Context{}); }) {
    instrument->Record(value, opentelemetry::context::Context{});
  } else {
    instrument->Record(value);
  }
}

} // namespace

struct Metrics::Impl {
  opentelemetry::nostd::shared_ptr<metrics_api::Meter> meter;

  opentelemetry::nostd::shared_ptr<metrics_api::Counter<std::uint64_t>> ingest_count;
  opentelemetry::nostd::shared_ptr<metrics_api::Histogram<double>>      ingest_latency_ms;
  opentelemetry::nostd::shared_ptr<metrics_api::Histogram<std::uint64_t>> queue_batch_size;
  opentelemetry::nostd::shared_ptr<metrics_api::Counter<std::uint64_t>> cleaned_versions;
};

bool InitializeMetrics(const modstore::runtime::config::RuntimeConfig& config) {
  const auto& observability = config.observability();
  if (!observability.metrics_enabled()) {
    ShutdownMetrics();
    return false;
  }

  OtlpConfig otlp_config;
  otlp_config.endpoint = observability.otlp_endpoint();
  if (!observability.service_name().empty()) {
    otlp_config.service_name = observability.service_name();
  }
  otlp_config.transport = observability.transport() == modstore::runtime::config::OTLP_TRANSPORT_HTTP
                              ? OtlpTransport::kHttpProtobuf
                              : OtlpTransport::kGrpc;

  auto endpoint = ResolveEndpoint(otlp_config);

  std::unique_ptr<sdkmetrics::PushMetricExporter> exporter;
  if (otlp_config.transport == OtlpTransport::kHttpProtobuf) {
    otlp::OtlpHttpMetricExporterOptions options;
    options.url = endpoint;
    exporter    = otlp::OtlpHttpMetricExporterFactory::Create(options);
  } else {
    otlp::OtlpGrpcMetricExporterOptions options;
    options.endpoint            = endpoint;
    options.use_ssl_credentials = !otlp_config.insecure;
    exporter                    = otlp::OtlpGrpcMetricExporterFactory::Create(options);
  }

  sdkmetrics::PeriodicExportingMetricReaderOptions reader_options;
  const auto interval_ms = observability.metrics_interval_ms() > 0 ? observability.metrics_interval_ms() : 1000;
  reader_options.export_interval_millis = std::chrono::milliseconds(interval_ms);
  auto reader = sdkmetrics::PeriodicExportingMetricReaderFactory::Create(std::move(exporter), reader_options);

  g_provider = std::make_shared<sdkmetrics::MeterProvider>(
      std::unique_ptr<sdkmetrics::ViewRegistry>(new sdkmetrics::ViewRegistry()), BuildResource(otlp_config));
  AddMetricReaderCompat(g_provider, std::move(reader));

  metrics_api::Provider::SetMeterProvider(opentelemetry::nostd::shared_ptr<metrics_api::MeterProvider>(g_provider));
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
  auto provider = metrics_api::Provider::GetMeterProvider();
  impl_->meter  = provider->GetMeter("modstore", "0.1.0");

  impl_->ingest_count      = impl_->meter->CreateUInt64Counter("modstore.ingest.count", "Ingestion attempts by outcome", "1");
  impl_->ingest_latency_ms = impl_->meter->CreateDoubleHistogram("modstore.ingest.latency_ms", "Ingestion latency", "ms");
  impl_->queue_batch_size  = impl_->meter->CreateUInt64Histogram("modstore.queue.batch_size", "Items per dequeued batch", "1");
  impl_->cleaned_versions  = impl_->meter->CreateUInt64Counter("modstore.retention.cleaned", "Versions removed by retention", "1");
}

Metrics& Metrics::Instance() {
  static Metrics instance;
  return instance;
}

void Metrics::RecordIngest(std::string_view outcome) {
  if (!impl_ || !impl_->ingest_count) {
    return;
  }
  const std::initializer_list<AttributePair> attributes = {{"outcome", std::string(outcome)}};
  AddWithAttributes(impl_->ingest_count, static_cast<std::uint64_t>(1), attributes);
}

void Metrics::ObserveIngestLatencyMs(double latency_ms) {
  if (impl_ && impl_->ingest_latency_ms) {
    RecordValue(impl_->ingest_latency_ms, latency_ms);
  }
}

void Metrics::ObserveQueueBatchSize(std::uint64_t items) {
  if (impl_ && impl_->queue_batch_size) {
    RecordValue(impl_->queue_batch_size, items);
  }
}

void Metrics::RecordCleanedVersions(std::uint64_t count) {
  if (impl_ && impl_->cleaned_versions) {
    AddWithAttributes(impl_->cleaned_versions, count, std::initializer_list<AttributePair>{});
  }
}

} // namespace modstore::observability

#endif
