#include "internal/observability/spans.hpp"

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

#include <cstdlib>
#include <utility>

#include "config/config.pb.h"

namespace relations::observability {
namespace otlp      = opentelemetry::exporter::otlp;
namespace trace_api = opentelemetry::trace;
namespace sdktrace  = opentelemetry::sdk::trace;
namespace resource  = opentelemetry::sdk::resource;

namespace {
std::shared_ptr<sdktrace::TracerProvider>           g_sdk_provider;
opentelemetry::nostd::shared_ptr<trace_api::Tracer> g_tracer;

constexpr const char* kTracerName    = "relations-engine";
constexpr const char* kTracerVersion = "0.1.0";

std::string TraceEndpoint(const otel::ExportSettings& settings) {
  if (!settings.endpoint.empty()) {
    return settings.endpoint;
  }
  if (const char* endpoint = std::getenv("OTEL_EXPORTER_OTLP_TRACES_ENDPOINT")) {
    return endpoint;
  }
  if (const char* endpoint = std::getenv("OTEL_EXPORTER_OTLP_ENDPOINT")) {
    return endpoint;
  }
  return settings.transport == otel::Transport::kHttpProtobuf ? "http://localhost:4318/v1/traces" : "localhost:4317";
}

std::string_view StorageBackendName(const relations::runtime::config::DatabaseConfig& database) {
  switch (database.backend_case()) {
    case relations::runtime::config::DatabaseConfig::kSqlite:
      return "sqlite";
    case relations::runtime::config::DatabaseConfig::kPostgres:
      return "postgres";
    case relations::runtime::config::DatabaseConfig::kMemory:
    case relations::runtime::config::DatabaseConfig::BACKEND_NOT_SET:
      break;
  }
  return "memory";
}

} // namespace

namespace otel {

ExportSettings ExportSettingsFrom(const relations::runtime::config::RuntimeConfig& config) {
  const auto& observability = config.observability();

  ExportSettings settings;
  settings.endpoint = observability.otlp_endpoint();
  settings.transport =
      observability.transport() == relations::runtime::config::OTLP_TRANSPORT_HTTP ? Transport::kHttpProtobuf : Transport::kGrpc;
  if (observability.metrics_interval_ms() > 0) {
    settings.metrics_interval_ms = observability.metrics_interval_ms();
  }
  settings.server_name     = config.server().server_name();
  settings.storage_backend = std::string(StorageBackendName(config.database()));
  return settings;
}

} // namespace otel

bool InitializeTracing(const relations::runtime::config::RuntimeConfig& config) {
  if (!config.observability().tracing_enabled()) {
    ShutdownTracing();
    return false;
  }

  const auto settings = otel::ExportSettingsFrom(config);
  const auto endpoint = TraceEndpoint(settings);

  std::unique_ptr<sdktrace::SpanExporter> exporter;
  if (settings.transport == otel::Transport::kHttpProtobuf) {
    otlp::OtlpHttpExporterOptions options;
    options.url = endpoint;
    exporter    = otlp::OtlpHttpExporterFactory::Create(options);
  } else {
    otlp::OtlpGrpcExporterOptions options;
    options.endpoint = endpoint;
    exporter         = otlp::OtlpGrpcExporterFactory::Create(options);
  }

  resource::ResourceAttributes attrs = {
      {"service.name", kTracerName},
      {"service.version", kTracerVersion},
      {"relations.server_name", settings.server_name},
      {"relations.storage_backend", settings.storage_backend},
  };

  auto span_processor = sdktrace::BatchSpanProcessorFactory::Create(std::move(exporter), sdktrace::BatchSpanProcessorOptions{});
  auto provider       = sdktrace::TracerProviderFactory::Create(std::move(span_processor), resource::Resource::Create(attrs));

  g_sdk_provider = std::shared_ptr<sdktrace::TracerProvider>(std::move(provider));
  trace_api::Provider::SetTracerProvider(opentelemetry::nostd::shared_ptr<trace_api::TracerProvider>(g_sdk_provider));
  g_tracer = g_sdk_provider->GetTracer(kTracerName, kTracerVersion);
  return static_cast<bool>(g_tracer);
}

void ShutdownTracing() {
  if (g_sdk_provider) {
    g_sdk_provider->ForceFlush();
    g_sdk_provider->Shutdown();
  }
  g_sdk_provider.reset();
  g_tracer = nullptr;
}

struct SpanScope::Impl {
  opentelemetry::nostd::shared_ptr<trace_api::Span> span;
  std::unique_ptr<trace_api::Scope>                 scope;
};

SpanScope::SpanScope(std::string_view name) : impl_(std::make_unique<Impl>()) {
  if (!g_tracer) {
    return;
  }

  impl_->span  = g_tracer->StartSpan(std::string(name));
  impl_->scope = std::make_unique<trace_api::Scope>(g_tracer->WithActiveSpan(impl_->span));
}

SpanScope::~SpanScope() {
  if (impl_ && impl_->span) {
    impl_->span->End();
  }
}

SpanScope::SpanScope(SpanScope&&) noexcept            = default;
SpanScope& SpanScope::operator=(SpanScope&&) noexcept = default;

void SpanScope::SetAttribute(std::string_view key, std::string_view value) {
  if (impl_ && impl_->span) {
    impl_->span->SetAttribute(std::string(key), std::string(value));
  }
}

void SpanScope::SetAttribute(std::string_view key, std::int64_t value) {
  if (impl_ && impl_->span) {
    impl_->span->SetAttribute(std::string(key), value);
  }
}

void SpanScope::SetRelation(std::string_view target_event_id, std::string_view rel_type, std::string_view event_type) {
  if (!impl_ || !impl_->span) {
    return;
  }
  impl_->span->SetAttribute("relation.target", std::string(target_event_id));
  if (!rel_type.empty()) {
    impl_->span->SetAttribute("relation.rel_type", std::string(rel_type));
  }
  if (!event_type.empty()) {
    impl_->span->SetAttribute("relation.event_type", std::string(event_type));
  }
}

void SpanScope::SetPage(std::uint64_t entries, bool has_next) {
  if (impl_ && impl_->span) {
    impl_->span->SetAttribute("page.entries", static_cast<std::int64_t>(entries));
    impl_->span->SetAttribute("page.has_next", has_next);
  }
}

void SpanScope::RecordException(std::string_view description) {
  if (impl_ && impl_->span) {
    impl_->span->AddEvent("exception", {{"exception.message", std::string(description)}});
    impl_->span->SetStatus(trace_api::StatusCode::kError, std::string(description));
  }
}

} // namespace relations::observability

#endif
