#pragma once

#include <cstdint>
#include <memory>
#include <string>
#include <string_view>

namespace relations::runtime::config {
class RuntimeConfig;
}

namespace relations::observability {

bool InitializeTracing(const relations::runtime::config::RuntimeConfig& config);
bool InitializeMetrics(const relations::runtime::config::RuntimeConfig& config);
void ShutdownTracing();
void ShutdownMetrics();

class SpanScope {
 public:
  explicit SpanScope(std::string_view name);
  ~SpanScope();

  SpanScope(const SpanScope&)            = delete;
  SpanScope& operator=(const SpanScope&) = delete;

  SpanScope(SpanScope&&) noexcept;
  SpanScope& operator=(SpanScope&&) noexcept;

  void SetAttribute(std::string_view key, std::string_view value);
  void SetAttribute(std::string_view key, std::int64_t value);

  // relation.target, plus relation.rel_type / relation.event_type when the
  // read or write is narrowed to them.
  void SetRelation(std::string_view target_event_id, std::string_view rel_type, std::string_view event_type = {});
  // page.entries and page.has_next of a paginated read
  void SetPage(std::uint64_t entries, bool has_next);

  void RecordException(std::string_view description);

 private:
#ifdef ENABLE_OTEL
  struct Impl;
  std::unique_ptr<Impl> impl_;
#endif
};

class Metrics {
 public:
  static Metrics& Instance();

  void RecordRequest(std::string_view route, bool success);
  void ObserveRequestLatencyMs(std::string_view route, double latency_ms);
  // one per persisted relation edge
  void RecordRelationIngested(std::string_view rel_type);
  // one per soft-deleted relation edge
  void RecordRelationRedacted(std::string_view rel_type);
  // number of entries returned by a paginated read
  void ObservePageSize(std::string_view route, std::uint64_t entries);

 private:
  Metrics();
#ifdef ENABLE_OTEL
  struct Impl;
  std::unique_ptr<Impl> impl_;
#endif
};

#ifdef ENABLE_OTEL
namespace otel {

enum class Transport {
  kGrpc,
  kHttpProtobuf,
};

// Exporter settings shared by the trace and metric pipelines.
struct ExportSettings {
  std::string   endpoint;
  Transport     transport{Transport::kGrpc};
  std::uint32_t metrics_interval_ms{1000};
  std::string   server_name;
  std::string   storage_backend;
};

ExportSettings ExportSettingsFrom(const relations::runtime::config::RuntimeConfig& config);

} // namespace otel
#else
inline bool InitializeTracing(const relations::runtime::config::RuntimeConfig&) {
  return false;
}

inline bool InitializeMetrics(const relations::runtime::config::RuntimeConfig&) {
  return false;
}

inline void ShutdownTracing() {
}

inline void ShutdownMetrics() {
}

inline SpanScope::SpanScope(std::string_view) {
}

inline SpanScope::~SpanScope() {
}

inline SpanScope::SpanScope(SpanScope&&) noexcept = default;

inline SpanScope& SpanScope::operator=(SpanScope&&) noexcept = default;

inline void SpanScope::SetAttribute(std::string_view, std::string_view) {
}

inline void SpanScope::SetAttribute(std::string_view, std::int64_t) {
}

inline void SpanScope::SetRelation(std::string_view, std::string_view, std::string_view) {
}

inline void SpanScope::SetPage(std::uint64_t, bool) {
}

inline void SpanScope::RecordException(std::string_view) {
}

inline Metrics::Metrics() {
}

inline Metrics& Metrics::Instance() {
  static Metrics instance;
  return instance;
}

inline void Metrics::RecordRequest(std::string_view, bool) {
}

inline void Metrics::ObserveRequestLatencyMs(std::string_view, double) {
}

inline void Metrics::RecordRelationIngested(std::string_view) {
}

inline void Metrics::RecordRelationRedacted(std::string_view) {
}

inline void Metrics::ObservePageSize(std::string_view, std::uint64_t) {
}
#endif

} // namespace relations::observability
