#pragma once

#include <cstdint>
#include <memory>
#include <string>
#include <string_view>

namespace modstore::runtime::config {
class RuntimeConfig;
}

namespace modstore::observability {

enum class OtlpTransport {
  kGrpc,
  kHttpProtobuf,
};

struct OtlpConfig {
  std::string   service_name{"modstore"};
  std::string   endpoint{};
  OtlpTransport transport{OtlpTransport::kGrpc};
  bool          insecure{true};
};

bool InitializeTracing(const modstore::runtime::config::RuntimeConfig& config);
bool InitializeMetrics(const modstore::runtime::config::RuntimeConfig& config);
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
  void SetAttribute(std::string_view key, double value);
  void AddEvent(std::string_view name);
  void RecordException(std::string_view description);

 private:
#ifdef MODSTORE_WITH_OTEL
  struct Impl;
  std::unique_ptr<Impl> impl_;
#endif
};

class Metrics {
 public:
  static Metrics& Instance();

  // outcome is a version status name: "success", "validation_failure", ...
  void RecordIngest(std::string_view outcome);
  void ObserveIngestLatencyMs(double latency_ms);
  void ObserveQueueBatchSize(std::uint64_t items);
  void RecordCleanedVersions(std::uint64_t count);

 private:
  Metrics();
#ifdef MODSTORE_WITH_OTEL
  struct Impl;
  std::unique_ptr<Impl> impl_;
#endif
};

#ifndef MODSTORE_WITH_OTEL
inline bool InitializeTracing(const modstore::runtime::config::RuntimeConfig&) {
  return false;
}

inline bool InitializeMetrics(const modstore::runtime::config::RuntimeConfig&) {
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

inline void SpanScope::SetAttribute(std::string_view, double) {
}

inline void SpanScope::AddEvent(std::string_view) {
}

inline void SpanScope::RecordException(std::string_view) {
}

inline Metrics::Metrics() {
}

inline Metrics& Metrics::Instance() {
  static Metrics instance;
  return instance;
}

inline void Metrics::RecordIngest(std::string_view) {
}

inline void Metrics::ObserveIngestLatencyMs(double) {
}

inline void Metrics::ObserveQueueBatchSize(std::uint64_t) {
}

inline void Metrics::RecordCleanedVersions(std::uint64_t) {
}
#endif

} // namespace modstore::observability
