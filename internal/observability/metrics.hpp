#pragma once

#include <cstdint>
#include <memory>
#include <string>
#include <string_view>

namespace trustmem::runtime::config {
class RuntimeConfig;
}

namespace trustmem::observability {

struct OtlpConfig {
  std::string service_name{"trust-memory"};
  std::string endpoint{};
  bool        insecure{true};
};

bool InitializeMetrics(const OtlpConfig& config = {});
bool InitializeMetrics(const trustmem::runtime::config::RuntimeConfig& config);
void ShutdownMetrics();

/*
  Process-wide metric instruments.

  Backed by OpenTelemetry when built with ENABLE_OTEL; otherwise every call is
  an inline no-op. MemoryBank::Stats() is the always-available counterpart.
*/
class Metrics {
 public:
  static Metrics& Instance();

  void RecordOperation(std::string_view op, bool success);
  void ObserveOperationLatencyMs(std::string_view op, double latency_ms);
  void ObserveGcDurationMs(std::string_view policy, double duration_ms);
  void RecordGcDecisions(std::string_view policy, std::uint64_t archived, std::uint64_t deleted);
  void RecordReadSkipped();
  void RecordAuditGap();

 private:
  Metrics();
#ifdef ENABLE_OTEL
  struct Impl;
  std::unique_ptr<Impl> impl_;
#endif
};

#ifndef ENABLE_OTEL
inline bool InitializeMetrics(const OtlpConfig&) {
  return false;
}

inline bool InitializeMetrics(const trustmem::runtime::config::RuntimeConfig&) {
  return false;
}

inline void ShutdownMetrics() {
}

inline Metrics::Metrics() {
}

inline Metrics& Metrics::Instance() {
  static Metrics instance;
  return instance;
}

inline void Metrics::RecordOperation(std::string_view, bool) {
}

inline void Metrics::ObserveOperationLatencyMs(std::string_view, double) {
}

inline void Metrics::ObserveGcDurationMs(std::string_view, double) {
}

inline void Metrics::RecordGcDecisions(std::string_view, std::uint64_t, std::uint64_t) {
}

inline void Metrics::RecordReadSkipped() {
}

inline void Metrics::RecordAuditGap() {
}
#endif

} // namespace trustmem::observability
