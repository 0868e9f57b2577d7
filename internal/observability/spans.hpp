#pragma once

#include <cstdint>
#include <memory>
#include <string>
#include <string_view>

#include "internal/observability/otlp_config.hpp"

namespace mediaflow::runtime::config {
class RuntimeConfig;
}

namespace mediaflow::observability {

bool InitializeTracing(const mediaflow::runtime::config::RuntimeConfig& config);
bool InitializeMetrics(const mediaflow::runtime::config::RuntimeConfig& config);
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
  // Sets mediaflow.error_kind and an error status carrying the message.
  void MarkFailed(std::string_view error_kind, std::string_view message);

 private:
#ifdef ENABLE_OTEL
  struct Impl;
  std::unique_ptr<Impl> impl_;
#endif
};

/*
  Process-wide upload instruments.

  outcome labels are the lowercase UploadErrorKind names plus "success"
  and "cancelled".
*/
class Metrics {
 public:
  static Metrics& Instance();

  void RecordRequest(std::string_view route, bool success);
  void ObserveRequestLatencyMs(std::string_view route, double latency_ms);

  void RecordUploadOutcome(std::string_view media_kind, std::string_view outcome);
  void ObserveUploadDurationMs(std::string_view media_kind, double duration_ms);
  void RecordStall(std::string_view quality);
  void SetActiveTransfers(std::uint64_t count);

 private:
  Metrics();
#ifdef ENABLE_OTEL
  struct Impl;
  std::unique_ptr<Impl> impl_;
#endif
};

#ifndef ENABLE_OTEL
inline bool InitializeTracing(const mediaflow::runtime::config::RuntimeConfig&) {
  return false;
}

inline bool InitializeMetrics(const mediaflow::runtime::config::RuntimeConfig&) {
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

inline void SpanScope::MarkFailed(std::string_view, std::string_view) {
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

inline void Metrics::RecordUploadOutcome(std::string_view, std::string_view) {
}

inline void Metrics::ObserveUploadDurationMs(std::string_view, double) {
}

inline void Metrics::RecordStall(std::string_view) {
}

inline void Metrics::SetActiveTransfers(std::uint64_t) {
}
#endif

} // namespace mediaflow::observability
