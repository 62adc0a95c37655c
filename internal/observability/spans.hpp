#pragma once

#include <cstdint>
#include <memory>
#include <string>
#include <string_view>

namespace satp::runtime::config {
class RuntimeConfig;
}

namespace satp::observability {

enum class OtlpTransport {
  kGrpc,
  kHttpProtobuf,
};

struct OtlpConfig {
  std::string   service_name{"satp-gateway"};
  std::string   endpoint{};
  OtlpTransport transport{OtlpTransport::kGrpc};
  bool          insecure{true};
};

bool InitializeTracing(const satp::runtime::config::RuntimeConfig& config);
bool InitializeMetrics(const satp::runtime::config::RuntimeConfig& config);
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
  void AddEvent(std::string_view name);
  void RecordException(std::string_view description);

 private:
#ifdef ENABLE_OTEL
  struct Impl;
  std::unique_ptr<Impl> impl_;
#endif
};

/*
  Gateway metrics.

    satp.request.count / satp.request.latency_ms   per RPC route
    satp.transfer.count                            terminal outcomes
    satp.stage.attempts / satp.stage.latency_ms    per stage
    satp.sessions.active                           sessions executing now
*/
class Metrics {
 public:
  static Metrics& Instance();

  void RecordRequest(std::string_view route, bool success);
  void ObserveRequestLatencyMs(std::string_view route, double latency_ms);
  void RecordTransfer(std::string_view outcome);
  void RecordStageAttempt(std::string_view stage, bool success);
  void ObserveStageLatencyMs(std::string_view stage, double latency_ms);
  void SetActiveSessions(std::int64_t count);

 private:
  Metrics();
#ifdef ENABLE_OTEL
  struct Impl;
  std::unique_ptr<Impl> impl_;
#endif
};

#ifndef ENABLE_OTEL
inline bool InitializeTracing(const satp::runtime::config::RuntimeConfig&) {
  return false;
}

inline bool InitializeMetrics(const satp::runtime::config::RuntimeConfig&) {
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

inline void Metrics::RecordRequest(std::string_view, bool) {
}

inline void Metrics::ObserveRequestLatencyMs(std::string_view, double) {
}

inline void Metrics::RecordTransfer(std::string_view) {
}

inline void Metrics::RecordStageAttempt(std::string_view, bool) {
}

inline void Metrics::ObserveStageLatencyMs(std::string_view, double) {
}

inline void Metrics::SetActiveSessions(std::int64_t) {
}
#endif

} // namespace satp::observability
