#pragma once

#include <cstdint>
#include <memory>
#include <string>
#include <string_view>

namespace fleet::runtime::config {
class RuntimeConfig;
}

namespace fleet::observability {

enum class OtlpTransport {
  kGrpc,
  kHttpProtobuf,
};

struct OtlpConfig {
  std::string   service_name{"fleet"};
  std::string   endpoint{};
  OtlpTransport transport{OtlpTransport::kHttpProtobuf};
  bool          insecure{true};
};

/*
  Optional OpenTelemetry tracing.

  Builds configured with FLEET_ENABLE_OTEL export spans over OTLP. Other
  builds compile every call below to a no-op, so call sites never need
  their own #ifdef.

  InitializeTracing returns false when tracing stays off.
*/
bool InitializeTracing(const OtlpConfig& config);
bool InitializeTracing(const fleet::runtime::config::RuntimeConfig& config);
void ShutdownTracing();

// Span covering the enclosing scope; ended by the destructor.
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
  void SetAttribute(std::string_view key, bool value);
  void AddEvent(std::string_view name);
  void RecordException(std::string_view description);

  // false when no tracer is installed
  bool recording() const;

 private:
#ifdef FLEET_ENABLE_OTEL
  struct Impl;
  std::unique_ptr<Impl> impl_;
#endif
};

#ifndef FLEET_ENABLE_OTEL
inline bool InitializeTracing(const OtlpConfig&) {
  return false;
}

inline bool InitializeTracing(const fleet::runtime::config::RuntimeConfig&) {
  return false;
}

inline void ShutdownTracing() {
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

inline void SpanScope::SetAttribute(std::string_view, bool) {
}

inline void SpanScope::AddEvent(std::string_view) {
}

inline void SpanScope::RecordException(std::string_view) {
}

inline bool SpanScope::recording() const {
  return false;
}
#endif

} // namespace fleet::observability
