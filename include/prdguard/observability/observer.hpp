#pragma once

#include <chrono>
#include <cstdint>
#include <string>
#include <string_view>
#include <variant>

namespace prdguard::observability {

/// Mirror of an audit event, flattened to strings so this layer stays independent of
/// the security types.
struct SecurityEventLogged {
  std::string type;
  std::string severity;
  std::string context_id;
  std::string summary;
};

struct FileOperationEvent {
  std::string operation;
  std::string path;
  std::chrono::microseconds duration{0};
  bool success = false;
};

struct ThreatScanEvent {
  std::string backend;
  std::chrono::microseconds duration{0};
  bool safe = true;
};

struct ErrorEvent {
  std::string component;
  std::string message;
};

/// Degraded but usable state, such as a permissive setting accepted at startup.
struct WarningEvent {
  std::string component;
  std::string message;
};

using ObserverEvent = std::variant<SecurityEventLogged, FileOperationEvent, ThreatScanEvent,
                                   ErrorEvent, WarningEvent>;

struct ValidationLatencyMetric {
  std::chrono::microseconds latency{0};
};

struct OperationLatencyMetric {
  std::chrono::microseconds latency{0};
};

struct BytesProcessedMetric {
  std::uint64_t bytes = 0;
};

using ObserverMetric =
    std::variant<ValidationLatencyMetric, OperationLatencyMetric, BytesProcessedMetric>;

class IObserver {
public:
  virtual ~IObserver() = default;

  virtual void record_event(const ObserverEvent &event) = 0;
  virtual void record_metric(const ObserverMetric &metric) = 0;
  virtual void flush() {}
  [[nodiscard]] virtual std::string_view name() const = 0;
};

} // namespace prdguard::observability
