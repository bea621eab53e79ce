#include "prdguard/observability/log_observer.hpp"

#include <iostream>
#include <type_traits>

namespace prdguard::observability {

namespace {

void log_line(const std::string &level, const std::string &message) {
  std::cerr << "[" << level << "] " << message << "\n";
}

std::string level_for_severity(const std::string &severity) {
  if (severity == "critical" || severity == "high") {
    return "WARN";
  }
  return "INFO";
}

std::string bool_text(const bool value) { return value ? "true" : "false"; }

} // namespace

void LogObserver::record_event(const ObserverEvent &event) {
  std::visit(
      [](auto &&evt) {
        using T = std::decay_t<decltype(evt)>;
        if constexpr (std::is_same_v<T, SecurityEventLogged>) {
          std::string line = "security." + evt.type + " severity=" + evt.severity;
          if (!evt.context_id.empty()) {
            line += " context=" + evt.context_id;
          }
          if (!evt.summary.empty()) {
            line += " " + evt.summary;
          }
          log_line(level_for_severity(evt.severity), line);
        } else if constexpr (std::is_same_v<T, FileOperationEvent>) {
          log_line("INFO", "file." + evt.operation + " path=" + evt.path +
                               " duration_us=" + std::to_string(evt.duration.count()) +
                               " success=" + bool_text(evt.success));
        } else if constexpr (std::is_same_v<T, ThreatScanEvent>) {
          log_line("DEBUG", "scan backend=" + evt.backend +
                                " duration_us=" + std::to_string(evt.duration.count()) +
                                " safe=" + bool_text(evt.safe));
        } else if constexpr (std::is_same_v<T, ErrorEvent>) {
          log_line("ERROR", evt.component + ": " + evt.message);
        } else if constexpr (std::is_same_v<T, WarningEvent>) {
          log_line("WARN", evt.component + ": " + evt.message);
        }
      },
      event);
}

void LogObserver::record_metric(const ObserverMetric &metric) {
  std::visit(
      [](auto &&m) {
        using T = std::decay_t<decltype(m)>;
        if constexpr (std::is_same_v<T, ValidationLatencyMetric>) {
          log_line("DEBUG", "metric.validation_latency_us=" + std::to_string(m.latency.count()));
        } else if constexpr (std::is_same_v<T, OperationLatencyMetric>) {
          log_line("DEBUG", "metric.operation_latency_us=" + std::to_string(m.latency.count()));
        } else if constexpr (std::is_same_v<T, BytesProcessedMetric>) {
          log_line("DEBUG", "metric.bytes_processed=" + std::to_string(m.bytes));
        }
      },
      metric);
}

} // namespace prdguard::observability
