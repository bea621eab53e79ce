#include "prdguard/observability/global.hpp"

#include <exception>
#include <iostream>
#include <mutex>

namespace prdguard::observability {

namespace {

std::mutex g_observer_mutex;
std::unique_ptr<IObserver> g_observer;

// Telemetry never fails the caller: an observer that throws is reported on stderr.
template <typename Fn> void dispatch(const char *what, Fn &&fn) {
  auto *observer = get_global_observer();
  if (observer == nullptr) {
    return;
  }
  try {
    fn(*observer);
  } catch (const std::exception &e) {
    std::cerr << "[ERROR] observer '" << observer->name() << "' failed to record " << what
              << ": " << e.what() << "\n";
  }
}

} // namespace

void set_global_observer(std::unique_ptr<IObserver> observer) {
  std::lock_guard<std::mutex> lock(g_observer_mutex);
  g_observer = std::move(observer);
}

IObserver *get_global_observer() {
  std::lock_guard<std::mutex> lock(g_observer_mutex);
  return g_observer.get();
}

void record_event(const ObserverEvent &event) {
  dispatch("event", [&event](IObserver &observer) { observer.record_event(event); });
}

void record_metric(const ObserverMetric &metric) {
  dispatch("metric", [&metric](IObserver &observer) { observer.record_metric(metric); });
}

void record_file_operation(const std::string &operation, const std::string &path,
                           const std::chrono::microseconds duration, const bool success) {
  record_event(FileOperationEvent{
      .operation = operation, .path = path, .duration = duration, .success = success});
}

void record_threat_scan(const std::string &backend, const std::chrono::microseconds duration,
                        const bool safe) {
  record_event(ThreatScanEvent{.backend = backend, .duration = duration, .safe = safe});
}

void record_validation_latency(const std::chrono::microseconds latency) {
  record_metric(ValidationLatencyMetric{.latency = latency});
}

void record_bytes_processed(const std::uint64_t bytes) {
  record_metric(BytesProcessedMetric{.bytes = bytes});
}

void record_error(const std::string &component, const std::string &message) {
  if (get_global_observer() != nullptr) {
    record_event(ErrorEvent{.component = component, .message = message});
    return;
  }
  std::cerr << "[ERROR] " << component << ": " << message << "\n";
}

void record_warning(const std::string &component, const std::string &message) {
  if (get_global_observer() != nullptr) {
    record_event(WarningEvent{.component = component, .message = message});
    return;
  }
  std::cerr << "[WARN] " << component << ": " << message << "\n";
}

} // namespace prdguard::observability
