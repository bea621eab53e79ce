#pragma once

#include "prdguard/observability/observer.hpp"

#include <memory>

namespace prdguard::observability {

void set_global_observer(std::unique_ptr<IObserver> observer);
IObserver *get_global_observer();

void record_event(const ObserverEvent &event);
void record_metric(const ObserverMetric &metric);

void record_file_operation(const std::string &operation, const std::string &path,
                           std::chrono::microseconds duration, bool success);
void record_threat_scan(const std::string &backend, std::chrono::microseconds duration,
                        bool safe);
void record_validation_latency(std::chrono::microseconds latency);
void record_bytes_processed(std::uint64_t bytes);
/// Falls back to stderr when no global observer is installed, so failures are never lost.
void record_error(const std::string &component, const std::string &message);
/// Same fallback as record_error, at warning level.
void record_warning(const std::string &component, const std::string &message);

} // namespace prdguard::observability
