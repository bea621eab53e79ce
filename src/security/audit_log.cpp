#include "prdguard/security/audit_log.hpp"

#include "prdguard/common/fs.hpp"
#include "prdguard/common/hash.hpp"
#include "prdguard/common/json_util.hpp"
#include "prdguard/observability/global.hpp"

#include <algorithm>
#include <exception>
#include <iostream>
#include <unordered_map>

namespace prdguard::security {

namespace {

constexpr std::size_t kSummaryValueChars = 80;

const std::unordered_map<std::string, Severity> &threat_severities() {
  static const std::unordered_map<std::string, Severity> table = {
      {"dangerous_pattern", Severity::Critical},
      {"path_traversal", Severity::Critical},
      {"directory_escape", Severity::Critical},
      {"scan_failure", Severity::High},
      {"prompt_injection", Severity::High},
      {"secret_exposure", Severity::High},
      {"markdown_html", Severity::High},
      {"atomic_verify_failed", Severity::High},
      {"integrity_mismatch", Severity::High},
      {"edit_verify_failed", Severity::High},
      {"host_io_error", Severity::High},
      {"suspicious_pattern", Severity::Medium},
      {"invalid_extension", Severity::Medium},
      {"invalid_filename", Severity::Medium},
      {"reserved_filename", Severity::Medium},
      {"null_bytes", Severity::Medium},
      {"control_characters", Severity::Medium},
      {"invalid_json", Severity::Medium},
      {"empty_path", Severity::Medium},
      {"validation_error", Severity::Medium},
      {"empty_input", Severity::Medium},
      {"string_not_found", Severity::Medium},
      {"string_not_unique", Severity::Medium},
      {"input_size_limit", Severity::Low},
      {"file_size_limit", Severity::Low},
      {"file_too_large", Severity::Low},
      {"path_length_limit", Severity::Low},
      {"file_exists", Severity::Low},
      {"file_not_found", Severity::Low},
      {"input_sanitized", Severity::Low},
  };
  return table;
}

Severity single_threat_severity(const std::string &threat) {
  const auto &table = threat_severities();
  if (const auto it = table.find(threat); it != table.end()) {
    return it->second;
  }
  // Tags coming from a threat scanner (pii:email, vendor labels) are not in the table.
  return Severity::High;
}

std::string summarize(const std::map<std::string, std::string> &details) {
  std::string out;
  for (const auto &[key, value] : details) {
    if (!out.empty()) {
      out += ' ';
    }
    std::string shown = common::truncate_utf8(value, kSummaryValueChars);
    if (shown.size() < value.size()) {
      shown += "...";
    }
    std::replace(shown.begin(), shown.end(), '\n', ' ');
    out += key + "=" + shown;
  }
  return out;
}

} // namespace

std::string event_checksum(const std::string &type,
                           const std::map<std::string, std::string> &details) {
  const std::string payload =
      "{\"eventType\":\"" + common::json_escape(type) + "\",\"details\":" +
      common::json_object(details) + "}";
  return common::sha256_hex(payload).substr(0, 16);
}

Severity severity_for(const std::string &event_type, const std::string &threat) {
  if (threat.empty()) {
    if (event_type == event_type::kHostFault) {
      return Severity::High;
    }
    if (event_type == event_type::kValidationFailed || event_type == event_type::kBackupFailed ||
        event_type == event_type::kOperationBlocked ||
        event_type == event_type::kThreatDetected) {
      return Severity::Medium;
    }
    return Severity::Low;
  }

  // Joined scanner tags take the most severe component.
  Severity worst = Severity::Low;
  std::size_t start = 0;
  while (start <= threat.size()) {
    const auto comma = threat.find(',', start);
    const std::string part =
        common::trim(threat.substr(start, comma == std::string::npos ? std::string::npos
                                                                      : comma - start));
    if (!part.empty()) {
      worst = std::max(worst, single_threat_severity(part));
    }
    if (comma == std::string::npos) {
      break;
    }
    start = comma + 1;
  }
  return worst;
}

SecurityEvent make_event(std::string type, const Severity severity,
                         std::map<std::string, std::string> details, std::string context_id) {
  SecurityEvent event;
  event.checksum = event_checksum(type, details);
  event.type = std::move(type);
  event.severity = severity;
  event.timestamp = common::now_rfc3339();
  event.details = std::move(details);
  event.context_id = std::move(context_id);
  return event;
}

AuditLog::AuditLog(const bool log_events, const std::size_t performance_window)
    : log_events_(log_events), performance_window_(std::max<std::size_t>(1, performance_window)) {}

void AuditLog::add_sink(std::shared_ptr<IAuditSink> sink) {
  if (sink == nullptr) {
    return;
  }
  std::lock_guard<std::mutex> lock(mutex_);
  sinks_.push_back(std::move(sink));
}

void AuditLog::record(const SecurityEvent &event) {
  std::vector<std::shared_ptr<IAuditSink>> sinks;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    events_.push_back(event);
    sinks = sinks_;
  }

  if (log_events_) {
    // The observer is the fallback channel itself, so its failures go straight to stderr.
    try {
      observability::record_event(observability::SecurityEventLogged{
          .type = event.type,
          .severity = to_string(event.severity),
          .context_id = event.context_id,
          .summary = summarize(event.details),
      });
    } catch (const std::exception &e) {
      std::cerr << "[ERROR] audit mirror: " << e.what() << "\n";
    }
  }

  for (const auto &sink : sinks) {
    try {
      const auto status = sink->append(event);
      if (!status.ok()) {
        observability::record_error("audit." + std::string(sink->name()), status.error());
      }
    } catch (const std::exception &e) {
      observability::record_error("audit." + std::string(sink->name()), e.what());
    }
  }
}

SecurityEvent AuditLog::emit(std::string type, const Severity severity,
                             std::map<std::string, std::string> details, std::string context_id) {
  SecurityEvent event =
      make_event(std::move(type), severity, std::move(details), std::move(context_id));
  record(event);
  return event;
}

void AuditLog::record_operation(const OperationMetrics &metrics) {
  std::lock_guard<std::mutex> lock(mutex_);
  window_.push_back(metrics);
  while (window_.size() > performance_window_) {
    window_.pop_front();
  }
  ++total_operations_;
  total_bytes_ += metrics.bytes_processed;
}

std::vector<SecurityEvent> AuditLog::query(const EventFilter &filter) const {
  std::lock_guard<std::mutex> lock(mutex_);
  std::vector<SecurityEvent> out;
  for (const auto &event : events_) {
    if (filter.type.has_value() && event.type != *filter.type) {
      continue;
    }
    if (filter.min_severity.has_value() && event.severity < *filter.min_severity) {
      continue;
    }
    if (filter.context_id.has_value() && event.context_id != *filter.context_id) {
      continue;
    }
    out.push_back(event);
  }
  if (filter.limit > 0 && out.size() > filter.limit) {
    out.erase(out.begin(), out.end() - static_cast<std::ptrdiff_t>(filter.limit));
  }
  return out;
}

std::vector<SecurityEvent> AuditLog::events_for(const std::string &context_id) const {
  return query(EventFilter{.context_id = context_id});
}

AuditMetrics AuditLog::metrics() const {
  std::lock_guard<std::mutex> lock(mutex_);
  AuditMetrics metrics;
  metrics.total_events = events_.size();
  for (const auto &event : events_) {
    ++metrics.by_severity[to_string(event.severity)];
    ++metrics.by_type[event.type];
    if (const auto it = event.details.find("threat"); it != event.details.end()) {
      ++metrics.by_threat[it->second];
    }
  }

  metrics.total_operations = total_operations_;
  metrics.total_bytes_processed = total_bytes_;
  if (!window_.empty()) {
    double validation_us = 0.0;
    double operation_us = 0.0;
    for (const auto &sample : window_) {
      validation_us += static_cast<double>(sample.validation_time.count());
      operation_us += static_cast<double>(sample.operation_time.count());
    }
    const auto samples = static_cast<double>(window_.size());
    metrics.average_validation_ms = validation_us / samples / 1000.0;
    metrics.average_operation_ms = operation_us / samples / 1000.0;
  }
  return metrics;
}

std::size_t AuditLog::size() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return events_.size();
}

void AuditLog::clear() {
  std::lock_guard<std::mutex> lock(mutex_);
  events_.clear();
  window_.clear();
  total_operations_ = 0;
  total_bytes_ = 0;
}

} // namespace prdguard::security
