#pragma once

#include "prdguard/common/result.hpp"
#include "prdguard/security/severity.hpp"

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <deque>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace prdguard::security {

namespace event_type {
inline constexpr const char *kValidationPassed = "validation_passed";
inline constexpr const char *kInputSanitized = "input_sanitized";
inline constexpr const char *kThreatDetected = "threat_detected";
inline constexpr const char *kValidationFailed = "validation_failed";
inline constexpr const char *kPathValidated = "path_validated";
inline constexpr const char *kPathRejected = "path_rejected";
inline constexpr const char *kContentValidated = "content_validated";
inline constexpr const char *kContentRejected = "content_rejected";
inline constexpr const char *kBackupCreated = "backup_created";
inline constexpr const char *kBackupFailed = "backup_failed";
inline constexpr const char *kRollbackPerformed = "rollback_performed";
inline constexpr const char *kOperationCompleted = "operation_completed";
inline constexpr const char *kOperationBlocked = "operation_blocked";
inline constexpr const char *kHostFault = "host_fault";
inline constexpr const char *kWorkspaceScanned = "workspace_scanned";
} // namespace event_type

/// Immutable once recorded. `details` never holds raw untrusted input beyond a
/// truncated, sanitized sample.
struct SecurityEvent {
  std::string type;
  Severity severity = Severity::Low;
  std::string timestamp;
  std::map<std::string, std::string> details;
  std::string context_id;
  std::string checksum;
};

struct OperationMetrics {
  std::chrono::microseconds validation_time{0};
  std::chrono::microseconds operation_time{0};
  std::chrono::microseconds total_time{0};
  std::uint64_t bytes_processed = 0;
  std::size_t scans_performed = 0;
};

struct EventFilter {
  std::optional<std::string> type;
  std::optional<Severity> min_severity;
  std::optional<std::string> context_id;
  /// Most recent N matches; 0 returns every match.
  std::size_t limit = 0;
};

struct AuditMetrics {
  std::size_t total_events = 0;
  std::map<std::string, std::size_t> by_severity;
  std::map<std::string, std::size_t> by_type;
  std::map<std::string, std::size_t> by_threat;
  std::size_t total_operations = 0;
  double average_validation_ms = 0.0;
  double average_operation_ms = 0.0;
  std::uint64_t total_bytes_processed = 0;
};

/// First 16 hex digits of SHA-256 over {"eventType":..,"details":{..}}.
[[nodiscard]] std::string event_checksum(const std::string &type,
                                         const std::map<std::string, std::string> &details);

[[nodiscard]] Severity severity_for(const std::string &event_type, const std::string &threat);

/// Stamps timestamp and checksum.
[[nodiscard]] SecurityEvent make_event(std::string type, Severity severity,
                                       std::map<std::string, std::string> details,
                                       std::string context_id);

class IAuditSink {
public:
  virtual ~IAuditSink() = default;
  [[nodiscard]] virtual common::Status append(const SecurityEvent &event) = 0;
  [[nodiscard]] virtual std::string_view name() const = 0;
};

class AuditLog {
public:
  explicit AuditLog(bool log_events = true, std::size_t performance_window = 100);

  void add_sink(std::shared_ptr<IAuditSink> sink);

  /// Never fails toward the caller: sink errors go to the log channel and are dropped.
  void record(const SecurityEvent &event);
  /// Builds, records and returns the event.
  SecurityEvent emit(std::string type, Severity severity,
                     std::map<std::string, std::string> details, std::string context_id);

  void record_operation(const OperationMetrics &metrics);

  [[nodiscard]] std::vector<SecurityEvent> query(const EventFilter &filter) const;
  [[nodiscard]] std::vector<SecurityEvent> events_for(const std::string &context_id) const;
  [[nodiscard]] AuditMetrics metrics() const;
  [[nodiscard]] std::size_t size() const;
  void clear();

private:
  bool log_events_;
  std::size_t performance_window_;
  mutable std::mutex mutex_;
  std::vector<SecurityEvent> events_;
  std::vector<std::shared_ptr<IAuditSink>> sinks_;
  std::deque<OperationMetrics> window_;
  std::size_t total_operations_ = 0;
  std::uint64_t total_bytes_ = 0;
};

} // namespace prdguard::security
