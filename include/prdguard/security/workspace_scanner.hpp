#pragma once

#include "prdguard/common/result.hpp"
#include "prdguard/security/patterns.hpp"
#include "prdguard/security/severity.hpp"

#include <chrono>
#include <cstddef>
#include <map>
#include <string>
#include <vector>

namespace prdguard::security {

struct WorkspaceScanOptions {
  std::size_t long_line_threshold = 1000;
  std::size_t sample_chars = 100;
  bool check_permissions = true;
  /// Dotfiles that are expected in a workspace and not reported as hidden.
  std::vector<std::string> allowed_hidden = {".ai-context"};
};

struct ScanFinding {
  std::string file;
  /// 0 for findings about the file itself rather than a line in it.
  std::size_t line = 0;
  std::string category;
  Severity risk = Severity::Low;
  /// Sanitized and truncated; never the raw line.
  std::string sample;
};

struct ScanReport {
  std::string root;
  std::string timestamp;
  std::string catalog_version;
  std::chrono::milliseconds duration{0};
  std::size_t files_scanned = 0;
  std::vector<ScanFinding> findings;

  [[nodiscard]] std::size_t count(Severity risk) const;
  [[nodiscard]] std::size_t total_issues() const { return findings.size(); }
  /// CRITICAL on any critical finding, HIGH above five high findings, MEDIUM on any.
  [[nodiscard]] std::string overall_risk() const;
  /// EXCELLENT, GOOD, FAIR or POOR by total issue count.
  [[nodiscard]] std::string security_posture() const;
  [[nodiscard]] std::map<std::string, std::string> summary() const;
  [[nodiscard]] std::string to_json() const;
};

/// Walks every regular file below root. Text files are checked line by line against the
/// catalog's scan rules; names and permission bits are checked for every entry.
/// Symlinks are not followed.
[[nodiscard]] common::Result<ScanReport> scan_workspace(const std::string &root,
                                                       const PatternCatalog &catalog,
                                                       const WorkspaceScanOptions &options = {});

} // namespace prdguard::security
