#include "prdguard/security/workspace_scanner.hpp"

#include "prdguard/common/fs.hpp"
#include "prdguard/common/json_util.hpp"
#include "prdguard/security/input_validator.hpp"

#include <algorithm>
#include <array>
#include <filesystem>
#include <fstream>
#include <regex>
#include <sstream>
#include <string_view>

namespace prdguard::security {

namespace {

namespace fs = std::filesystem;

constexpr std::size_t kBinaryProbeBytes = 8192;

const std::regex kSuspiciousExtension(R"(\.(exe|bat|cmd|sh|ps1|scr|com|pif)$)",
                                      std::regex::ECMAScript | std::regex::icase);

const std::array<std::string_view, 6> kSensitiveNames = {"passwd",  "shadow",  "hosts",
                                                         "config",  "secrets", "private"};

constexpr fs::perms kFileCeiling = fs::perms::owner_read | fs::perms::owner_write |
                                   fs::perms::group_read | fs::perms::others_read;
constexpr fs::perms kDirectoryCeiling = fs::perms::owner_all | fs::perms::group_read |
                                        fs::perms::group_exec | fs::perms::others_read |
                                        fs::perms::others_exec;

bool is_non_printable(const unsigned char c) {
  if (c == '\t' || c == '\n' || c == '\r' || c == '\f' || c == '\v') {
    return false;
  }
  return c < 0x20U || c == 0x7FU;
}

std::string octal_mode(const fs::perms perms) {
  std::ostringstream out;
  out << std::oct << (static_cast<unsigned>(perms) & 0777U);
  return out.str();
}

class Scanner {
public:
  Scanner(const fs::path &root, const PatternCatalog &catalog, const WorkspaceScanOptions &options,
          ScanReport &report)
      : root_(root), catalog_(catalog), options_(options), report_(report) {}

  void add(const fs::path &path, const std::size_t line, std::string category,
           const Severity risk, const std::string &sample) {
    report_.findings.push_back(ScanFinding{
        .file = path.lexically_relative(root_).generic_string(),
        .line = line,
        .category = std::move(category),
        .risk = risk,
        .sample = InputValidator::sanitize(common::truncate_utf8(sample, options_.sample_chars)),
    });
  }

  void visit(const fs::directory_entry &entry) {
    std::error_code ec;
    const auto status = entry.symlink_status(ec);
    if (ec || fs::is_symlink(status)) {
      return;
    }
    if (fs::is_directory(status)) {
      check_permissions(entry.path(), status);
      return;
    }
    if (!fs::is_regular_file(status)) {
      return;
    }
    check_filename(entry.path());
    check_permissions(entry.path(), status);
    scan_lines(entry.path());
  }

  void check_filename(const fs::path &path) {
    const std::string name = path.filename().string();
    if (std::regex_search(name, kSuspiciousExtension)) {
      add(path, 0, "suspicious_extension", Severity::High, "Potentially dangerous file extension");
    }
    if (!name.empty() && name.front() == '.' &&
        std::find(options_.allowed_hidden.begin(), options_.allowed_hidden.end(), name) ==
            options_.allowed_hidden.end()) {
      add(path, 0, "hidden_file", Severity::Low, "Hidden file detected");
    }
    const std::string lowered = common::to_lower(name);
    for (const auto sensitive : kSensitiveNames) {
      if (lowered.find(sensitive) != std::string::npos) {
        add(path, 0, "suspicious_name", Severity::Medium,
            "Potentially sensitive filename: " + std::string(sensitive));
      }
    }
  }

  void check_permissions(const fs::path &path, const fs::file_status &status) {
    if (!options_.check_permissions) {
      return;
    }
    const auto perms = status.permissions();
    if (fs::is_regular_file(status) && (perms & ~kFileCeiling) != fs::perms::none) {
      add(path, 0, "file_permissions", Severity::Medium,
          "Overly permissive file permissions: " + octal_mode(perms));
    } else if (fs::is_directory(status) && (perms & ~kDirectoryCeiling) != fs::perms::none) {
      add(path, 0, "directory_permissions", Severity::Medium,
          "Overly permissive directory permissions: " + octal_mode(perms));
    }
  }

  void scan_lines(const fs::path &path) {
    std::ifstream in(path, std::ios::binary);
    if (!in) {
      return;
    }
    std::stringstream buffer;
    buffer << in.rdbuf();
    const std::string content = buffer.str();

    const auto probe = std::string_view(content).substr(0, kBinaryProbeBytes);
    if (probe.find('\0') != std::string_view::npos) {
      return;
    }
    ++report_.files_scanned;

    std::istringstream lines(content);
    std::string line;
    std::size_t line_number = 0;
    while (std::getline(lines, line)) {
      ++line_number;
      for (const auto &rule : catalog_.scan_rules) {
        if (pattern_matches(rule.regex, line)) {
          add(path, line_number, rule.tag, rule.risk, line);
        }
      }
      if (common::utf8_length(line) > options_.long_line_threshold) {
        add(path, line_number, "long_line", Severity::Medium,
            "Line exceeds " + std::to_string(options_.long_line_threshold) + " characters");
      }
      if (std::any_of(line.begin(), line.end(), [](const char ch) {
            return is_non_printable(static_cast<unsigned char>(ch));
          })) {
        add(path, line_number, "binary_content", Severity::High,
            "Non-printable characters detected");
      }
    }
  }

private:
  const fs::path &root_;
  const PatternCatalog &catalog_;
  const WorkspaceScanOptions &options_;
  ScanReport &report_;
};

} // namespace

std::size_t ScanReport::count(const Severity risk) const {
  return static_cast<std::size_t>(std::count_if(
      findings.begin(), findings.end(), [risk](const ScanFinding &f) { return f.risk == risk; }));
}

std::string ScanReport::overall_risk() const {
  const std::size_t high = count(Severity::High);
  if (count(Severity::Critical) > 0) {
    return "CRITICAL";
  }
  if (high > 5) {
    return "HIGH";
  }
  if (high > 0) {
    return "MEDIUM";
  }
  return "LOW";
}

std::string ScanReport::security_posture() const {
  const std::size_t total = total_issues();
  if (total == 0) {
    return "EXCELLENT";
  }
  if (total <= 5) {
    return "GOOD";
  }
  if (total <= 15) {
    return "FAIR";
  }
  return "POOR";
}

std::map<std::string, std::string> ScanReport::summary() const {
  return {
      {"root", root},
      {"files_scanned", std::to_string(files_scanned)},
      {"total_issues", std::to_string(total_issues())},
      {"critical_issues", std::to_string(count(Severity::Critical))},
      {"high_issues", std::to_string(count(Severity::High))},
      {"medium_issues", std::to_string(count(Severity::Medium))},
      {"low_issues", std::to_string(count(Severity::Low))},
      {"overall_risk", overall_risk()},
      {"security_posture", security_posture()},
  };
}

std::string ScanReport::to_json() const {
  std::ostringstream out;
  out << "{\"scan_metadata\":{\"timestamp\":\"" << common::json_escape(timestamp)
      << "\",\"scan_directory\":\"" << common::json_escape(root) << "\",\"catalog_version\":\""
      << common::json_escape(catalog_version)
      << "\",\"scan_duration_ms\":" << duration.count() << "},";
  out << "\"summary\":{\"files_scanned\":" << files_scanned
      << ",\"total_issues\":" << total_issues()
      << ",\"critical_issues\":" << count(Severity::Critical)
      << ",\"high_issues\":" << count(Severity::High)
      << ",\"medium_issues\":" << count(Severity::Medium)
      << ",\"low_issues\":" << count(Severity::Low) << "},";
  out << "\"risk_assessment\":{\"overall_risk\":\"" << overall_risk()
      << "\",\"security_posture\":\"" << security_posture() << "\"},";
  out << "\"findings\":[";
  for (std::size_t i = 0; i < findings.size(); ++i) {
    const auto &f = findings[i];
    if (i > 0) {
      out << ',';
    }
    out << "{\"file\":\"" << common::json_escape(f.file) << "\",\"line\":" << f.line
        << ",\"category\":\"" << common::json_escape(f.category) << "\",\"risk\":\""
        << common::to_upper(to_string(f.risk)) << "\",\"sample\":\""
        << common::json_escape(f.sample) << "\"}";
  }
  out << "]}";
  return out.str();
}

common::Result<ScanReport> scan_workspace(const std::string &root, const PatternCatalog &catalog,
                                          const WorkspaceScanOptions &options) {
  const auto started = std::chrono::steady_clock::now();
  const fs::path base = fs::path(root).lexically_normal();

  std::error_code ec;
  if (!fs::is_directory(base, ec)) {
    return common::Result<ScanReport>::failure("Scan directory does not exist: " + root);
  }

  ScanReport report;
  report.root = base.string();
  report.timestamp = common::now_rfc3339();
  report.catalog_version = catalog.version;
  Scanner scanner(base, catalog, options, report);

  fs::recursive_directory_iterator it(base, fs::directory_options::skip_permission_denied, ec);
  if (ec) {
    return common::Result<ScanReport>::failure("Failed to open scan directory: " + ec.message());
  }
  const fs::recursive_directory_iterator end{};
  while (it != end) {
    scanner.visit(*it);
    it.increment(ec);
    if (ec) {
      return common::Result<ScanReport>::failure("Failed to walk scan directory: " +
                                                 ec.message());
    }
  }

  report.duration = std::chrono::duration_cast<std::chrono::milliseconds>(
      std::chrono::steady_clock::now() - started);
  return common::Result<ScanReport>::success(std::move(report));
}

} // namespace prdguard::security
