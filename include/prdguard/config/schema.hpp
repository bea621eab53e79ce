#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace prdguard::config {

enum class SecurityLevel { Strict, Balanced, Permissive };

struct ValidationConfig {
  SecurityLevel level = SecurityLevel::Strict;
  /// Counted in characters (UTF-8 code points), not bytes.
  std::size_t max_input_size = 1'000'000;
  std::uint64_t max_file_size = 10ULL * 1024ULL * 1024ULL;
  std::vector<std::string> allowed_file_extensions = {".md",      ".txt",  ".json", ".pseudo",
                                                      ".feature", ".yaml", ".yml"};
  /// Absolute and lexically normalized once loading completes.
  std::string workspace_root;
  bool enable_threat_scan = true;
  bool log_events = true;
  std::size_t max_path_length = 255;
};

struct ScannerConfig {
  std::string backend = "heuristic";
  std::string endpoint;
  std::optional<std::string> api_key;
  std::uint64_t timeout_ms = 50;
  bool block_pii = false;
};

struct AuditConfig {
  /// Empty keeps events in memory only.
  std::string sqlite_path;
  std::size_t performance_window = 100;
};

struct FilesConfig {
  bool atomic_writes = true;
  bool verify_integrity = true;
};

struct PatternsConfig {
  /// Optional TOML override of the built-in catalog.
  std::string catalog_path;
};

struct ObservabilityConfig {
  std::string backend = "log";
};

struct Config {
  ValidationConfig security;
  ScannerConfig scanner;
  AuditConfig audit;
  FilesConfig files;
  PatternsConfig patterns;
  ObservabilityConfig observability;
};

} // namespace prdguard::config
