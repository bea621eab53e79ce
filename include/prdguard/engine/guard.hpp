#pragma once

#include "prdguard/common/http.hpp"
#include "prdguard/common/result.hpp"
#include "prdguard/config/schema.hpp"
#include "prdguard/files/secure_file_operations.hpp"
#include "prdguard/security/audit_log.hpp"
#include "prdguard/security/content_validator.hpp"
#include "prdguard/security/input_validator.hpp"
#include "prdguard/security/path_validator.hpp"
#include "prdguard/security/patterns.hpp"
#include "prdguard/security/sqlite_audit_store.hpp"
#include "prdguard/security/threat_scanner.hpp"
#include "prdguard/security/workspace_scanner.hpp"
#include "prdguard/storage/file_backend.hpp"

#include <memory>
#include <string>
#include <vector>

namespace prdguard::engine {

/// Overrides for collaborators that are otherwise built from the config.
struct GuardDependencies {
  std::shared_ptr<storage::IFileBackend> backend;
  std::shared_ptr<security::IThreatScanner> scanner;
  std::shared_ptr<common::HttpClient> http;
  bool install_observer = true;
};

/// Composition root handed to the document layer: one shared catalog, audit log and
/// validator set per workspace.
class Guard {
  struct ConstructionKey {};

public:
  /// Use create(); the key keeps construction inside the factory.
  explicit Guard(ConstructionKey /*key*/) {}

  [[nodiscard]] static common::Result<std::shared_ptr<Guard>>
  create(config::Config config, GuardDependencies dependencies = {});

  [[nodiscard]] const config::Config &config() const { return *config_; }
  [[nodiscard]] const std::vector<std::string> &warnings() const { return warnings_; }
  [[nodiscard]] std::shared_ptr<const security::PatternCatalog> catalog() const { return catalog_; }

  [[nodiscard]] security::InputValidator &input() { return *input_; }
  [[nodiscard]] security::PathValidator &paths() { return *paths_; }
  [[nodiscard]] security::ContentValidator &content() { return *content_; }
  [[nodiscard]] files::SecureFileOperations &files() { return *files_; }
  [[nodiscard]] security::AuditLog &audit() { return *audit_; }
  /// nullptr unless audit.sqlite_path is set.
  [[nodiscard]] std::shared_ptr<security::SqliteAuditStore> audit_store() const {
    return audit_store_;
  }

  /// Scans the workspace root and records a workspace_scanned event with the summary.
  [[nodiscard]] common::Result<security::ScanReport>
  scan_workspace(const security::WorkspaceScanOptions &options = {});

private:
  std::shared_ptr<const config::Config> config_;
  std::vector<std::string> warnings_;
  std::shared_ptr<const security::PatternCatalog> catalog_;
  std::shared_ptr<security::IThreatScanner> scanner_;
  std::shared_ptr<security::AuditLog> audit_;
  std::shared_ptr<security::SqliteAuditStore> audit_store_;
  std::shared_ptr<security::InputValidator> input_;
  std::shared_ptr<security::PathValidator> paths_;
  std::shared_ptr<security::ContentValidator> content_;
  std::shared_ptr<storage::IFileBackend> backend_;
  std::shared_ptr<files::SecureFileOperations> files_;
};

} // namespace prdguard::engine
