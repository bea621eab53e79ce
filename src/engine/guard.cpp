#include "prdguard/engine/guard.hpp"

#include "prdguard/common/fs.hpp"
#include "prdguard/config/config.hpp"
#include "prdguard/observability/factory.hpp"
#include "prdguard/observability/global.hpp"
#include "prdguard/storage/local_file_backend.hpp"

#include <filesystem>

namespace prdguard::engine {

namespace {

using GuardResult = common::Result<std::shared_ptr<Guard>>;

} // namespace

GuardResult Guard::create(config::Config config, GuardDependencies dependencies) {
  config.security.workspace_root = config::normalize_workspace_root(config.security.workspace_root);

  auto validated = config::validate_config(config);
  if (!validated.ok()) {
    return GuardResult::failure(validated.error());
  }

  if (dependencies.install_observer) {
    observability::set_global_observer(observability::create_observer(config));
  }

  auto guard = std::make_shared<Guard>(ConstructionKey{});
  guard->warnings_ = std::move(validated.value());
  for (const auto &warning : guard->warnings_) {
    observability::record_warning("config", warning);
  }

  if (config.patterns.catalog_path.empty()) {
    guard->catalog_ = security::default_catalog();
  } else {
    auto loaded = security::load_catalog(common::expand_path(config.patterns.catalog_path));
    if (!loaded.ok()) {
      return GuardResult::failure("Pattern catalog: " + loaded.error());
    }
    guard->catalog_ = std::move(loaded.value());
  }

  guard->config_ = std::make_shared<const config::Config>(std::move(config));
  const auto &cfg = *guard->config_;

  guard->audit_ = std::make_shared<security::AuditLog>(cfg.security.log_events,
                                                       cfg.audit.performance_window);
  if (!cfg.audit.sqlite_path.empty()) {
    const std::filesystem::path db_path = common::expand_path(cfg.audit.sqlite_path);
    if (db_path.has_parent_path()) {
      auto dir = common::ensure_dir(db_path.parent_path());
      if (!dir.ok()) {
        return GuardResult::failure("Audit store: " + dir.error());
      }
    }
    auto store = std::make_shared<security::SqliteAuditStore>(db_path);
    if (!store->is_open()) {
      return GuardResult::failure("Audit store: failed to open " + db_path.string());
    }
    guard->audit_store_ = store;
    guard->audit_->add_sink(std::move(store));
  }

  guard->scanner_ = dependencies.scanner != nullptr
                        ? std::move(dependencies.scanner)
                        : std::shared_ptr<security::IThreatScanner>(security::create_threat_scanner(
                              cfg, guard->catalog_, std::move(dependencies.http)));

  guard->input_ = std::make_shared<security::InputValidator>(guard->config_, guard->catalog_,
                                                             guard->scanner_, guard->audit_);
  guard->paths_ = std::make_shared<security::PathValidator>(guard->config_, guard->audit_);
  guard->content_ = std::make_shared<security::ContentValidator>(guard->config_, guard->catalog_,
                                                                 guard->input_, guard->audit_);
  guard->backend_ = dependencies.backend != nullptr
                        ? std::move(dependencies.backend)
                        : std::make_shared<storage::LocalFileBackend>();
  guard->files_ = std::make_shared<files::SecureFileOperations>(
      guard->config_, guard->paths_, guard->content_, guard->input_, guard->backend_,
      guard->audit_);

  return GuardResult::success(std::move(guard));
}

common::Result<security::ScanReport>
Guard::scan_workspace(const security::WorkspaceScanOptions &options) {
  auto report = security::scan_workspace(config_->security.workspace_root, *catalog_, options);
  if (!report.ok()) {
    audit_->emit(security::event_type::kWorkspaceScanned, security::Severity::Medium,
                 {{"root", config_->security.workspace_root}, {"error", report.error()}}, "");
    return report;
  }

  const auto &value = report.value();
  security::Severity severity = security::Severity::Low;
  if (value.count(security::Severity::Critical) > 0) {
    severity = security::Severity::Critical;
  } else if (value.count(security::Severity::High) > 0) {
    severity = security::Severity::High;
  } else if (value.count(security::Severity::Medium) > 0) {
    severity = security::Severity::Medium;
  }
  audit_->emit(security::event_type::kWorkspaceScanned, severity, value.summary(), "");
  return report;
}

} // namespace prdguard::engine
