#pragma once

#include "prdguard/security/audit_log.hpp"

#include <sqlite3.h>

#include <filesystem>
#include <mutex>

namespace prdguard::security {

/// Durable audit sink backed by an `audit_events` table.
class SqliteAuditStore final : public IAuditSink {
public:
  explicit SqliteAuditStore(std::filesystem::path db_path);
  ~SqliteAuditStore() override;

  SqliteAuditStore(const SqliteAuditStore &) = delete;
  SqliteAuditStore &operator=(const SqliteAuditStore &) = delete;

  [[nodiscard]] bool is_open() const { return db_ != nullptr; }
  [[nodiscard]] common::Status append(const SecurityEvent &event) override;
  [[nodiscard]] std::string_view name() const override { return "sqlite"; }

  /// Oldest first. limit 0 loads everything.
  [[nodiscard]] common::Result<std::vector<SecurityEvent>> load(std::size_t limit = 0);
  [[nodiscard]] common::Result<std::size_t> count();

private:
  [[nodiscard]] common::Status init_schema();

  std::filesystem::path db_path_;
  sqlite3 *db_ = nullptr;
  std::string open_error_;
  std::mutex mutex_;
};

} // namespace prdguard::security
