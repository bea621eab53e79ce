#include "prdguard/security/sqlite_audit_store.hpp"

#include "prdguard/common/json_util.hpp"

namespace prdguard::security {

namespace {

common::Status exec_sql(sqlite3 *db, const std::string &sql) {
  char *err = nullptr;
  const int rc = sqlite3_exec(db, sql.c_str(), nullptr, nullptr, &err);
  if (rc != SQLITE_OK) {
    const std::string msg = err == nullptr ? "sqlite error" : err;
    if (err != nullptr) {
      sqlite3_free(err);
    }
    return common::Status::error(msg);
  }
  return common::Status::success();
}

std::string column_text(sqlite3_stmt *stmt, const int column) {
  const auto *text = sqlite3_column_text(stmt, column);
  return text == nullptr ? std::string() : reinterpret_cast<const char *>(text);
}

} // namespace

SqliteAuditStore::SqliteAuditStore(std::filesystem::path db_path) : db_path_(std::move(db_path)) {
  if (db_path_.has_parent_path()) {
    std::error_code ec;
    std::filesystem::create_directories(db_path_.parent_path(), ec);
  }

  if (sqlite3_open(db_path_.string().c_str(), &db_) != SQLITE_OK) {
    open_error_ = db_ == nullptr ? "sqlite3_open failed" : sqlite3_errmsg(db_);
    if (db_ != nullptr) {
      sqlite3_close(db_);
    }
    db_ = nullptr;
    return;
  }

  if (const auto status = init_schema(); !status.ok()) {
    open_error_ = status.error();
    sqlite3_close(db_);
    db_ = nullptr;
  }
}

SqliteAuditStore::~SqliteAuditStore() {
  if (db_ != nullptr) {
    sqlite3_close(db_);
  }
}

common::Status SqliteAuditStore::init_schema() {
  auto status = exec_sql(db_, "PRAGMA journal_mode=WAL;");
  if (!status.ok()) {
    return status;
  }

  return exec_sql(db_, R"(
CREATE TABLE IF NOT EXISTS audit_events (
  id INTEGER PRIMARY KEY AUTOINCREMENT,
  type TEXT NOT NULL,
  severity TEXT NOT NULL,
  timestamp TEXT NOT NULL,
  context_id TEXT NOT NULL DEFAULT '',
  details TEXT NOT NULL DEFAULT '{}',
  checksum TEXT NOT NULL
);
CREATE INDEX IF NOT EXISTS idx_audit_events_context ON audit_events(context_id);
)");
}

common::Status SqliteAuditStore::append(const SecurityEvent &event) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (db_ == nullptr) {
    return common::Status::error("audit database unavailable: " + open_error_);
  }

  sqlite3_stmt *stmt = nullptr;
  const char *sql = R"(
INSERT INTO audit_events(type, severity, timestamp, context_id, details, checksum)
VALUES(?1, ?2, ?3, ?4, ?5, ?6)
)";
  if (sqlite3_prepare_v2(db_, sql, -1, &stmt, nullptr) != SQLITE_OK) {
    return common::Status::error(sqlite3_errmsg(db_));
  }

  const std::string severity = to_string(event.severity);
  const std::string details = common::json_object(event.details);
  sqlite3_bind_text(stmt, 1, event.type.c_str(), -1, SQLITE_TRANSIENT);
  sqlite3_bind_text(stmt, 2, severity.c_str(), -1, SQLITE_TRANSIENT);
  sqlite3_bind_text(stmt, 3, event.timestamp.c_str(), -1, SQLITE_TRANSIENT);
  sqlite3_bind_text(stmt, 4, event.context_id.c_str(), -1, SQLITE_TRANSIENT);
  sqlite3_bind_text(stmt, 5, details.c_str(), -1, SQLITE_TRANSIENT);
  sqlite3_bind_text(stmt, 6, event.checksum.c_str(), -1, SQLITE_TRANSIENT);

  const int rc = sqlite3_step(stmt);
  sqlite3_finalize(stmt);
  if (rc != SQLITE_DONE) {
    return common::Status::error(sqlite3_errmsg(db_));
  }
  return common::Status::success();
}

common::Result<std::vector<SecurityEvent>> SqliteAuditStore::load(const std::size_t limit) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (db_ == nullptr) {
    return common::Result<std::vector<SecurityEvent>>::failure("audit database unavailable: " +
                                                               open_error_);
  }

  const char *all_sql = "SELECT type, severity, timestamp, context_id, details, checksum "
                        "FROM audit_events ORDER BY id ASC";
  const char *limited_sql = "SELECT type, severity, timestamp, context_id, details, checksum FROM "
                            "(SELECT * FROM audit_events ORDER BY id DESC LIMIT ?1) ORDER BY id ASC";
  sqlite3_stmt *stmt = nullptr;
  if (sqlite3_prepare_v2(db_, limit > 0 ? limited_sql : all_sql, -1, &stmt, nullptr) !=
      SQLITE_OK) {
    return common::Result<std::vector<SecurityEvent>>::failure(sqlite3_errmsg(db_));
  }
  if (limit > 0) {
    sqlite3_bind_int64(stmt, 1, static_cast<sqlite3_int64>(limit));
  }

  std::vector<SecurityEvent> events;
  while (sqlite3_step(stmt) == SQLITE_ROW) {
    SecurityEvent event;
    event.type = column_text(stmt, 0);
    auto severity = parse_severity(column_text(stmt, 1));
    event.severity = severity.ok() ? severity.value() : Severity::Medium;
    event.timestamp = column_text(stmt, 2);
    event.context_id = column_text(stmt, 3);
    for (auto &[key, value] : common::json_parse_flat(column_text(stmt, 4))) {
      event.details.emplace(key, std::move(value));
    }
    event.checksum = column_text(stmt, 5);
    events.push_back(std::move(event));
  }
  sqlite3_finalize(stmt);
  return common::Result<std::vector<SecurityEvent>>::success(std::move(events));
}

common::Result<std::size_t> SqliteAuditStore::count() {
  std::lock_guard<std::mutex> lock(mutex_);
  if (db_ == nullptr) {
    return common::Result<std::size_t>::failure("audit database unavailable: " + open_error_);
  }
  sqlite3_stmt *stmt = nullptr;
  if (sqlite3_prepare_v2(db_, "SELECT COUNT(*) FROM audit_events", -1, &stmt, nullptr) !=
      SQLITE_OK) {
    return common::Result<std::size_t>::failure(sqlite3_errmsg(db_));
  }
  std::size_t total = 0;
  if (sqlite3_step(stmt) == SQLITE_ROW) {
    total = static_cast<std::size_t>(sqlite3_column_int64(stmt, 0));
  }
  sqlite3_finalize(stmt);
  return common::Result<std::size_t>::success(total);
}

} // namespace prdguard::security
