#pragma once

#include "prdguard/common/result.hpp"
#include "prdguard/config/schema.hpp"
#include "prdguard/security/audit_log.hpp"
#include "prdguard/security/content_validator.hpp"
#include "prdguard/security/input_validator.hpp"
#include "prdguard/security/path_validator.hpp"
#include "prdguard/storage/file_backend.hpp"

#include <atomic>
#include <chrono>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace prdguard::files {

struct WriteOptions {
  bool overwrite = false;
  bool backup = false;
};

struct EditOptions {
  bool backup = false;
  bool replace_all = false;
};

struct ReadOptions {
  /// Audit-only: findings are recorded, the read is never refused.
  bool scan_content = true;
  /// Defaults to security.max_file_size.
  std::optional<std::uint64_t> max_size;
};

struct WriteReceipt {
  std::string path;
  std::uint64_t bytes = 0;
  std::string content_hash;
  std::optional<std::string> backup_path;
};

struct EditReceipt {
  std::string path;
  std::size_t replacements = 0;
  std::int64_t size_delta = 0;
  std::string content_hash;
  std::optional<std::string> backup_path;
};

/// Outcome of one file operation plus every audit event it produced.
template <typename T> struct FileOperationResult {
  common::Result<T> outcome;
  std::vector<security::SecurityEvent> events;
  security::OperationMetrics metrics;

  [[nodiscard]] bool ok() const { return outcome.ok(); }
};

/// Validated, verified file mutations on top of host primitives. Calls on the same path
/// are not serialized against each other; callers that write concurrently must lock per
/// resolved path.
class SecureFileOperations {
public:
  SecureFileOperations(std::shared_ptr<const config::Config> config,
                       std::shared_ptr<security::PathValidator> paths,
                       std::shared_ptr<security::ContentValidator> content,
                       std::shared_ptr<security::InputValidator> input,
                       std::shared_ptr<storage::IFileBackend> backend,
                       std::shared_ptr<security::AuditLog> audit);

  /// Either the previous content or the fully verified new content is visible at the
  /// target when this returns; no temp artifact is left behind on failure.
  [[nodiscard]] FileOperationResult<WriteReceipt>
  write(const std::string &path, const std::string &content, const WriteOptions &options = {});

  [[nodiscard]] FileOperationResult<EditReceipt> edit(const std::string &path,
                                                      const std::string &old_text,
                                                      const std::string &new_text,
                                                      const EditOptions &options = {});

  [[nodiscard]] FileOperationResult<std::string> read(const std::string &path,
                                                      const ReadOptions &options = {});

private:
  struct CallContext;

  [[nodiscard]] CallContext begin(const std::string &operation);
  template <typename T>
  [[nodiscard]] FileOperationResult<T> finish(CallContext &ctx, common::Result<T> outcome);

  /// Stages payload in a temp sibling and promotes it. A failed promotion restores
  /// previous (or removes the target when there was none).
  [[nodiscard]] common::Status atomic_write(CallContext &ctx, const std::string &target,
                                            const std::string &payload, const std::string &hash,
                                            const std::optional<std::string> &previous);
  [[nodiscard]] std::optional<std::string> create_backup(CallContext &ctx,
                                                         const std::string &target,
                                                         const std::string &current);
  void roll_back(CallContext &ctx, const std::string &target,
                 const std::optional<std::string> &previous);
  void discard_temp(CallContext &ctx);
  void record_host_fault(CallContext &ctx, const std::exception &error);

  std::shared_ptr<const config::Config> config_;
  std::shared_ptr<security::PathValidator> paths_;
  std::shared_ptr<security::ContentValidator> content_;
  std::shared_ptr<security::InputValidator> input_;
  std::shared_ptr<storage::IFileBackend> backend_;
  std::shared_ptr<security::AuditLog> audit_;
  std::atomic<std::uint64_t> request_counter_{0};
  std::atomic<std::uint64_t> temp_counter_{0};
};

} // namespace prdguard::files
