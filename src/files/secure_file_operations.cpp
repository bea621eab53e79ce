#include "prdguard/files/secure_file_operations.hpp"

#include "prdguard/common/fs.hpp"
#include "prdguard/observability/global.hpp"
#include "prdguard/security/secure_filename.hpp"

#include <utility>

namespace prdguard::files {

namespace {

using Clock = std::chrono::steady_clock;

std::chrono::microseconds since(const Clock::time_point start) {
  return std::chrono::duration_cast<std::chrono::microseconds>(Clock::now() - start);
}

std::size_t count_occurrences(const std::string &haystack, const std::string &needle) {
  std::size_t count = 0;
  for (std::size_t pos = haystack.find(needle); pos != std::string::npos;
       pos = haystack.find(needle, pos + needle.size())) {
    ++count;
  }
  return count;
}

std::string apply_replacement(const std::string &content, const std::string &old_text,
                              const std::string &new_text, const bool replace_all) {
  std::string out = content;
  if (replace_all) {
    common::replace_all(out, old_text, new_text);
    return out;
  }
  const auto pos = out.find(old_text);
  if (pos != std::string::npos) {
    out.replace(pos, old_text.size(), new_text);
  }
  return out;
}

template <typename T> common::Result<T> host_io_error(const std::string &message) {
  return common::Result<T>::failure(message, "host_io_error");
}

} // namespace

struct SecureFileOperations::CallContext {
  std::string id;
  std::string operation;
  std::string path;
  Clock::time_point start;
  std::chrono::microseconds validation{0};
  std::uint64_t bytes = 0;
  std::size_t scans = 0;
  std::string temp_path;
};

SecureFileOperations::SecureFileOperations(std::shared_ptr<const config::Config> config,
                                           std::shared_ptr<security::PathValidator> paths,
                                           std::shared_ptr<security::ContentValidator> content,
                                           std::shared_ptr<security::InputValidator> input,
                                           std::shared_ptr<storage::IFileBackend> backend,
                                           std::shared_ptr<security::AuditLog> audit)
    : config_(std::move(config)), paths_(std::move(paths)), content_(std::move(content)),
      input_(std::move(input)), backend_(std::move(backend)), audit_(std::move(audit)) {}

SecureFileOperations::CallContext SecureFileOperations::begin(const std::string &operation) {
  CallContext ctx;
  ctx.id = "req_" + std::to_string(common::now_millis()) + "_" +
           std::to_string(++request_counter_);
  ctx.operation = operation;
  ctx.start = Clock::now();
  return ctx;
}

template <typename T>
FileOperationResult<T> SecureFileOperations::finish(CallContext &ctx, common::Result<T> outcome) {
  security::OperationMetrics metrics;
  metrics.total_time = since(ctx.start);
  metrics.validation_time = ctx.validation.count() > 0 ? ctx.validation : metrics.total_time;
  metrics.operation_time = metrics.total_time - metrics.validation_time;
  metrics.bytes_processed = outcome.ok() ? ctx.bytes : 0;
  metrics.scans_performed = ctx.scans;

  std::map<std::string, std::string> details{{"operation", ctx.operation}};
  if (!ctx.path.empty()) {
    details["path"] = ctx.path;
  }
  if (outcome.ok()) {
    details["bytes"] = std::to_string(ctx.bytes);
    audit_->emit(security::event_type::kOperationCompleted, security::Severity::Low,
                 std::move(details), ctx.id);
  } else {
    details["threat"] = outcome.threat();
    audit_->emit(security::event_type::kOperationBlocked,
                 security::severity_for(security::event_type::kOperationBlocked,
                                        outcome.threat()),
                 std::move(details), ctx.id);
  }

  audit_->record_operation(metrics);
  observability::record_file_operation(ctx.operation, ctx.path, metrics.total_time,
                                       outcome.ok());
  if (outcome.ok()) {
    observability::record_bytes_processed(ctx.bytes);
  }

  return FileOperationResult<T>{std::move(outcome), audit_->events_for(ctx.id), metrics};
}

void SecureFileOperations::discard_temp(CallContext &ctx) {
  if (ctx.temp_path.empty()) {
    return;
  }
  const auto status = backend_->remove(ctx.temp_path);
  if (!status.ok()) {
    observability::record_error("files", "Failed to remove temp file " + ctx.temp_path + ": " +
                                             status.error());
  }
  ctx.temp_path.clear();
}

void SecureFileOperations::record_host_fault(CallContext &ctx, const std::exception &error) {
  discard_temp(ctx);
  audit_->emit(security::event_type::kHostFault, security::Severity::High,
               {{"operation", ctx.operation}, {"path", ctx.path}, {"error", error.what()}},
               ctx.id);
  security::OperationMetrics metrics;
  metrics.total_time = since(ctx.start);
  metrics.validation_time = ctx.validation;
  metrics.operation_time = metrics.total_time - ctx.validation;
  metrics.scans_performed = ctx.scans;
  audit_->record_operation(metrics);
  observability::record_file_operation(ctx.operation, ctx.path, metrics.total_time, false);
}

std::optional<std::string> SecureFileOperations::create_backup(CallContext &ctx,
                                                               const std::string &target,
                                                               const std::string &current) {
  const auto backup_path = paths_->derive(target, ".backup." + common::filename_timestamp());
  if (!backup_path.ok()) {
    audit_->emit(security::event_type::kBackupFailed, security::Severity::Medium,
                 {{"path", target}, {"error", backup_path.error()}}, ctx.id);
    return std::nullopt;
  }

  const auto status = backend_->write(backup_path.value(), current);
  if (!status.ok()) {
    observability::record_error("files", "Backup of " + target + " failed: " + status.error());
    audit_->emit(security::event_type::kBackupFailed, security::Severity::Medium,
                 {{"path", target}, {"backup_path", backup_path.value()}, {"error", status.error()}},
                 ctx.id);
    return std::nullopt;
  }

  audit_->emit(security::event_type::kBackupCreated, security::Severity::Low,
               {{"path", target},
                {"backup_path", backup_path.value()},
                {"bytes", std::to_string(current.size())}},
               ctx.id);
  return backup_path.value();
}

void SecureFileOperations::roll_back(CallContext &ctx, const std::string &target,
                                     const std::optional<std::string> &previous) {
  const auto status =
      previous.has_value() ? backend_->write(target, *previous) : backend_->remove(target);
  if (!status.ok()) {
    observability::record_error("files", "Rollback of " + target + " failed: " + status.error());
  }
  audit_->emit(security::event_type::kRollbackPerformed,
               status.ok() ? security::Severity::Medium : security::Severity::High,
               {{"path", target},
                {"restored", previous.has_value() ? "previous" : "removed"},
                {"success", status.ok() ? "true" : "false"}},
               ctx.id);
}

common::Status SecureFileOperations::atomic_write(CallContext &ctx, const std::string &target,
                                                  const std::string &payload,
                                                  const std::string &hash,
                                                  const std::optional<std::string> &previous) {
  const auto temp = paths_->derive(target, ".tmp." + std::to_string(common::now_millis()) + "." +
                                               std::to_string(++temp_counter_));
  if (!temp.ok()) {
    return common::Status::error(temp.error(), temp.threat());
  }
  ctx.temp_path = temp.value();

  if (const auto status = backend_->write(ctx.temp_path, payload); !status.ok()) {
    discard_temp(ctx);
    return common::Status::error(status.error(), "host_io_error");
  }

  const auto staged = backend_->read(ctx.temp_path);
  if (!staged.ok() || !staged.value().has_value() ||
      !security::verify_content_integrity(*staged.value(), hash)) {
    discard_temp(ctx);
    return common::Status::error("Atomic write verification failed", "atomic_verify_failed");
  }

  if (backend_->supports_rename()) {
    if (const auto status = backend_->rename(ctx.temp_path, target); !status.ok()) {
      discard_temp(ctx);
      return common::Status::error(status.error(), "host_io_error");
    }
    ctx.temp_path.clear();
    return common::Status::success();
  }

  // Copy promotion can fail after part of the payload reached the target.
  if (const auto status = backend_->write(target, payload); !status.ok()) {
    discard_temp(ctx);
    roll_back(ctx, target, previous);
    return common::Status::error(status.error(), "host_io_error");
  }
  discard_temp(ctx);
  return common::Status::success();
}

FileOperationResult<WriteReceipt> SecureFileOperations::write(const std::string &path,
                                                              const std::string &content,
                                                              const WriteOptions &options) {
  using WriteResult = common::Result<WriteReceipt>;
  CallContext ctx = begin("write");
  ctx.path = path;

  const auto resolved = paths_->resolve(path, security::PathOptions{.context_id = ctx.id});
  if (!resolved.ok()) {
    return finish(ctx, resolved.forward_failure<WriteReceipt>());
  }
  const std::string &target = resolved.value();
  ctx.path = target;

  const auto validated = content_->validate(content, target, ctx.id);
  ctx.scans += 1;
  if (!validated.ok()) {
    return finish(ctx, validated.forward_failure<WriteReceipt>());
  }
  const std::string &payload = validated.value();
  ctx.validation = since(ctx.start);

  try {
    const auto existing = backend_->read(target);
    if (!existing.ok()) {
      return finish(ctx, host_io_error<WriteReceipt>(existing.error()));
    }
    const std::optional<std::string> &previous = existing.value();
    if (previous.has_value() && !options.overwrite) {
      return finish(ctx, WriteResult::failure("File already exists", "file_exists"));
    }

    WriteReceipt receipt;
    receipt.path = target;
    if (options.backup && previous.has_value()) {
      receipt.backup_path = create_backup(ctx, target, *previous);
    }

    receipt.content_hash = security::content_hash(payload);
    receipt.bytes = payload.size();

    if (config_->files.atomic_writes) {
      if (const auto status =
              atomic_write(ctx, target, payload, receipt.content_hash, previous);
          !status.ok()) {
        return finish(ctx, WriteResult::failure(status.error(), status.threat()));
      }
    } else if (const auto status = backend_->write(target, payload); !status.ok()) {
      roll_back(ctx, target, previous);
      return finish(ctx, host_io_error<WriteReceipt>(status.error()));
    }

    if (config_->files.verify_integrity) {
      const auto written = backend_->read(target);
      if (!written.ok() || !written.value().has_value() ||
          !security::verify_content_integrity(*written.value(), receipt.content_hash)) {
        roll_back(ctx, target, previous);
        return finish(ctx, WriteResult::failure("Written content failed the integrity check",
                                                "integrity_mismatch"));
      }
    }

    ctx.bytes = receipt.bytes;
    return finish(ctx, WriteResult::success(std::move(receipt)));
  } catch (const std::exception &e) {
    record_host_fault(ctx, e);
    throw;
  }
}

FileOperationResult<EditReceipt> SecureFileOperations::edit(const std::string &path,
                                                            const std::string &old_text,
                                                            const std::string &new_text,
                                                            const EditOptions &options) {
  using EditResult = common::Result<EditReceipt>;
  CallContext ctx = begin("edit");
  ctx.path = path;

  const auto resolved = paths_->resolve(path, security::PathOptions{.context_id = ctx.id});
  if (!resolved.ok()) {
    return finish(ctx, resolved.forward_failure<EditReceipt>());
  }
  const std::string &target = resolved.value();
  ctx.path = target;

  // The old string has to match verbatim, so only its shape is checked.
  const auto max_size = config_->security.max_file_size;
  if (old_text.empty()) {
    return finish(ctx, EditResult::failure("Text to replace must not be empty", "empty_input"));
  }
  if (old_text.size() > max_size) {
    return finish(ctx, EditResult::failure("Text to replace exceeds the maximum file size",
                                           "input_size_limit"));
  }
  if (old_text.find('\0') != std::string::npos) {
    return finish(ctx, EditResult::failure("Text to replace contains null bytes", "null_bytes"));
  }

  const auto replacement =
      input_->validate(new_text, security::InputOptions{
                                     .context = "edit:" + target,
                                     .context_id = ctx.id,
                                     .max_size = static_cast<std::size_t>(max_size),
                                     .mode = security::SanitizeMode::Content,
                                 });
  ctx.scans += 1;
  if (!replacement.ok()) {
    return finish(ctx, replacement.forward_failure<EditReceipt>());
  }
  const std::string &new_payload = replacement.value();
  ctx.validation = since(ctx.start);

  try {
    const auto current = backend_->read(target);
    if (!current.ok()) {
      return finish(ctx, host_io_error<EditReceipt>(current.error()));
    }
    if (!current.value().has_value()) {
      return finish(ctx, EditResult::failure("File not found", "file_not_found"));
    }
    const std::string &before = *current.value();

    const std::size_t occurrences = count_occurrences(before, old_text);
    if (occurrences == 0) {
      return finish(ctx, EditResult::failure("Text to replace was not found", "string_not_found"));
    }
    if (occurrences > 1 && !options.replace_all) {
      return finish(ctx, EditResult::failure("Text to replace occurs more than once",
                                             "string_not_unique"));
    }

    const std::string expected = apply_replacement(before, old_text, new_payload, options.replace_all);
    if (expected.size() > max_size) {
      return finish(ctx, EditResult::failure("Edited content exceeds the maximum file size",
                                             "file_size_limit"));
    }
    if (const auto status = content_->check_structure(expected, target); !status.ok()) {
      return finish(ctx, EditResult::failure(status.error(), status.threat()));
    }

    EditReceipt receipt;
    receipt.path = target;
    receipt.replacements = options.replace_all ? occurrences : 1;
    if (options.backup) {
      receipt.backup_path = create_backup(ctx, target, before);
    }

    if (const auto status = backend_->replace(target, old_text, new_payload, options.replace_all);
        !status.ok()) {
      return finish(ctx, host_io_error<EditReceipt>(status.error()));
    }

    // Comparing with the expected post-image also covers replacements that form a new
    // occurrence of the old text across a boundary.
    const auto after = backend_->read(target);
    if (!after.ok() || !after.value().has_value() || *after.value() != expected) {
      roll_back(ctx, target, before);
      return finish(ctx, EditResult::failure("Edit could not be verified", "edit_verify_failed"));
    }

    receipt.content_hash = security::content_hash(expected);
    receipt.size_delta =
        static_cast<std::int64_t>(expected.size()) - static_cast<std::int64_t>(before.size());
    ctx.bytes = expected.size();
    return finish(ctx, EditResult::success(std::move(receipt)));
  } catch (const std::exception &e) {
    record_host_fault(ctx, e);
    throw;
  }
}

FileOperationResult<std::string> SecureFileOperations::read(const std::string &path,
                                                            const ReadOptions &options) {
  using ReadResult = common::Result<std::string>;
  CallContext ctx = begin("read");
  ctx.path = path;

  const auto resolved = paths_->resolve(path, security::PathOptions{.context_id = ctx.id});
  if (!resolved.ok()) {
    return finish(ctx, resolved.forward_failure<std::string>());
  }
  const std::string &target = resolved.value();
  ctx.path = target;
  ctx.validation = since(ctx.start);

  try {
    auto data = backend_->read(target);
    if (!data.ok()) {
      return finish(ctx, host_io_error<std::string>(data.error()));
    }
    if (!data.value().has_value()) {
      return finish(ctx, ReadResult::failure("File not found", "file_not_found"));
    }
    std::string content = std::move(*data.value());

    const std::uint64_t limit = options.max_size.value_or(config_->security.max_file_size);
    if (content.size() > limit) {
      return finish(ctx, ReadResult::failure("File exceeds the maximum read size",
                                             "file_too_large"));
    }

    if (options.scan_content) {
      const auto inspection =
          input_->inspect(content, security::InputOptions{
                                       .context = "read:" + target,
                                       .context_id = ctx.id,
                                       .max_size = static_cast<std::size_t>(limit),
                                       .mode = security::SanitizeMode::Content,
                                   });
      ctx.scans += 1;
      if (!inspection.accepted || !inspection.suspicious.empty()) {
        std::map<std::string, std::string> details{{"path", target}, {"mode", "audit_only"}};
        details["threat"] = inspection.accepted ? "suspicious_pattern" : inspection.threat;
        if (!inspection.rule.empty()) {
          details["rule"] = inspection.rule;
        }
        audit_->emit(security::event_type::kThreatDetected, security::Severity::Medium,
                     std::move(details), ctx.id);
      }
    }

    ctx.bytes = content.size();
    return finish(ctx, ReadResult::success(std::move(content)));
  } catch (const std::exception &e) {
    record_host_fault(ctx, e);
    throw;
  }
}

} // namespace prdguard::files
