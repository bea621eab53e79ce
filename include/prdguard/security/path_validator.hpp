#pragma once

#include "prdguard/common/result.hpp"
#include "prdguard/config/schema.hpp"
#include "prdguard/security/audit_log.hpp"

#include <memory>
#include <optional>
#include <string>

namespace prdguard::security {

struct PathOptions {
  std::string context_id;
  /// Defaults to security.workspace_root.
  std::optional<std::string> workspace_root;
};

/// Maps untrusted relative paths onto absolute paths that are lexical descendants of the
/// workspace root. Containment is lexical only; symlinks inside the workspace are the
/// host's concern.
class PathValidator {
public:
  PathValidator(std::shared_ptr<const config::Config> config, std::shared_ptr<AuditLog> audit);

  /// Emits exactly one audit event per call.
  [[nodiscard]] common::SecurityResult<std::string> resolve(const std::string &candidate,
                                                            const PathOptions &options = {});
  [[nodiscard]] common::SecurityResult<std::string> resolve(const std::string &candidate,
                                                            const std::string &workspace_root);

  /// Sibling artifact path (temp file, backup) for an already resolved path. Re-checks
  /// containment and filename but not length or extension, so any path resolve()
  /// accepted can be staged. Emits nothing.
  [[nodiscard]] common::SecurityResult<std::string> derive(const std::string &validated,
                                                           const std::string &suffix) const;

  [[nodiscard]] const std::string &workspace_root() const { return config_->security.workspace_root; }

private:
  [[nodiscard]] common::SecurityResult<std::string> check(const std::string &candidate,
                                                          const std::string &root) const;
  [[nodiscard]] common::Status check_resolved(const std::string &resolved,
                                              const std::string &root,
                                              bool enforce_length = true) const;

  std::shared_ptr<const config::Config> config_;
  std::shared_ptr<AuditLog> audit_;
};

} // namespace prdguard::security
