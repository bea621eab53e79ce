#pragma once

#include "prdguard/common/result.hpp"
#include "prdguard/config/schema.hpp"
#include "prdguard/security/audit_log.hpp"
#include "prdguard/security/patterns.hpp"
#include "prdguard/security/threat_scanner.hpp"

#include <chrono>
#include <cstddef>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace prdguard::security {

enum class SanitizeMode {
  /// Free text bound for documents: full cleanup including HTML entity encoding.
  Text,
  /// File payloads: control characters and line endings only, so JSON and Markdown
  /// survive byte-for-byte otherwise.
  Content,
};

struct InputOptions {
  /// Audit label only; never used for authorization.
  std::string context;
  /// Correlates the emitted event with an enclosing operation.
  std::string context_id;
  std::optional<std::size_t> max_size;
  SanitizeMode mode = SanitizeMode::Text;
};

/// Pipeline outcome without side effects.
struct InputInspection {
  bool accepted = false;
  std::string sanitized;
  std::string error;
  std::string threat;
  /// Catalog tag or scanner detail behind the threat.
  std::string rule;
  std::vector<std::string> suspicious;
  std::vector<std::string> scanner_threats;
  bool scanned = false;
  std::size_t original_length = 0;
  std::chrono::microseconds elapsed{0};
};

class InputValidator {
public:
  InputValidator(std::shared_ptr<const config::Config> config,
                 std::shared_ptr<const PatternCatalog> catalog,
                 std::shared_ptr<IThreatScanner> scanner, std::shared_ptr<AuditLog> audit);

  /// Emits exactly one audit event per call.
  [[nodiscard]] common::SecurityResult<std::string> validate(const std::string &text,
                                                             const std::string &context);
  [[nodiscard]] common::SecurityResult<std::string> validate(const std::string &text,
                                                             const InputOptions &options);

  [[nodiscard]] InputInspection inspect(const std::string &text, const InputOptions &options);

  [[nodiscard]] static std::string sanitize(const std::string &text,
                                            SanitizeMode mode = SanitizeMode::Text);

  [[nodiscard]] const config::Config &config() const { return *config_; }

private:
  [[nodiscard]] bool basic_checks(const std::string &text, std::size_t max_size,
                                  InputInspection &out) const;
  [[nodiscard]] bool threat_scan(const std::string &text, InputInspection &out);
  [[nodiscard]] bool pattern_screen(const std::string &text, InputInspection &out) const;

  std::shared_ptr<const config::Config> config_;
  std::shared_ptr<const PatternCatalog> catalog_;
  std::shared_ptr<IThreatScanner> scanner_;
  std::shared_ptr<AuditLog> audit_;
};

} // namespace prdguard::security
