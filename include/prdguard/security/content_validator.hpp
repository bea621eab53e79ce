#pragma once

#include "prdguard/common/result.hpp"
#include "prdguard/config/schema.hpp"
#include "prdguard/security/audit_log.hpp"
#include "prdguard/security/input_validator.hpp"
#include "prdguard/security/patterns.hpp"

#include <memory>
#include <string>

namespace prdguard::security {

class ContentValidator {
public:
  ContentValidator(std::shared_ptr<const config::Config> config,
                   std::shared_ptr<const PatternCatalog> catalog,
                   std::shared_ptr<InputValidator> input, std::shared_ptr<AuditLog> audit);

  /// Size ceiling, the input pipeline in content mode, then structural checks for the
  /// target's extension. Returns the content as it should be written.
  [[nodiscard]] common::SecurityResult<std::string>
  validate(const std::string &content, const std::string &target_path,
           const std::string &context_id = "");

  /// `.json` must be well-formed; `.md` must be free of active HTML. Other types pass.
  [[nodiscard]] common::Status check_structure(const std::string &content,
                                               const std::string &target_path) const;

private:
  common::SecurityResult<std::string> rejected(common::Status status,
                                               const std::string &target_path,
                                               const std::string &context_id);

  std::shared_ptr<const config::Config> config_;
  std::shared_ptr<const PatternCatalog> catalog_;
  std::shared_ptr<InputValidator> input_;
  std::shared_ptr<AuditLog> audit_;
};

} // namespace prdguard::security
