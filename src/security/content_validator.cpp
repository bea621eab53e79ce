#include "prdguard/security/content_validator.hpp"

#include "prdguard/common/fs.hpp"
#include "prdguard/common/json_util.hpp"

#include <filesystem>

namespace prdguard::security {

ContentValidator::ContentValidator(std::shared_ptr<const config::Config> config,
                                   std::shared_ptr<const PatternCatalog> catalog,
                                   std::shared_ptr<InputValidator> input,
                                   std::shared_ptr<AuditLog> audit)
    : config_(std::move(config)), catalog_(std::move(catalog)), input_(std::move(input)),
      audit_(std::move(audit)) {}

common::Status ContentValidator::check_structure(const std::string &content,
                                                 const std::string &target_path) const {
  const std::string extension =
      common::to_lower(std::filesystem::path(target_path).extension().string());

  if (extension == ".json") {
    if (const auto status = common::json_validate(content); !status.ok()) {
      return common::Status::error("Content is not valid JSON (" + status.error() + ")",
                                   "invalid_json");
    }
  } else if (extension == ".md") {
    const auto *match = first_match(catalog_->markdown_html, normalize_homoglyphs(content));
    if (match != nullptr) {
      return common::Status::error("Markdown contains disallowed HTML (" + match->tag + ")",
                                   "markdown_html");
    }
  }
  return common::Status::success();
}

common::SecurityResult<std::string> ContentValidator::rejected(common::Status status,
                                                               const std::string &target_path,
                                                               const std::string &context_id) {
  audit_->emit(event_type::kContentRejected,
               severity_for(event_type::kContentRejected, status.threat()),
               {{"path", target_path}, {"threat", status.threat()}}, context_id);
  return common::SecurityResult<std::string>::failure(status.error(), status.threat());
}

common::SecurityResult<std::string> ContentValidator::validate(const std::string &content,
                                                               const std::string &target_path,
                                                               const std::string &context_id) {
  const auto max_size = config_->security.max_file_size;
  if (content.size() > max_size) {
    return rejected(common::Status::error("Content exceeds the maximum file size",
                                          "file_size_limit"),
                    target_path, context_id);
  }

  auto screened = input_->validate(content, InputOptions{
                                                .context = "file:" + target_path,
                                                .context_id = context_id,
                                                .max_size = static_cast<std::size_t>(max_size),
                                                .mode = SanitizeMode::Content,
                                            });
  if (!screened.ok()) {
    return rejected(common::Status::error(screened.error(), screened.threat()), target_path,
                    context_id);
  }

  if (auto status = check_structure(screened.value(), target_path); !status.ok()) {
    return rejected(std::move(status), target_path, context_id);
  }

  audit_->emit(event_type::kContentValidated, Severity::Low,
               {{"path", target_path}, {"bytes", std::to_string(screened.value().size())}},
               context_id);
  return screened;
}

} // namespace prdguard::security
