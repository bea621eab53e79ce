#include "prdguard/security/input_validator.hpp"

#include "prdguard/common/fs.hpp"
#include "prdguard/observability/global.hpp"

#include <array>
#include <exception>
#include <string_view>

namespace prdguard::security {

namespace {

using Clock = std::chrono::steady_clock;

constexpr std::size_t kSampleChars = 64;

const std::array<std::string_view, 5> kEntities = {"&amp;", "&lt;", "&gt;", "&quot;", "&#x27;"};

bool is_stripped_control(const unsigned char c) {
  return c <= 0x08U || c == 0x0BU || c == 0x0CU || (c >= 0x0EU && c <= 0x1FU) || c == 0x7FU;
}

std::string strip_controls(const std::string &text) {
  std::string out;
  out.reserve(text.size());
  for (const char ch : text) {
    if (!is_stripped_control(static_cast<unsigned char>(ch))) {
      out.push_back(ch);
    }
  }
  return out;
}

std::string normalize_line_endings(const std::string &text) {
  std::string out;
  out.reserve(text.size());
  for (std::size_t i = 0; i < text.size(); ++i) {
    if (text[i] != '\r') {
      out.push_back(text[i]);
      continue;
    }
    out.push_back('\n');
    if (i + 1 < text.size() && text[i + 1] == '\n') {
      ++i;
    }
  }
  return out;
}

// Runs of four or more blanks become three spaces; four or more newlines become three.
std::string collapse_runs(const std::string &text) {
  std::string out;
  out.reserve(text.size());
  std::size_t i = 0;
  while (i < text.size()) {
    const char ch = text[i];
    const bool blank = ch == ' ' || ch == '\t';
    if (!blank && ch != '\n') {
      out.push_back(ch);
      ++i;
      continue;
    }
    std::size_t j = i;
    while (j < text.size() && (blank ? (text[j] == ' ' || text[j] == '\t') : text[j] == '\n')) {
      ++j;
    }
    if (j - i >= 4) {
      out += blank ? "   " : "\n\n\n";
    } else {
      out.append(text, i, j - i);
    }
    i = j;
  }
  return out;
}

// Existing entities are left alone so a second pass changes nothing.
std::string encode_entities(const std::string &text) {
  std::string out;
  out.reserve(text.size() + text.size() / 8);
  for (std::size_t i = 0; i < text.size(); ++i) {
    switch (text[i]) {
    case '&': {
      bool encoded = false;
      for (const auto entity : kEntities) {
        if (text.compare(i, entity.size(), entity) == 0) {
          encoded = true;
          break;
        }
      }
      out += encoded ? "&" : "&amp;";
      break;
    }
    case '<':
      out += "&lt;";
      break;
    case '>':
      out += "&gt;";
      break;
    case '"':
      out += "&quot;";
      break;
    case '\'':
      out += "&#x27;";
      break;
    default:
      out.push_back(text[i]);
      break;
    }
  }
  return out;
}

std::string join(const std::vector<std::string> &parts, const std::string &separator) {
  std::string out;
  for (const auto &part : parts) {
    if (!out.empty()) {
      out += separator;
    }
    out += part;
  }
  return out;
}

bool is_shape_failure(const std::string &threat) {
  return threat == "input_size_limit" || threat == "null_bytes" || threat == "control_characters";
}

bool reject(InputInspection &out, std::string error, std::string threat, std::string rule = "") {
  out.error = std::move(error);
  out.threat = std::move(threat);
  out.rule = std::move(rule);
  return false;
}

} // namespace

InputValidator::InputValidator(std::shared_ptr<const config::Config> config,
                               std::shared_ptr<const PatternCatalog> catalog,
                               std::shared_ptr<IThreatScanner> scanner,
                               std::shared_ptr<AuditLog> audit)
    : config_(std::move(config)), catalog_(std::move(catalog)), scanner_(std::move(scanner)),
      audit_(std::move(audit)) {}

std::string InputValidator::sanitize(const std::string &text, const SanitizeMode mode) {
  std::string out = normalize_line_endings(strip_controls(text));
  if (mode == SanitizeMode::Content) {
    return out;
  }
  return common::trim(encode_entities(collapse_runs(out)));
}

bool InputValidator::basic_checks(const std::string &text, const std::size_t max_size,
                                  InputInspection &out) const {
  out.original_length = common::utf8_length(text);
  if (out.original_length > max_size) {
    return reject(out, "Input exceeds the maximum allowed size", "input_size_limit");
  }
  if (text.find('\0') != std::string::npos) {
    return reject(out, "Input contains null bytes", "null_bytes");
  }

  std::size_t controls = 0;
  for (const char ch : text) {
    if (is_stripped_control(static_cast<unsigned char>(ch))) {
      ++controls;
    }
  }
  if (out.original_length > 0 && controls * 10 > out.original_length) {
    return reject(out, "Input contains too many control characters", "control_characters");
  }
  return true;
}

bool InputValidator::threat_scan(const std::string &text, InputInspection &out) {
  if (!config_->security.enable_threat_scan || scanner_ == nullptr) {
    return true;
  }
  out.scanned = true;

  const auto start = Clock::now();
  std::optional<common::Result<ScanResult>> result;
  try {
    result.emplace(scanner_->scan(text));
  } catch (const std::exception &e) {
    observability::record_error("threat_scan", e.what());
    return reject(out, "Input could not be verified as safe", "scan_failure", "scanner_exception");
  }
  const auto elapsed = std::chrono::duration_cast<std::chrono::microseconds>(Clock::now() - start);
  observability::record_threat_scan(std::string(scanner_->name()), elapsed,
                                    result->ok() && result->value().safe);

  if (!result->ok()) {
    return reject(out, "Input could not be verified as safe", "scan_failure",
                  common::truncate_utf8(result->error(), kSampleChars));
  }
  const auto budget = std::chrono::milliseconds(config_->scanner.timeout_ms);
  if (scanner_->latency_bounded() && elapsed > budget) {
    return reject(out, "Input could not be verified as safe", "scan_failure", "scanner_timeout");
  }

  const auto &scan = result->value();
  out.scanner_threats = scan.threats;
  if (!scan.safe) {
    return reject(out, "Input was flagged by the threat scan",
                  scan.threats.empty() ? "scan_threat" : join(scan.threats, ","),
                  std::string(scanner_->name()));
  }
  return true;
}

bool InputValidator::pattern_screen(const std::string &text, InputInspection &out) const {
  const std::string normalized = normalize_homoglyphs(text);
  if (const auto *match = first_match(catalog_->dangerous, normalized); match != nullptr) {
    return reject(out, "Input contains a blocked pattern", "dangerous_pattern", match->tag);
  }

  out.suspicious = all_matches(catalog_->suspicious, normalized);
  if (!out.suspicious.empty() && config_->security.level == config::SecurityLevel::Strict) {
    return reject(out, "Input contains a disallowed pattern", "suspicious_pattern",
                  out.suspicious.front());
  }
  return true;
}

InputInspection InputValidator::inspect(const std::string &text, const InputOptions &options) {
  const auto start = Clock::now();
  InputInspection out;
  const std::size_t max_size = options.max_size.value_or(config_->security.max_input_size);

  if (basic_checks(text, max_size, out) && threat_scan(text, out) && pattern_screen(text, out)) {
    out.accepted = true;
    out.sanitized = sanitize(text, options.mode);
  }

  out.elapsed = std::chrono::duration_cast<std::chrono::microseconds>(Clock::now() - start);
  return out;
}

common::SecurityResult<std::string> InputValidator::validate(const std::string &text,
                                                             const std::string &context) {
  return validate(text, InputOptions{.context = context});
}

common::SecurityResult<std::string> InputValidator::validate(const std::string &text,
                                                             const InputOptions &options) {
  const InputInspection inspection = inspect(text, options);
  observability::record_validation_latency(inspection.elapsed);

  std::map<std::string, std::string> details;
  details["context"] = options.context;
  details["original_length"] = std::to_string(inspection.original_length);
  if (!inspection.suspicious.empty()) {
    details["suspicious"] = join(inspection.suspicious, ",");
  }
  if (!inspection.scanner_threats.empty()) {
    details["scanner_threats"] = join(inspection.scanner_threats, ",");
  }

  if (!inspection.accepted) {
    details["threat"] = inspection.threat;
    if (!inspection.rule.empty()) {
      details["rule"] = inspection.rule;
    }
    details["sample"] = sanitize(common::truncate_utf8(text, kSampleChars));
    const std::string type = is_shape_failure(inspection.threat) ? event_type::kValidationFailed
                                                                 : event_type::kThreatDetected;
    const Severity severity = severity_for(type, inspection.threat);
    audit_->emit(type, severity, std::move(details), options.context_id);
    return common::SecurityResult<std::string>::failure(inspection.error, inspection.threat);
  }

  const Severity severity = inspection.suspicious.empty() ? Severity::Low : Severity::Medium;
  if (inspection.sanitized != text) {
    details["sanitized_length"] = std::to_string(common::utf8_length(inspection.sanitized));
    audit_->emit(event_type::kInputSanitized, severity, std::move(details), options.context_id);
  } else {
    audit_->emit(event_type::kValidationPassed, severity, std::move(details), options.context_id);
  }
  return common::SecurityResult<std::string>::success(inspection.sanitized);
}

} // namespace prdguard::security
