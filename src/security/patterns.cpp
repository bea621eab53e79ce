#include "prdguard/security/patterns.hpp"

#include "prdguard/common/toml.hpp"

#include <algorithm>
#include <array>
#include <cstdint>

namespace prdguard::security {

namespace {

constexpr const char *kBuiltinVersion = "2026.10.1";

// libstdc++'s regex executor recurses per input character, so long inputs are searched
// in overlapping windows. Matches up to kWindowOverlap bytes long are never split.
constexpr std::size_t kWindowSize = 16 * 1024;
constexpr std::size_t kWindowOverlap = 4 * 1024;

struct RawPattern {
  const char *tag;
  const char *source;
};

struct RawScanRule {
  const char *tag;
  const char *source;
  Severity risk;
};

const std::array kDangerous = {
    RawPattern{"template_dunder", R"(\{\{.*?__.*?\}\})"},
    RawPattern{"template_eval", R"(\{\{.*?\beval\s*\(.*?\}\})"},
    RawPattern{"template_exec", R"(\{\{.*?\bexec\s*\(.*?\}\})"},
    RawPattern{"template_import", R"(\{\{.*?\bimport\s+.*?\}\})"},
    RawPattern{"template_subprocess", R"(\{\{.*?subprocess.*?\}\})"},
    RawPattern{"template_os", R"(\{\{.*?\bos\..*?\}\})"},
    RawPattern{"template_file", R"(\{\{.*?\bfile\s*\(.*?\}\})"},
    RawPattern{"template_open", R"(\{\{.*?\bopen\s*\(.*?\}\})"},
    RawPattern{"template_expression",
               R"(\{\{[^{}\n]*\d\s*[-+*/%]\s*\d[^{}\n]*\}\}|\$\{[^{}\n]*\d\s*[-+*/%]\s*\d[^{}\n]*\})"},
    RawPattern{"dot_dot_slash", R"(\.\.[/\\])"},
    RawPattern{"dot_dot_segment", R"([/\\]\.\.[/\\])"},
    RawPattern{"null_byte", R"(\x00)"},
    RawPattern{"encoded_traversal", R"(%2e%2e(%2f|%5c|/|\\)|\.\.(%2f|%5c)|%252e%252e)"},
    RawPattern{"python_import", R"(__import__\s*\()"},
    RawPattern{"attribute_access", R"(\b(get|set|del)attr\s*\()"},
    RawPattern{"scope_access", R"(\b(globals|locals|vars)\(\s*\))"},
    RawPattern{"process_exec",
               R"(\b(system|spawn)\(|\bpopen\s*\(|\bos\.(system|popen|exec\w*|spawn\w*)\b|\bsubprocess\.\w+)"},
    RawPattern{"network_module",
               R"(\burllib\d?\.(request|parse|urlopen)|\brequests\.(get|post|put|patch|delete|head|request|Session)\s*\(|\bsocket\.\w+\s*\(|\bhttp\.(client|server)\b)"},
};

const std::array kSuspicious = {
    RawPattern{"template_concat", R"(\{\{.*?['"]\s*\+\s*.*?\}\})"},
    RawPattern{"template_subscript", R"(\{\{.*?\[.*?\].*?\}\})"},
    RawPattern{"template_attribute", R"(\{\{.*?\.\s*\w+.*?\}\})"},
    RawPattern{"javascript_url", R"(javascript\s*:)"},
    RawPattern{"vbscript_url", R"(vbscript\s*:)"},
    RawPattern{"data_url", R"(\bdata:[a-z]+/[a-z0-9.+-]+[;,])"},
    RawPattern{"script_tag", R"(<script[^>]*>)"},
    RawPattern{"iframe_tag", R"(<iframe[^>]*>)"},
    RawPattern{"object_tag", R"(<object[^>]*>)"},
    RawPattern{"embed_tag", R"(<embed[^>]*>)"},
};

const std::array kMarkdownHtml = {
    RawPattern{"script_tag", R"(<script[^>]*>)"},
    RawPattern{"iframe_tag", R"(<iframe[^>]*>)"},
    RawPattern{"object_tag", R"(<object[^>]*>)"},
    RawPattern{"embed_tag", R"(<embed[^>]*>)"},
    RawPattern{"form_tag", R"(<form[^>]*>)"},
    RawPattern{"input_tag", R"(<input[^>]*>)"},
    RawPattern{"javascript_url", R"(javascript\s*:)"},
    RawPattern{"vbscript_url", R"(vbscript\s*:)"},
    RawPattern{"data_url", R"(\bdata:[a-z]+/[a-z0-9.+-]+[;,])"},
    RawPattern{"event_handler", R"(<[^>]+\son[a-z]+\s*=)"},
};

const std::array kPromptInjection = {
    RawPattern{"ignore_previous_instructions",
               R"(ignore\s+(all\s+)?(previous|prior|above)\s+(instructions?|prompts?))"},
    RawPattern{"disregard_previous", R"(disregard\s+(all\s+)?(previous|prior|above))"},
    RawPattern{"forget_instructions",
               R"(forget\s+(everything|all|your)(\s+(instructions?|rules?|guidelines?))?)"},
    RawPattern{"you_are_now", R"(you\s+are\s+now\s+(a|an)\s+)"},
    RawPattern{"new_instructions", R"(new\s+instructions?\s*:)"},
    RawPattern{"system_prompt", R"(system\s*:?\s*(prompt|override|command))"},
    RawPattern{"jailbreak", R"(\bjailbreak)"},
    RawPattern{"pretend_to_be", R"(pretend\s+to\s+be\b)"},
    RawPattern{"act_as_if", R"(\bact\s+as\s+if\b)"},
    RawPattern{"elevated_true", R"(elevated\s*=\s*true)"},
    RawPattern{"destructive_rm", R"(rm\s+-rf)"},
    RawPattern{"xml_system_tag", R"(<\/?system>)"},
    RawPattern{"role_boundary", R"(\]\s*\n\s*\[?(system|assistant|user)\]?:)"},
};

const std::array kSecrets = {
    RawPattern{"private_key", R"(-----BEGIN [A-Z ]*PRIVATE KEY-----)"},
    RawPattern{"aws_access_key", R"(\bAKIA[0-9A-Z]{16}\b)"},
    RawPattern{"provider_api_key", R"(\b(sk|pk|rk)-[A-Za-z0-9_-]{20,})"},
    RawPattern{"bearer_token", R"(\bbearer\s+[A-Za-z0-9._~+/-]{20,}=*)"},
    RawPattern{"credential_assignment",
               R"(\b(api[_-]?key|secret|access[_-]?token|password)\s*[:=]\s*['"]?[A-Za-z0-9_/+-]{12,})"},
};

const std::array kPii = {
    RawPattern{"ssn", R"(\b\d{3}-\d{2}-\d{4}\b)"},
    RawPattern{"payment_card", R"(\b\d{4}[ -]?\d{4}[ -]?\d{4}[ -]?\d{1,4}\b)"},
    RawPattern{"email", R"(\b[A-Za-z0-9._%+-]+@[A-Za-z0-9.-]+\.[A-Za-z]{2,}\b)"},
    RawPattern{"phone", R"((\(\d{3}\)\s?|\b\d{3}[-. ])\d{3}[-. ]\d{4}\b)"},
};

const std::array kScanRules = {
    RawScanRule{"secrets",
                R"(\b(password|secret|token|api[_-]?key|access[_-]?token|private[_-]?key)\b)",
                Severity::Critical},
    RawScanRule{"injection", R"(\{\{|\$\{|<script|javascript:|eval\(|function\(|require\(|import\()",
                Severity::High},
    RawScanRule{"paths", R"(\.\./|\.\\|/etc/|/home/|/root/|/var/|C:\\|\\\\)", Severity::High},
    RawScanRule{"commands", R"(exec\(|system\(|shell[_-]?exec|cmd\.exe|/bin/sh|/bin/bash)",
                Severity::Critical},
    RawScanRule{"personal_data",
                R"(\bssn\b|social.security|credit.card|passport|driver.license)", Severity::High},
};

bool decode_utf8_codepoint(const std::string &input, std::size_t &index, std::uint32_t &cp,
                           std::size_t &length) {
  const auto lead = static_cast<unsigned char>(input[index]);
  std::size_t extra = 0;
  std::uint32_t value = lead;
  if ((lead & 0xE0U) == 0xC0U) {
    extra = 1;
    value = lead & 0x1FU;
  } else if ((lead & 0xF0U) == 0xE0U) {
    extra = 2;
    value = lead & 0x0FU;
  } else if ((lead & 0xF8U) == 0xF0U) {
    extra = 3;
    value = lead & 0x07U;
  }

  if (extra == 0 || index + extra >= input.size()) {
    cp = lead;
    length = 1;
    return extra == 0;
  }
  for (std::size_t i = 1; i <= extra; ++i) {
    const auto cont = static_cast<unsigned char>(input[index + i]);
    if ((cont & 0xC0U) != 0x80U) {
      cp = lead;
      length = 1;
      return false;
    }
    value = (value << 6U) | static_cast<std::uint32_t>(cont & 0x3FU);
  }
  cp = value;
  length = extra + 1;
  return true;
}

// Fullwidth ASCII, angle-bracket look-alikes and zero-width characters.
std::string fold_codepoint(const std::uint32_t cp, const std::string &raw) {
  if (cp >= 0xFF01U && cp <= 0xFF5EU) {
    return std::string(1, static_cast<char>(cp - 0xFEE0U));
  }

  switch (cp) {
  case 0x2329U:
  case 0x3008U:
  case 0x2039U:
  case 0x27E8U:
  case 0xFE64U:
    return "<";
  case 0x232AU:
  case 0x3009U:
  case 0x203AU:
  case 0x27E9U:
  case 0xFE65U:
    return ">";
  case 0x200BU:
  case 0x200CU:
  case 0x200DU:
  case 0x2060U:
  case 0xFEFFU:
    return "";
  default:
    break;
  }
  return raw;
}

template <std::size_t N>
void append_raw(std::vector<PatternEntry> &out, const std::array<RawPattern, N> &raw,
                const PatternClass classification) {
  out.reserve(out.size() + N);
  for (const auto &entry : raw) {
    out.push_back(make_pattern(entry.tag, entry.source, classification));
  }
}

std::vector<PatternEntry> *list_by_name(PatternCatalog &catalog, const std::string &name) {
  if (name == "dangerous") {
    return &catalog.dangerous;
  }
  if (name == "suspicious") {
    return &catalog.suspicious;
  }
  if (name == "markdown_html") {
    return &catalog.markdown_html;
  }
  if (name == "prompt_injection") {
    return &catalog.prompt_injection;
  }
  if (name == "secrets") {
    return &catalog.secrets;
  }
  if (name == "pii") {
    return &catalog.pii;
  }
  return nullptr;
}

PatternClass class_for_list(const std::string &name) {
  return (name == "suspicious" || name == "pii" || name == "prompt_injection")
             ? PatternClass::Suspicious
             : PatternClass::Dangerous;
}

PatternCatalog build_default() {
  PatternCatalog catalog;
  catalog.version = kBuiltinVersion;
  append_raw(catalog.dangerous, kDangerous, PatternClass::Dangerous);
  append_raw(catalog.suspicious, kSuspicious, PatternClass::Suspicious);
  append_raw(catalog.markdown_html, kMarkdownHtml, PatternClass::Dangerous);
  append_raw(catalog.prompt_injection, kPromptInjection, PatternClass::Suspicious);
  append_raw(catalog.secrets, kSecrets, PatternClass::Dangerous);
  append_raw(catalog.pii, kPii, PatternClass::Suspicious);
  for (const auto &rule : kScanRules) {
    catalog.scan_rules.push_back(make_scan_rule(rule.tag, rule.source, rule.risk));
  }
  return catalog;
}

} // namespace

PatternEntry make_pattern(std::string tag, std::string source, const PatternClass classification) {
  std::regex regex(source, std::regex::ECMAScript | std::regex::icase);
  return PatternEntry{.tag = std::move(tag),
                      .source = std::move(source),
                      .classification = classification,
                      .regex = std::move(regex)};
}

ScanRule make_scan_rule(std::string tag, std::string source, const Severity risk) {
  std::regex regex(source, std::regex::ECMAScript | std::regex::icase);
  return ScanRule{
      .tag = std::move(tag), .source = std::move(source), .risk = risk, .regex = std::move(regex)};
}

bool pattern_matches(const std::regex &regex, const std::string &text) {
  if (text.size() <= kWindowSize) {
    return std::regex_search(text, regex);
  }
  const std::size_t step = kWindowSize - kWindowOverlap;
  for (std::size_t start = 0; start < text.size(); start += step) {
    const auto first = text.begin() + static_cast<std::ptrdiff_t>(start);
    const auto last = text.begin() + static_cast<std::ptrdiff_t>(
                                         std::min(text.size(), start + kWindowSize));
    if (std::regex_search(first, last, regex)) {
      return true;
    }
    if (start + kWindowSize >= text.size()) {
      break;
    }
  }
  return false;
}

const PatternEntry *first_match(const std::vector<PatternEntry> &entries,
                                const std::string &text) {
  for (const auto &entry : entries) {
    if (pattern_matches(entry.regex, text)) {
      return &entry;
    }
  }
  return nullptr;
}

std::vector<std::string> all_matches(const std::vector<PatternEntry> &entries,
                                     const std::string &text) {
  std::vector<std::string> tags;
  for (const auto &entry : entries) {
    if (std::find(tags.begin(), tags.end(), entry.tag) != tags.end()) {
      continue;
    }
    if (pattern_matches(entry.regex, text)) {
      tags.push_back(entry.tag);
    }
  }
  return tags;
}

std::string normalize_homoglyphs(const std::string &content) {
  std::string output;
  output.reserve(content.size());

  std::size_t index = 0;
  while (index < content.size()) {
    std::uint32_t cp = 0;
    std::size_t length = 1;
    decode_utf8_codepoint(content, index, cp, length);
    output += fold_codepoint(cp, content.substr(index, length));
    index += length;
  }
  return output;
}

std::shared_ptr<const PatternCatalog> default_catalog() {
  static const std::shared_ptr<const PatternCatalog> catalog =
      std::make_shared<const PatternCatalog>(build_default());
  return catalog;
}

common::Result<std::shared_ptr<const PatternCatalog>> load_catalog(const std::string &path) {
  using CatalogResult = common::Result<std::shared_ptr<const PatternCatalog>>;

  auto loaded = common::load_toml_file(path);
  if (!loaded.ok()) {
    return CatalogResult::failure(loaded.error());
  }
  const auto &doc = loaded.value();

  PatternCatalog catalog = *default_catalog();
  const bool replace = doc.get_bool("replace", false);
  catalog.version = doc.get_string("version", catalog.version + "+" + path);

  static const std::array kListNames = {"dangerous",        "suspicious", "markdown_html",
                                        "prompt_injection", "secrets",    "pii"};
  try {
    for (const std::string list_name : kListNames) {
      const auto tags = doc.child_names(list_name);
      if (tags.empty()) {
        continue;
      }
      auto *list = list_by_name(catalog, list_name);
      if (replace) {
        list->clear();
      }
      for (const auto &tag : tags) {
        const std::string key = list_name + "." + tag + ".pattern";
        if (!doc.has(key)) {
          return CatalogResult::failure(path + ": missing " + key);
        }
        list->push_back(make_pattern(tag, doc.get_string(key), class_for_list(list_name)));
      }
    }

    const auto rule_tags = doc.child_names("scan_rules");
    if (!rule_tags.empty() && replace) {
      catalog.scan_rules.clear();
    }
    for (const auto &tag : rule_tags) {
      const std::string key = "scan_rules." + tag + ".pattern";
      if (!doc.has(key)) {
        return CatalogResult::failure(path + ": missing " + key);
      }
      auto risk = parse_severity(doc.get_string("scan_rules." + tag + ".risk", "high"));
      if (!risk.ok()) {
        return CatalogResult::failure(path + ": " + risk.error());
      }
      catalog.scan_rules.push_back(make_scan_rule(tag, doc.get_string(key), risk.value()));
    }
  } catch (const std::regex_error &e) {
    return CatalogResult::failure(path + ": invalid pattern: " + e.what());
  }

  return CatalogResult::success(std::make_shared<const PatternCatalog>(std::move(catalog)));
}

} // namespace prdguard::security
