#pragma once

#include "prdguard/common/result.hpp"
#include "prdguard/security/severity.hpp"

#include <memory>
#include <regex>
#include <string>
#include <vector>

namespace prdguard::security {

enum class PatternClass { Dangerous, Suspicious };

struct PatternEntry {
  std::string tag;
  std::string source;
  PatternClass classification = PatternClass::Dangerous;
  std::regex regex;
};

/// Line-oriented rule used by workspace scans; risk is the finding severity.
struct ScanRule {
  std::string tag;
  std::string source;
  Severity risk = Severity::High;
  std::regex regex;
};

/// Immutable rule set shared read-only by every validator.
struct PatternCatalog {
  std::string version;
  std::vector<PatternEntry> dangerous;
  std::vector<PatternEntry> suspicious;
  std::vector<PatternEntry> markdown_html;
  std::vector<PatternEntry> prompt_injection;
  std::vector<PatternEntry> secrets;
  std::vector<PatternEntry> pii;
  std::vector<ScanRule> scan_rules;
};

/// Compiles case-insensitively; throws std::regex_error on a bad source.
[[nodiscard]] PatternEntry make_pattern(std::string tag, std::string source,
                                        PatternClass classification);
[[nodiscard]] ScanRule make_scan_rule(std::string tag, std::string source, Severity risk);

[[nodiscard]] bool pattern_matches(const std::regex &regex, const std::string &text);
[[nodiscard]] const PatternEntry *first_match(const std::vector<PatternEntry> &entries,
                                              const std::string &text);
/// Tags of every matching entry, in catalog order, without duplicates.
[[nodiscard]] std::vector<std::string> all_matches(const std::vector<PatternEntry> &entries,
                                                   const std::string &text);

/// Folds fullwidth ASCII and angle-bracket look-alikes to ASCII and drops zero-width
/// characters, so screens see the text a renderer would show.
[[nodiscard]] std::string normalize_homoglyphs(const std::string &content);

[[nodiscard]] std::shared_ptr<const PatternCatalog> default_catalog();

/// Loads a TOML override. Entries look like
///   [dangerous.template_dunder]
///   pattern = '\{\{.*?__.*?\}\}'
/// Lists named in the file are appended to the built-in ones, or replace them when the
/// top-level key `replace = true` is set. Scan rules also take `risk = "high"`.
[[nodiscard]] common::Result<std::shared_ptr<const PatternCatalog>>
load_catalog(const std::string &path);

} // namespace prdguard::security
