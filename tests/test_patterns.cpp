#include "test_framework.hpp"

#include "prdguard/security/patterns.hpp"

#include <algorithm>
#include <filesystem>
#include <fstream>
#include <random>

namespace {

std::filesystem::path write_catalog(const std::string &content) {
  static std::mt19937_64 rng{std::random_device{}()};
  const auto path = std::filesystem::temp_directory_path() /
                    ("prdguard-test-catalog-" + std::to_string(rng()) + ".toml");
  std::ofstream out(path);
  out << content;
  return path;
}

bool has_tag(const std::vector<prdguard::security::PatternEntry> &entries, const std::string &tag) {
  return std::any_of(entries.begin(), entries.end(),
                     [&](const auto &entry) { return entry.tag == tag; });
}

std::string dangerous_tag(const std::string &text) {
  const auto catalog = prdguard::security::default_catalog();
  const auto *match = prdguard::security::first_match(catalog->dangerous, text);
  return match == nullptr ? "" : match->tag;
}

} // namespace

void register_patterns_tests(std::vector<prdguard::tests::TestCase> &tests) {
  using prdguard::tests::require;
  namespace sec = prdguard::security;

  tests.push_back({"catalog_default_is_shared_and_versioned", [] {
                     const auto first = sec::default_catalog();
                     const auto second = sec::default_catalog();
                     require(first.get() == second.get(), "default catalog should be shared");
                     require(!first->version.empty(), "catalog should carry a version");
                     require(!first->dangerous.empty() && !first->suspicious.empty(),
                             "both classes populated");
                     require(first->scan_rules.size() == 5, "five workspace scan rules");
                     require(has_tag(first->markdown_html, "event_handler"),
                             "markdown list should include event handlers");
                   }});

  tests.push_back({"catalog_dangerous_patterns_match", [] {
                     require(dangerous_tag("{{ config.__class__ }}") == "template_dunder",
                             "dunder in template");
                     require(dangerous_tag("{{7*7}}") == "template_expression",
                             "arithmetic template expression");
                     require(dangerous_tag("${1+1}") == "template_expression",
                             "dollar expression");
                     require(dangerous_tag("see ../secrets") == "dot_dot_slash", "traversal");
                     require(dangerous_tag("%2e%2e%2fetc") == "encoded_traversal",
                             "encoded traversal");
                     require(dangerous_tag("__import__('os')") == "python_import", "import call");
                     require(dangerous_tag("os.system('ls')") == "process_exec", "os.system");
                     require(dangerous_tag("requests.get(url)") == "network_module",
                             "requests call");
                   }});

  tests.push_back({"catalog_plain_prose_is_clean", [] {
                     const auto catalog = sec::default_catalog();
                     for (const std::string text :
                          {"Launch plan for Q3", "The system (as designed) scales.",
                           "Use requests. Then follow up.", "metadata: stored per tenant",
                           "condition = ready", "Version 1.2 ships {{ product_name }} in May"}) {
                       require(sec::first_match(catalog->dangerous, text) == nullptr,
                               "false positive on: " + text);
                     }
                   }});

  tests.push_back({"catalog_suspicious_patterns_match", [] {
                     const auto catalog = sec::default_catalog();
                     const auto tags =
                         sec::all_matches(catalog->suspicious, "<script>x</script> javascript:go");
                     require(std::find(tags.begin(), tags.end(), "script_tag") != tags.end(),
                             "script tag");
                     require(std::find(tags.begin(), tags.end(), "javascript_url") != tags.end(),
                             "javascript url");
                     require(sec::all_matches(catalog->suspicious, "data: see appendix").empty(),
                             "bare 'data:' is prose");
                     require(!sec::all_matches(catalog->suspicious,
                                               "data:text/html;base64,AAAA")
                                  .empty(),
                             "data url with mime type");
                   }});

  tests.push_back({"pattern_matches_long_input_in_windows", [] {
                     const auto catalog = sec::default_catalog();
                     std::string text(200 * 1024, 'a');
                     require(sec::first_match(catalog->dangerous, text) == nullptr,
                             "long clean input");
                     text.replace(150 * 1024, 5, "../x/");
                     require(sec::first_match(catalog->dangerous, text) != nullptr,
                             "match deep in long input");
                     std::string boundary(40 * 1024, 'b');
                     boundary.replace(16 * 1024 - 1, 3, "../");
                     require(sec::first_match(catalog->dangerous, boundary) != nullptr,
                             "match straddling a window edge");
                   }});

  tests.push_back({"normalize_homoglyphs_folds_lookalikes", [] {
                     // U+FF1C fullwidth '<', U+200B zero width space.
                     const std::string folded =
                         sec::normalize_homoglyphs("\xEF\xBC\x9Cscr\xE2\x80\x8Bipt>");
                     require(folded == "<script>", "fullwidth and zero-width should fold");
                     require(sec::normalize_homoglyphs("caf\xC3\xA9") == "caf\xC3\xA9",
                             "other code points unchanged");
                   }});

  tests.push_back({"load_catalog_appends_entries", [] {
                     const auto path = write_catalog(R"(
version = "test-1"
[dangerous.shell_backtick]
pattern = '`[^`]+`'
[scan_rules.internal_host]
pattern = 'corp\.internal'
risk = "medium"
)");
                     const auto loaded = sec::load_catalog(path.string());
                     std::filesystem::remove(path);
                     require(loaded.ok(), loaded.error());
                     const auto &catalog = *loaded.value();
                     require(catalog.version == "test-1", "version from file");
                     require(has_tag(catalog.dangerous, "shell_backtick"), "appended entry");
                     require(has_tag(catalog.dangerous, "template_dunder"), "built-ins kept");
                     require(catalog.scan_rules.size() == 6, "scan rule appended");
                     require(catalog.scan_rules.back().risk == sec::Severity::Medium,
                             "risk parsed");
                   }});

  tests.push_back({"load_catalog_replaces_lists", [] {
                     const auto path = write_catalog(R"(
replace = true
[suspicious.only_this]
pattern = 'forbidden-word'
)");
                     const auto loaded = sec::load_catalog(path.string());
                     std::filesystem::remove(path);
                     require(loaded.ok(), loaded.error());
                     const auto &catalog = *loaded.value();
                     require(catalog.suspicious.size() == 1, "suspicious list replaced");
                     require(catalog.suspicious.front().classification ==
                                 sec::PatternClass::Suspicious,
                             "classification follows the list");
                     require(!catalog.dangerous.empty(), "unnamed lists keep built-ins");
                   }});

  tests.push_back({"load_catalog_rejects_bad_regex", [] {
                     const auto path = write_catalog("[dangerous.broken]\npattern = '(unclosed'\n");
                     const auto loaded = sec::load_catalog(path.string());
                     std::filesystem::remove(path);
                     require(!loaded.ok(), "bad regex should fail");
                     require(loaded.error().find("invalid pattern") != std::string::npos,
                             "error should say invalid pattern");
                   }});

  tests.push_back({"load_catalog_missing_file_fails", [] {
                     const auto loaded = sec::load_catalog("/nonexistent/prdguard/patterns.toml");
                     require(!loaded.ok(), "missing file should fail");
                   }});
}
