#include "test_framework.hpp"

#include "prdguard/security/path_validator.hpp"
#include "tests/helpers/test_helpers.hpp"

#include <filesystem>
#include <memory>

namespace {

using prdguard::security::AuditLog;
using prdguard::security::PathValidator;

struct Fixture {
  std::shared_ptr<prdguard::config::Config> config =
      std::make_shared<prdguard::config::Config>(prdguard::testing::memory_config("/ws"));
  std::shared_ptr<AuditLog> audit = std::make_shared<AuditLog>(false);

  [[nodiscard]] PathValidator validator() const { return PathValidator(config, audit); }
};

bool contains_dot_dot_segment(const std::string &path) {
  for (const auto &part : std::filesystem::path(path)) {
    if (part == "..") {
      return true;
    }
  }
  return false;
}

} // namespace

void register_path_validator_tests(std::vector<prdguard::tests::TestCase> &tests) {
  using prdguard::tests::require;
  using prdguard::tests::require_threat;
  namespace sec = prdguard::security;

  tests.push_back({"path_resolves_relative_inside_root", [] {
                     Fixture fx;
                     auto paths = fx.validator();
                     const auto result = paths.resolve("docs/report.md", "/ws");
                     require(result.ok(), result.error());
                     require(result.value() == "/ws/docs/report.md", result.value());
                     const auto events = fx.audit->query({});
                     require(events.size() == 1 && events[0].type == sec::event_type::kPathValidated,
                             "one path_validated event");
                   }});

  tests.push_back({"path_rejects_traversal", [] {
                     Fixture fx;
                     auto paths = fx.validator();
                     const auto result = paths.resolve("../../../etc/passwd", "/ws");
                     require(!result.ok(), "traversal should fail");
                     require(result.threat() == "path_traversal", result.threat());
                     require(result.error().find("passwd") == std::string::npos,
                             "error must not echo the path");
                     const auto events = fx.audit->query({});
                     require(events.size() == 1 && events[0].type == sec::event_type::kPathRejected,
                             "one path_rejected event");
                     require(events[0].severity == sec::Severity::Critical, "traversal is critical");
                   }});

  tests.push_back({"path_rejects_encoded_and_backslash_traversal", [] {
                     Fixture fx;
                     auto paths = fx.validator();
                     for (const std::string &candidate : std::initializer_list<std::string>{
                              "%2e%2e/%2e%2e/etc/passwd.md", "%252e%252e%252fsecret.md",
                              "..\\..\\windows\\win.ini.md", "docs/%2E%2E/x.md",
                              std::string("docs/a\0.md", 10)}) {
                       require_threat(paths.resolve(candidate), "path_traversal");
                     }
                   }});

  tests.push_back({"path_rejects_absolute_escape", [] {
                     Fixture fx;
                     auto paths = fx.validator();
                     const auto outside = paths.resolve("/etc/passwd.md");
                     require(!outside.ok() && outside.threat() == "directory_escape",
                             outside.threat());
                     const auto sibling = paths.resolve("/ws-other/a.md");
                     require(!sibling.ok() && sibling.threat() == "directory_escape",
                             "shared prefix sibling is outside");
                     const auto inside = paths.resolve("/ws/notes/a.md");
                     require(inside.ok() && inside.value() == "/ws/notes/a.md",
                             "absolute path inside the root is accepted");
                   }});

  tests.push_back({"path_rejects_root_itself_and_empty", [] {
                     Fixture fx;
                     auto paths = fx.validator();
                     require_threat(paths.resolve(""), "empty_path");
                     require_threat(paths.resolve("   "), "empty_path");
                     require(!paths.resolve(".").ok(), "the root itself is not a file");
                     require(!paths.resolve("/ws").ok(), "absolute root is not a file");
                   }});

  tests.push_back({"path_checks_extension", [] {
                     Fixture fx;
                     auto paths = fx.validator();
                     require_threat(paths.resolve("run.sh"), "invalid_extension");
                     require_threat(paths.resolve("Makefile"), "invalid_extension");
                     require(paths.resolve("README.MD").ok(), "extension match is case-insensitive");
                     require(paths.resolve("spec.feature").ok(), "feature files allowed");
                   }});

  tests.push_back({"path_checks_filename", [] {
                     Fixture fx;
                     auto paths = fx.validator();
                     require_threat(paths.resolve("docs/CON.md"), "reserved_filename");
                     require_threat(paths.resolve("docs/lpt1.txt"), "reserved_filename");
                     require_threat(paths.resolve("docs/a|b.md"), "invalid_filename");
                     require_threat(paths.resolve("docs/what?.md"), "invalid_filename");
                   }});

  tests.push_back({"path_checks_length", [] {
                     Fixture fx;
                     fx.config->security.max_path_length = 40;
                     auto paths = fx.validator();
                     require_threat(paths.resolve(std::string(50, 'a') + ".md"),
                                    "path_length_limit");
                     require(paths.resolve("short.md").ok(), "short path");
                   }});

  tests.push_back({"path_containment_property", [] {
                     Fixture fx;
                     auto paths = fx.validator();
                     const std::vector<std::string> candidates = {
                         "a.md",          "./a.md",          "docs//a.md",     "docs/./b/../c.md",
                         "/ws/../x.md",   "....//a.md",      "docs/.../a.md",  "%2fetc%2fx.md",
                         "~/a.md",        "/ws/./a.md",      "docs\\a.md",     "/",
                         "docs/../../a.md","a/b/c/d/e/f.md",  "..",             ".hidden.md",
                         "%00.md",        "docs/%2e/a.md",   "/wsx/a.md",      "v1..2.md"};
                     for (const auto &candidate : candidates) {
                       const auto result = paths.resolve(candidate);
                       if (!result.ok()) {
                         continue;
                       }
                       const auto &resolved = result.value();
                       require(resolved.rfind("/ws/", 0) == 0, "escaped root: " + resolved);
                       require(!contains_dot_dot_segment(resolved), "dot-dot kept: " + resolved);
                     }
                   }});

  tests.push_back({"path_option_root_overrides_config", [] {
                     Fixture fx;
                     auto paths = fx.validator();
                     const auto result =
                         paths.resolve("a.md", sec::PathOptions{.context_id = "req_9",
                                                                 .workspace_root = "/other/"});
                     require(result.ok() && result.value() == "/other/a.md", "per-call root");
                     require(fx.audit->events_for("req_9").size() == 1, "context id recorded");
                   }});

  tests.push_back({"path_derive_builds_siblings", [] {
                     Fixture fx;
                     auto paths = fx.validator();
                     const auto temp = paths.derive("/ws/docs/a.md", ".tmp.1.2");
                     require(temp.ok() && temp.value() == "/ws/docs/a.md.tmp.1.2", "temp sibling");
                     require(!paths.derive("/ws/docs/a.md", "/../../x").ok(),
                             "suffix with separators rejected");
                     require(!paths.derive("/etc/a.md", ".bak").ok(), "outside root rejected");
                     require(fx.audit->size() == 0, "derive records nothing");
                   }});

  tests.push_back({"path_derive_allows_suffix_past_length_limit", [] {
                     Fixture fx;
                     auto paths = fx.validator();
                     const std::string longest = "/ws/" + std::string(248, 'a') + ".md";
                     require(longest.size() == 255, "boundary length");
                     require(paths.resolve(longest).ok(), "exactly at the limit resolves");
                     require_threat(paths.resolve("/ws/" + std::string(249, 'a') + ".md"),
                                    "path_length_limit");
                     const auto temp = paths.derive(longest, ".tmp.1700000000000.1");
                     require(temp.ok() && temp.value() == longest + ".tmp.1700000000000.1",
                             "artifact of an accepted path is allowed");
                   }});
}
