#include "test_framework.hpp"

#include "prdguard/common/fs.hpp"
#include "prdguard/common/json_util.hpp"
#include "prdguard/security/secure_filename.hpp"
#include "prdguard/security/workspace_scanner.hpp"
#include "tests/helpers/test_helpers.hpp"

#include <algorithm>
#include <filesystem>

namespace {

using prdguard::security::ScanFinding;
using prdguard::security::ScanReport;

const ScanFinding *find_finding(const ScanReport &report, const std::string &file,
                                const std::string &category) {
  const auto it = std::find_if(report.findings.begin(), report.findings.end(),
                               [&](const ScanFinding &finding) {
                                 return finding.file == file && finding.category == category;
                               });
  return it == report.findings.end() ? nullptr : &*it;
}

bool mentions_file(const ScanReport &report, const std::string &file) {
  return std::any_of(report.findings.begin(), report.findings.end(),
                     [&](const ScanFinding &finding) { return finding.file == file; });
}

prdguard::security::WorkspaceScanOptions content_only() {
  prdguard::security::WorkspaceScanOptions options;
  options.check_permissions = false;
  return options;
}

} // namespace

void register_security_utils_tests(std::vector<prdguard::tests::TestCase> &tests) {
  using prdguard::tests::require;
  namespace sec = prdguard::security;
  namespace fs = std::filesystem;

  tests.push_back({"secure_filename_strips_unsafe_characters", [] {
                     require(sec::generate_secure_filename("My PRD: Q3/Launch!", ".md",
                                                           1700000000000ULL) ==
                                 "My_PRD_Q3_Launch_1700000000000.md",
                             "runs of unsafe characters collapse to one underscore");
                     require(sec::generate_secure_filename("../../etc/passwd", "", 5) ==
                                 "etc_passwd_5",
                             "leading dots and separators removed");
                     require(sec::generate_secure_filename("", ".json", 1) == "file_1.json",
                             "empty input falls back to file");
                     require(sec::generate_secure_filename("report.md", ".md", 2) ==
                                 "report_2.md",
                             "extension not doubled");
                   }});

  tests.push_back({"secure_filename_limits_stem_length", [] {
                     const auto name = sec::generate_secure_filename(std::string(300, 'a'), "", 7);
                     require(name == std::string(100, 'a') + "_7", name);
                     const auto fresh = sec::generate_secure_filename("draft", ".md");
                     require(fresh.rfind("draft_", 0) == 0 && prdguard::common::ends_with(fresh, ".md"),
                             "current time stamped by default");
                   }});

  tests.push_back({"content_hash_and_integrity", [] {
                     const auto hash = sec::content_hash("abc");
                     require(hash ==
                                 "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad",
                             "sha256 hex");
                     require(sec::verify_content_integrity("abc", hash), "matching content");
                     require(sec::verify_content_integrity("abc", prdguard::common::to_upper(hash)),
                             "hash comparison ignores case");
                     require(!sec::verify_content_integrity("abd", hash), "changed content");
                   }});

  tests.push_back({"workspace_scan_reports_findings", [] {
                     prdguard::testing::TempWorkspace workspace;
                     workspace.create_file("prd.md", "# Plan\nThe api_key lives in vault\n");
                     workspace.create_file("docs/notes.txt", "See ../shared\n");
                     workspace.create_file("run.sh", "echo hi\n");
                     workspace.create_file(".env", "x\n");
                     workspace.create_file(".ai-context", "context\n");
                     workspace.create_file("bell.md", "ring\x07\n");
                     workspace.create_file("blob.bin", std::string("ab\0cd", 5));
                     fs::create_symlink(workspace.path() / "prd.md", workspace.path() / "link.md");

                     const auto scanned = sec::scan_workspace(
                         workspace.path().string(), *sec::default_catalog(), content_only());
                     require(scanned.ok(), scanned.error());
                     const auto &report = scanned.value();

                     const auto *secret = find_finding(report, "prd.md", "secrets");
                     require(secret != nullptr && secret->line == 2, "secret keyword on line 2");
                     require(secret->risk == sec::Severity::Critical, "secrets are critical");
                     require(secret->sample == "The api_key lives in vault", secret->sample);

                     require(find_finding(report, "docs/notes.txt", "paths") != nullptr,
                             "relative path with separator");
                     require(find_finding(report, "run.sh", "suspicious_extension") != nullptr,
                             "shell script extension");
                     require(find_finding(report, ".env", "hidden_file") != nullptr, "dotfile");
                     require(!mentions_file(report, ".ai-context"), "allowed dotfile");
                     require(find_finding(report, "bell.md", "binary_content") != nullptr,
                             "control character in a line");
                     require(!mentions_file(report, "link.md"), "symlinks are not followed");
                     require(!mentions_file(report, "blob.bin"), "binary files skip line scan");

                     require(report.files_scanned == 6, "binary file and symlink not counted");
                     require(report.total_issues() == 5, "five findings");
                     require(report.overall_risk() == "CRITICAL", report.overall_risk());
                     require(report.security_posture() == "GOOD", report.security_posture());
                     require(report.summary().at("critical_issues") == "1", "summary counts");

                     const auto json = report.to_json();
                     require(prdguard::common::json_validate(json).ok(), "report is valid json");
                     require(json.find("\"risk\":\"CRITICAL\"") != std::string::npos,
                             "risk written upper-case");
                   }});

  tests.push_back({"workspace_scan_risk_levels", [] {
                     prdguard::testing::TempWorkspace clean;
                     clean.create_file("prd.md", "# Plan\n\nShip onboarding.\n");
                     const auto quiet = sec::scan_workspace(clean.path().string(),
                                                            *sec::default_catalog(), content_only());
                     require(quiet.ok(), quiet.error());
                     require(quiet.value().overall_risk() == "LOW", quiet.value().overall_risk());
                     require(quiet.value().security_posture() == "EXCELLENT", "no findings");

                     prdguard::testing::TempWorkspace scripts;
                     for (int i = 0; i < 6; ++i) {
                       scripts.create_file("step" + std::to_string(i) + ".sh", "echo\n");
                     }
                     const auto noisy = sec::scan_workspace(scripts.path().string(),
                                                            *sec::default_catalog(), content_only());
                     require(noisy.ok(), noisy.error());
                     require(noisy.value().overall_risk() == "HIGH", noisy.value().overall_risk());
                     require(noisy.value().security_posture() == "FAIR",
                             noisy.value().security_posture());
                   }});

  tests.push_back({"workspace_scan_long_lines", [] {
                     prdguard::testing::TempWorkspace workspace;
                     workspace.create_file("wide.md", "short\n" + std::string(20, 'w') + "\n");
                     auto options = content_only();
                     options.long_line_threshold = 10;
                     const auto scanned = sec::scan_workspace(workspace.path().string(),
                                                              *sec::default_catalog(), options);
                     require(scanned.ok(), scanned.error());
                     const auto *wide = find_finding(scanned.value(), "wide.md", "long_line");
                     require(wide != nullptr && wide->line == 2, "long line on line 2");
                   }});

  tests.push_back({"workspace_scan_permissions", [] {
                     prdguard::testing::TempWorkspace workspace;
                     workspace.create_file("open.md", "text\n");
                     workspace.create_file("tight.md", "text\n");
                     workspace.create_file("shared/readme.md", "text\n");
                     fs::permissions(workspace.path() / "open.md", fs::perms(0666));
                     fs::permissions(workspace.path() / "tight.md", fs::perms(0600));
                     fs::permissions(workspace.path() / "shared", fs::perms(0777));

                     const auto scanned =
                         sec::scan_workspace(workspace.path().string(), *sec::default_catalog());
                     require(scanned.ok(), scanned.error());
                     const auto &report = scanned.value();
                     const auto *open = find_finding(report, "open.md", "file_permissions");
                     require(open != nullptr && open->sample.find("666") != std::string::npos,
                             "world-writable file");
                     require(find_finding(report, "tight.md", "file_permissions") == nullptr,
                             "owner-only file is fine");
                     require(find_finding(report, "shared", "directory_permissions") != nullptr,
                             "world-writable directory");
                   }});

  tests.push_back({"workspace_scan_missing_root_fails", [] {
                     const auto scanned =
                         sec::scan_workspace("/nonexistent/prdguard-scan", *sec::default_catalog());
                     require(!scanned.ok(), "missing directory should fail");
                   }});
}
