#include "bench_common.hpp"

#include "prdguard/config/schema.hpp"
#include "prdguard/security/content_validator.hpp"
#include "prdguard/security/input_validator.hpp"
#include "prdguard/security/path_validator.hpp"
#include "prdguard/security/threat_scanner.hpp"

#include <memory>
#include <string>

namespace {

std::string sample_prd(std::size_t sections) {
  std::string out = "# Checkout Redesign\n\n";
  for (std::size_t i = 0; i < sections; ++i) {
    out += "## Requirement " + std::to_string(i) + "\n\n";
    out += "- Users can review the order summary before paying.\n";
    out += "- Latency for the pay button stays under 200 ms at p95.\n\n";
  }
  return out;
}

} // namespace

void run_validation_benchmark() {
  std::cout << "\n=== Validation Benchmarks ===\n";
  namespace sec = prdguard::security;

  auto config = std::make_shared<prdguard::config::Config>();
  config->security.workspace_root = "/ws";
  config->security.log_events = false;
  const auto catalog = sec::default_catalog();
  auto audit = std::make_shared<sec::AuditLog>(false);
  auto scanner = std::make_shared<sec::HeuristicThreatScanner>(catalog, false);
  auto input = std::make_shared<sec::InputValidator>(config, catalog, scanner, audit);
  sec::PathValidator paths(config, audit);
  sec::ContentValidator content(config, catalog, input, audit);

  prdguard::bench::run_bench("input_validate_short_field", 2000, [&] {
    (void)input->validate("Checkout redesign for returning customers", "title");
  });
  audit->clear();

  const std::string document = sample_prd(200);
  prdguard::bench::run_bench("input_validate_document_30k", 50, [&] {
    (void)input->validate(document, sec::InputOptions{.context = "body",
                                                       .mode = sec::SanitizeMode::Content});
  });
  audit->clear();

  prdguard::bench::run_bench("path_resolve", 5000, [&] {
    (void)paths.resolve("docs/prds/checkout-redesign.md");
  });
  audit->clear();

  prdguard::bench::run_bench("path_resolve_traversal", 5000, [&] {
    (void)paths.resolve("%2e%2e/%2e%2e/etc/passwd.md");
  });
  audit->clear();

  prdguard::bench::run_bench("content_validate_markdown", 50, [&] {
    (void)content.validate(document, "/ws/docs/checkout.md");
  });
  audit->clear();

  const std::string json = R"({"title":"Checkout","requirements":[)" +
                           std::string(R"({"id":1,"text":"Summary before paying"},)") +
                           R"({"id":2,"text":"Pay button p95 under 200 ms"}]})";
  prdguard::bench::run_bench("content_validate_json", 2000, [&] {
    (void)content.validate(json, "/ws/docs/checkout.json");
  });
  audit->clear();
}
