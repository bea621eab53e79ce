#include "prdguard/security/threat_scanner.hpp"

#include "prdguard/common/json_util.hpp"

#include <cstdlib>

namespace prdguard::security {

namespace {

using Clock = std::chrono::steady_clock;

std::chrono::microseconds elapsed_since(const Clock::time_point start) {
  return std::chrono::duration_cast<std::chrono::microseconds>(Clock::now() - start);
}

} // namespace

HeuristicThreatScanner::HeuristicThreatScanner(std::shared_ptr<const PatternCatalog> catalog,
                                               const bool block_pii)
    : catalog_(std::move(catalog)), block_pii_(block_pii) {}

common::Result<ScanResult> HeuristicThreatScanner::scan(const std::string &text) {
  const auto start = Clock::now();
  const std::string normalized = normalize_homoglyphs(text);

  ScanResult result;
  const bool injection = first_match(catalog_->prompt_injection, normalized) != nullptr;
  const bool secret = first_match(catalog_->secrets, normalized) != nullptr;
  if (injection) {
    result.threats.emplace_back("prompt_injection");
  }
  if (secret) {
    result.threats.emplace_back("secret_exposure");
  }
  for (const auto &kind : all_matches(catalog_->pii, normalized)) {
    result.threats.push_back("pii:" + kind);
    result.pii_found = true;
  }

  result.safe = !injection && !secret && !(block_pii_ && result.pii_found);
  result.confidence = result.threats.empty() ? 0.95 : 0.9;
  result.detection_time = elapsed_since(start);
  return common::Result<ScanResult>::success(std::move(result));
}

HttpThreatScanner::HttpThreatScanner(std::shared_ptr<common::HttpClient> http,
                                     std::string endpoint, std::optional<std::string> api_key,
                                     const std::uint64_t timeout_ms)
    : http_(std::move(http)), endpoint_(std::move(endpoint)), api_key_(std::move(api_key)),
      timeout_ms_(timeout_ms) {}

common::Result<ScanResult> HttpThreatScanner::scan(const std::string &text) {
  const auto start = Clock::now();

  std::unordered_map<std::string, std::string> headers;
  if (api_key_.has_value() && !api_key_->empty()) {
    headers["Authorization"] = "Bearer " + *api_key_;
  }
  const std::string body = "{\"input\":\"" + common::json_escape(text) + "\"}";
  const auto response = http_->post_json(endpoint_, headers, body, timeout_ms_);

  if (response.timeout) {
    return common::Result<ScanResult>::failure("threat scan timed out");
  }
  if (response.network_error) {
    return common::Result<ScanResult>::failure("threat scan request failed: " +
                                               response.network_error_message);
  }
  if (response.status < 200 || response.status >= 300) {
    return common::Result<ScanResult>::failure("threat scan returned HTTP " +
                                               std::to_string(response.status));
  }
  if (const auto valid = common::json_validate(response.body); !valid.ok()) {
    return common::Result<ScanResult>::failure("threat scan response is not JSON: " +
                                               valid.error());
  }

  const auto safe = common::json_get_bool(response.body, "safe");
  if (!safe.has_value()) {
    return common::Result<ScanResult>::failure("threat scan response is missing 'safe'");
  }

  ScanResult result;
  result.safe = *safe;
  result.threats = common::json_get_string_array(response.body, "threats");
  const std::string confidence = common::json_get_number(response.body, "confidence");
  result.confidence = confidence.empty() ? 0.0 : std::strtod(confidence.c_str(), nullptr);
  result.pii_found = common::json_get_bool(response.body, "pii_found").value_or(false);
  result.detection_time = elapsed_since(start);
  return common::Result<ScanResult>::success(std::move(result));
}

std::unique_ptr<IThreatScanner> create_threat_scanner(const config::Config &config,
                                                      std::shared_ptr<const PatternCatalog> catalog,
                                                      std::shared_ptr<common::HttpClient> http) {
  const auto &scanner = config.scanner;
  if (scanner.backend == "none") {
    return nullptr;
  }
  if (scanner.backend == "http") {
    if (http == nullptr) {
      http = std::make_shared<common::CurlHttpClient>();
    }
    return std::make_unique<HttpThreatScanner>(std::move(http), scanner.endpoint, scanner.api_key,
                                               scanner.timeout_ms);
  }
  return std::make_unique<HeuristicThreatScanner>(std::move(catalog), scanner.block_pii);
}

} // namespace prdguard::security
