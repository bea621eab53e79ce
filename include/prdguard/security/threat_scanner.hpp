#pragma once

#include "prdguard/common/http.hpp"
#include "prdguard/common/result.hpp"
#include "prdguard/config/schema.hpp"
#include "prdguard/security/patterns.hpp"

#include <chrono>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace prdguard::security {

struct ScanResult {
  bool safe = true;
  std::vector<std::string> threats;
  double confidence = 1.0;
  std::chrono::microseconds detection_time{0};
  bool pii_found = false;
};

/// External threat-scan hook. A failure result or a thrown exception means the scan
/// could not decide; callers treat that as unsafe.
class IThreatScanner {
public:
  virtual ~IThreatScanner() = default;
  [[nodiscard]] virtual common::Result<ScanResult> scan(const std::string &text) = 0;
  [[nodiscard]] virtual std::string_view name() const = 0;
  /// Whether scanner.timeout_ms applies. Remote hooks are latency-bounded; local
  /// heuristics run to completion.
  [[nodiscard]] virtual bool latency_bounded() const { return true; }
};

/// Local scanner over the catalog's prompt-injection, secret and PII detectors.
class HeuristicThreatScanner final : public IThreatScanner {
public:
  HeuristicThreatScanner(std::shared_ptr<const PatternCatalog> catalog, bool block_pii);

  [[nodiscard]] common::Result<ScanResult> scan(const std::string &text) override;
  [[nodiscard]] std::string_view name() const override { return "heuristic"; }
  [[nodiscard]] bool latency_bounded() const override { return false; }

private:
  std::shared_ptr<const PatternCatalog> catalog_;
  bool block_pii_;
};

/// POSTs {"input": ...} and expects {"safe", "threats", "confidence", "pii_found"}.
class HttpThreatScanner final : public IThreatScanner {
public:
  HttpThreatScanner(std::shared_ptr<common::HttpClient> http, std::string endpoint,
                    std::optional<std::string> api_key, std::uint64_t timeout_ms);

  [[nodiscard]] common::Result<ScanResult> scan(const std::string &text) override;
  [[nodiscard]] std::string_view name() const override { return "http"; }

private:
  std::shared_ptr<common::HttpClient> http_;
  std::string endpoint_;
  std::optional<std::string> api_key_;
  std::uint64_t timeout_ms_;
};

/// nullptr for backend "none". A null `http` makes the http backend build a CurlHttpClient.
[[nodiscard]] std::unique_ptr<IThreatScanner>
create_threat_scanner(const config::Config &config, std::shared_ptr<const PatternCatalog> catalog,
                      std::shared_ptr<common::HttpClient> http = nullptr);

} // namespace prdguard::security
