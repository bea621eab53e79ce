#include "prdguard/security/severity.hpp"

#include "prdguard/common/fs.hpp"

namespace prdguard::security {

std::string to_string(const Severity severity) {
  switch (severity) {
  case Severity::Low:
    return "low";
  case Severity::Medium:
    return "medium";
  case Severity::High:
    return "high";
  case Severity::Critical:
    return "critical";
  }
  return "low";
}

common::Result<Severity> parse_severity(const std::string &value) {
  const std::string normalized = common::to_lower(common::trim(value));
  if (normalized == "low") {
    return common::Result<Severity>::success(Severity::Low);
  }
  if (normalized == "medium") {
    return common::Result<Severity>::success(Severity::Medium);
  }
  if (normalized == "high") {
    return common::Result<Severity>::success(Severity::High);
  }
  if (normalized == "critical") {
    return common::Result<Severity>::success(Severity::Critical);
  }
  return common::Result<Severity>::failure("Unknown severity: " + value);
}

} // namespace prdguard::security
