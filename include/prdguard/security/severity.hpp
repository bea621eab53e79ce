#pragma once

#include "prdguard/common/result.hpp"

#include <string>

namespace prdguard::security {

enum class Severity { Low, Medium, High, Critical };

[[nodiscard]] std::string to_string(Severity severity);
[[nodiscard]] common::Result<Severity> parse_severity(const std::string &value);

} // namespace prdguard::security
