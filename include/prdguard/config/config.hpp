#pragma once

#include "prdguard/common/result.hpp"
#include "prdguard/config/schema.hpp"

#include <filesystem>
#include <string>
#include <vector>

namespace prdguard::config {

[[nodiscard]] std::string to_string(SecurityLevel level);
[[nodiscard]] common::Result<SecurityLevel> parse_security_level(const std::string &value);

/// Absolute, lexically normal form of a workspace root; relative input resolves against
/// the current directory.
[[nodiscard]] std::string normalize_workspace_root(const std::string &root);

/// Parse TOML text into a Config. Keys that are absent keep their defaults.
[[nodiscard]] common::Result<Config> parse_config(const std::string &content);

/// Load from a TOML file. A missing file yields defaults. Environment overrides are
/// applied last and the workspace root is normalized.
[[nodiscard]] common::Result<Config> load_config(const std::filesystem::path &path);

void apply_env_overrides(Config &config);

/// Hard errors fail; risky but legal settings come back as warnings.
[[nodiscard]] common::Result<std::vector<std::string>> validate_config(const Config &config);

} // namespace prdguard::config
