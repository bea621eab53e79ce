#include "prdguard/config/config.hpp"

#include "prdguard/common/fs.hpp"
#include "prdguard/common/toml.hpp"

#include <cstdlib>
#include <fstream>
#include <sstream>

namespace prdguard::config {

namespace {

std::string expand_config_value(const std::string &value) {
  if (value.find('$') == std::string::npos && value.find('~') == std::string::npos) {
    return value;
  }
  return common::expand_path(value);
}

const char *env_value(const char *name) {
  const char *value = std::getenv(name);
  if (value == nullptr || *value == '\0') {
    return nullptr;
  }
  return value;
}

bool backend_is_known(const std::string &backend) {
  return backend == "heuristic" || backend == "http" || backend == "none";
}

} // namespace

std::string to_string(const SecurityLevel level) {
  switch (level) {
  case SecurityLevel::Strict:
    return "strict";
  case SecurityLevel::Balanced:
    return "balanced";
  case SecurityLevel::Permissive:
    return "permissive";
  }
  return "strict";
}

common::Result<SecurityLevel> parse_security_level(const std::string &value) {
  const std::string normalized = common::to_lower(common::trim(value));
  if (normalized == "strict") {
    return common::Result<SecurityLevel>::success(SecurityLevel::Strict);
  }
  if (normalized == "balanced") {
    return common::Result<SecurityLevel>::success(SecurityLevel::Balanced);
  }
  if (normalized == "permissive") {
    return common::Result<SecurityLevel>::success(SecurityLevel::Permissive);
  }
  return common::Result<SecurityLevel>::failure("Invalid security.level: " + value);
}

std::string normalize_workspace_root(const std::string &root) {
  std::filesystem::path path = root.empty() ? std::filesystem::path(".") : std::filesystem::path(root);
  if (path.is_relative()) {
    std::error_code ec;
    const auto cwd = std::filesystem::current_path(ec);
    if (!ec) {
      path = cwd / path;
    }
  }
  std::string normalized = path.lexically_normal().string();
  while (normalized.size() > 1 && normalized.back() == '/') {
    normalized.pop_back();
  }
  return normalized;
}

common::Result<Config> parse_config(const std::string &content) {
  const auto parsed = common::parse_toml(content);
  if (!parsed.ok()) {
    return common::Result<Config>::failure(parsed.error());
  }
  const auto &doc = parsed.value();

  Config config;
  auto &security = config.security;
  if (doc.has("security.level")) {
    auto level = parse_security_level(doc.get_string("security.level"));
    if (!level.ok()) {
      return common::Result<Config>::failure(level.error());
    }
    security.level = level.value();
  }
  security.max_input_size = static_cast<std::size_t>(
      doc.get_u64("security.max_input_size", security.max_input_size));
  security.max_file_size = doc.get_u64("security.max_file_size", security.max_file_size);
  security.allowed_file_extensions =
      doc.get_string_array("security.allowed_file_extensions", security.allowed_file_extensions);
  if (doc.has("security.workspace_root")) {
    security.workspace_root = expand_config_value(doc.get_string("security.workspace_root"));
  }
  security.enable_threat_scan =
      doc.get_bool("security.enable_threat_scan", security.enable_threat_scan);
  security.log_events = doc.get_bool("security.log_events", security.log_events);
  security.max_path_length = static_cast<std::size_t>(
      doc.get_u64("security.max_path_length", security.max_path_length));

  auto &scanner = config.scanner;
  scanner.backend = common::to_lower(doc.get_string("scanner.backend", scanner.backend));
  scanner.endpoint = expand_config_value(doc.get_string("scanner.endpoint", scanner.endpoint));
  if (doc.has("scanner.api_key")) {
    scanner.api_key = expand_config_value(doc.get_string("scanner.api_key"));
  }
  scanner.timeout_ms = doc.get_u64("scanner.timeout_ms", scanner.timeout_ms);
  scanner.block_pii = doc.get_bool("scanner.block_pii", scanner.block_pii);

  config.audit.sqlite_path =
      expand_config_value(doc.get_string("audit.sqlite_path", config.audit.sqlite_path));
  config.audit.performance_window = static_cast<std::size_t>(
      doc.get_u64("audit.performance_window", config.audit.performance_window));

  config.files.atomic_writes = doc.get_bool("files.atomic_writes", config.files.atomic_writes);
  config.files.verify_integrity =
      doc.get_bool("files.verify_integrity", config.files.verify_integrity);

  config.patterns.catalog_path =
      expand_config_value(doc.get_string("patterns.catalog_path", config.patterns.catalog_path));

  config.observability.backend =
      doc.get_string("observability.backend", config.observability.backend);

  return common::Result<Config>::success(std::move(config));
}

void apply_env_overrides(Config &config) {
  if (const char *root = env_value("PRDGUARD_WORKSPACE_ROOT"); root != nullptr) {
    config.security.workspace_root = root;
  }
  if (const char *level = env_value("PRDGUARD_SECURITY_LEVEL"); level != nullptr) {
    // An unparseable level keeps the configured one.
    if (auto parsed = parse_security_level(level); parsed.ok()) {
      config.security.level = parsed.value();
    }
  }
  if (const char *endpoint = env_value("PRDGUARD_SCANNER_ENDPOINT"); endpoint != nullptr) {
    config.scanner.endpoint = endpoint;
  }
  if (const char *api_key = env_value("PRDGUARD_SCANNER_API_KEY"); api_key != nullptr) {
    config.scanner.api_key = std::string(api_key);
  }
}

common::Result<Config> load_config(const std::filesystem::path &path) {
  Config config;

  std::error_code ec;
  if (std::filesystem::exists(path, ec)) {
    std::ifstream file(path);
    if (!file) {
      return common::Result<Config>::failure("Unable to open config file: " + path.string());
    }
    std::stringstream buffer;
    buffer << file.rdbuf();
    auto parsed = parse_config(buffer.str());
    if (!parsed.ok()) {
      return common::Result<Config>::failure(path.string() + ": " + parsed.error());
    }
    config = std::move(parsed.value());
  }

  apply_env_overrides(config);
  config.security.workspace_root = normalize_workspace_root(config.security.workspace_root);
  return common::Result<Config>::success(std::move(config));
}

common::Result<std::vector<std::string>> validate_config(const Config &config) {
  using Warnings = common::Result<std::vector<std::string>>;
  std::vector<std::string> warnings;
  const auto &security = config.security;

  if (security.workspace_root.empty() ||
      std::filesystem::path(security.workspace_root).is_relative()) {
    return Warnings::failure("security.workspace_root must be an absolute path");
  }
  if (security.max_input_size == 0) {
    return Warnings::failure("security.max_input_size must be greater than zero");
  }
  if (security.max_file_size == 0) {
    return Warnings::failure("security.max_file_size must be greater than zero");
  }
  if (security.max_path_length == 0) {
    return Warnings::failure("security.max_path_length must be greater than zero");
  }
  if (security.allowed_file_extensions.empty()) {
    return Warnings::failure("security.allowed_file_extensions must not be empty");
  }
  for (const auto &ext : security.allowed_file_extensions) {
    if (ext.size() < 2 || ext.front() != '.' || ext.find('/') != std::string::npos) {
      return Warnings::failure("Invalid file extension: " + ext);
    }
  }

  if (!backend_is_known(config.scanner.backend)) {
    return Warnings::failure("Invalid scanner.backend: " + config.scanner.backend);
  }
  if (config.scanner.backend == "http" && common::trim(config.scanner.endpoint).empty()) {
    return Warnings::failure("scanner.endpoint is required for the http backend");
  }
  if (config.scanner.timeout_ms == 0) {
    return Warnings::failure("scanner.timeout_ms must be greater than zero");
  }
  if (config.audit.performance_window == 0) {
    return Warnings::failure("audit.performance_window must be greater than zero");
  }

  if (security.level == SecurityLevel::Permissive) {
    warnings.push_back("security.level=permissive lets suspicious patterns through");
  }
  if (security.enable_threat_scan && config.scanner.backend == "none") {
    warnings.push_back("security.enable_threat_scan is set but scanner.backend is none");
  }
  if (!config.files.atomic_writes) {
    warnings.push_back("files.atomic_writes=false writes targets in place");
  }
  if (!config.files.verify_integrity) {
    warnings.push_back("files.verify_integrity=false skips post-write hash checks");
  }
  if (!security.log_events) {
    warnings.push_back("security.log_events=false keeps audit events out of the log");
  }

  return Warnings::success(std::move(warnings));
}

} // namespace prdguard::config
