#include "prdguard/security/path_validator.hpp"

#include "prdguard/common/fs.hpp"
#include "prdguard/config/config.hpp"
#include "prdguard/security/input_validator.hpp"

#include <algorithm>
#include <array>
#include <filesystem>
#include <string_view>

namespace prdguard::security {

namespace {

constexpr int kDecodePasses = 3;
constexpr std::size_t kSampleChars = 64;

const std::array<std::string_view, 22> kReservedNames = {
    "CON",  "PRN",  "AUX",  "NUL",  "COM1", "COM2", "COM3", "COM4", "COM5", "COM6", "COM7",
    "COM8", "COM9", "LPT1", "LPT2", "LPT3", "LPT4", "LPT5", "LPT6", "LPT7", "LPT8", "LPT9"};

int hex_value(const char ch) {
  if (ch >= '0' && ch <= '9') {
    return ch - '0';
  }
  if (ch >= 'a' && ch <= 'f') {
    return ch - 'a' + 10;
  }
  if (ch >= 'A' && ch <= 'F') {
    return ch - 'A' + 10;
  }
  return -1;
}

std::string url_decode(const std::string &value) {
  std::string out;
  out.reserve(value.size());
  for (std::size_t i = 0; i < value.size(); ++i) {
    if (value[i] == '%' && i + 2 < value.size()) {
      const int hi = hex_value(value[i + 1]);
      const int lo = hex_value(value[i + 2]);
      if (hi >= 0 && lo >= 0) {
        out.push_back(static_cast<char>(hi * 16 + lo));
        i += 2;
        continue;
      }
    }
    out.push_back(value[i]);
  }
  return out;
}

void normalize_separators(std::string &value) { std::replace(value.begin(), value.end(), '\\', '/'); }

bool has_invalid_filename_char(const std::string &name) {
  return std::any_of(name.begin(), name.end(), [](const char ch) {
    const auto c = static_cast<unsigned char>(ch);
    return c < 0x20U || ch == '<' || ch == '>' || ch == ':' || ch == '"' || ch == '|' ||
           ch == '?' || ch == '*';
  });
}

bool is_reserved_name(const std::string &name) {
  const std::string stem = common::to_upper(name.substr(0, name.find('.')));
  return std::find(kReservedNames.begin(), kReservedNames.end(), stem) != kReservedNames.end();
}

std::string strip_trailing_separator(std::string value) {
  while (value.size() > 1 && value.back() == '/') {
    value.pop_back();
  }
  return value;
}

} // namespace

PathValidator::PathValidator(std::shared_ptr<const config::Config> config,
                             std::shared_ptr<AuditLog> audit)
    : config_(std::move(config)), audit_(std::move(audit)) {}

common::Status PathValidator::check_resolved(const std::string &resolved,
                                             const std::string &root,
                                             const bool enforce_length) const {
  const std::filesystem::path path(resolved);
  if (!common::is_subpath(path, std::filesystem::path(root)) ||
      strip_trailing_separator(resolved) == root) {
    return common::Status::error("Path resolves outside the workspace", "directory_escape");
  }
  if (enforce_length && resolved.size() > config_->security.max_path_length) {
    return common::Status::error("Path exceeds the maximum allowed length", "path_length_limit");
  }

  const std::string filename = path.filename().string();
  if (filename.empty() || filename == "." || has_invalid_filename_char(filename)) {
    return common::Status::error("Path has an invalid filename", "invalid_filename");
  }
  if (is_reserved_name(filename)) {
    return common::Status::error("Path uses a reserved device name", "reserved_filename");
  }
  return common::Status::success();
}

common::SecurityResult<std::string> PathValidator::check(const std::string &candidate,
                                                         const std::string &root) const {
  using PathResult = common::SecurityResult<std::string>;

  if (common::trim(candidate).empty()) {
    return PathResult::failure("Path is empty", "empty_path");
  }

  std::string decoded = candidate;
  normalize_separators(decoded);
  for (int pass = 0; pass < kDecodePasses; ++pass) {
    std::string next = url_decode(decoded);
    normalize_separators(next);
    if (next == decoded) {
      break;
    }
    decoded = std::move(next);
  }

  // Any ".." is hostile, even one that would normalize back inside the workspace.
  if (decoded.find("..") != std::string::npos || decoded.find('\0') != std::string::npos) {
    return PathResult::failure("Path traversal is not allowed", "path_traversal");
  }
  if (common::trim(decoded).empty()) {
    return PathResult::failure("Path is empty", "empty_path");
  }

  std::filesystem::path joined(decoded);
  if (joined.is_relative()) {
    joined = std::filesystem::path(root) / joined;
  }
  const std::string resolved = joined.lexically_normal().string();

  if (const auto status = check_resolved(resolved, root); !status.ok()) {
    return PathResult::failure(status.error(), status.threat());
  }

  const std::string extension = common::to_lower(std::filesystem::path(resolved).extension().string());
  const auto &allowed = config_->security.allowed_file_extensions;
  const bool permitted =
      !extension.empty() && std::any_of(allowed.begin(), allowed.end(), [&](const std::string &ext) {
        return common::to_lower(ext) == extension;
      });
  if (!permitted) {
    return PathResult::failure("File type is not allowed", "invalid_extension");
  }

  return PathResult::success(resolved);
}

common::SecurityResult<std::string> PathValidator::resolve(const std::string &candidate,
                                                           const PathOptions &options) {
  const std::string root =
      options.workspace_root.has_value()
          ? config::normalize_workspace_root(*options.workspace_root)
          : config_->security.workspace_root;
  auto result = check(candidate, root);

  std::map<std::string, std::string> details;
  details["candidate"] =
      InputValidator::sanitize(common::truncate_utf8(candidate, kSampleChars));
  if (result.ok()) {
    details["resolved"] = result.value();
    audit_->emit(event_type::kPathValidated, Severity::Low, std::move(details),
                 options.context_id);
  } else {
    details["threat"] = result.threat();
    audit_->emit(event_type::kPathRejected,
                 severity_for(event_type::kPathRejected, result.threat()), std::move(details),
                 options.context_id);
  }
  return result;
}

common::SecurityResult<std::string> PathValidator::resolve(const std::string &candidate,
                                                           const std::string &workspace_root) {
  return resolve(candidate, PathOptions{.workspace_root = workspace_root});
}

common::SecurityResult<std::string> PathValidator::derive(const std::string &validated,
                                                          const std::string &suffix) const {
  using PathResult = common::SecurityResult<std::string>;
  if (suffix.find('/') != std::string::npos || suffix.find('\\') != std::string::npos ||
      suffix.find("..") != std::string::npos) {
    return PathResult::failure("Derived path suffix is not a plain name", "invalid_filename");
  }
  const std::string resolved = std::filesystem::path(validated + suffix).lexically_normal().string();
  // The length limit applies to caller paths; the fixed suffix of an artifact is ours.
  if (const auto status = check_resolved(resolved, config_->security.workspace_root, false);
      !status.ok()) {
    return PathResult::failure(status.error(), status.threat());
  }
  return PathResult::success(resolved);
}

} // namespace prdguard::security
