#pragma once

#include "prdguard/common/result.hpp"

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <string>

namespace prdguard::common {

[[nodiscard]] std::string trim(const std::string &input);
[[nodiscard]] bool starts_with(const std::string &value, const std::string &prefix);
[[nodiscard]] bool ends_with(const std::string &value, const std::string &suffix);
[[nodiscard]] std::string to_lower(std::string value);
[[nodiscard]] std::string to_upper(std::string value);
void replace_all(std::string &target, const std::string &from, const std::string &to);

/// Number of UTF-8 code points; invalid lead bytes count as one character each.
[[nodiscard]] std::size_t utf8_length(const std::string &value);
/// Cut to at most max_chars code points without splitting a multi-byte sequence.
[[nodiscard]] std::string truncate_utf8(const std::string &value, std::size_t max_chars);

[[nodiscard]] Result<std::filesystem::path> ensure_dir(const std::filesystem::path &path);
/// Expands a leading '~' from HOME and $VAR / ${VAR} references; unknown variables expand
/// to nothing.
[[nodiscard]] std::string expand_path(std::string value);
[[nodiscard]] bool is_subpath(const std::filesystem::path &candidate,
                             const std::filesystem::path &parent);

[[nodiscard]] std::string now_rfc3339();
[[nodiscard]] std::uint64_t now_millis();
/// RFC 3339 UTC timestamp with millisecond precision and ':' / '.' replaced by '-'.
[[nodiscard]] std::string filename_timestamp();

} // namespace prdguard::common
