#pragma once

#include "prdguard/common/result.hpp"

#include <cstdint>
#include <string>
#include <unordered_map>
#include <vector>

namespace prdguard::common {

/// Flat view of a TOML subset: tables and dotted keys become "section.key" entries and
/// the raw right-hand side is kept until a typed getter decodes it.
struct TomlDocument {
  std::unordered_map<std::string, std::string> values;

  [[nodiscard]] bool has(const std::string &key) const;
  [[nodiscard]] std::string get_string(const std::string &key,
                                       const std::string &fallback = "") const;
  [[nodiscard]] bool get_bool(const std::string &key, bool fallback) const;
  [[nodiscard]] int get_int(const std::string &key, int fallback) const;
  [[nodiscard]] std::uint64_t get_u64(const std::string &key, std::uint64_t fallback) const;
  [[nodiscard]] std::vector<std::string>
  get_string_array(const std::string &key, const std::vector<std::string> &fallback = {}) const;

  /// Distinct names directly below prefix, e.g. "dangerous" -> {"eval", "traversal"} for
  /// keys "dangerous.eval.pattern" and "dangerous.traversal.pattern". Sorted.
  [[nodiscard]] std::vector<std::string> child_names(const std::string &prefix) const;
};

[[nodiscard]] Result<TomlDocument> parse_toml(const std::string &content);
[[nodiscard]] Result<TomlDocument> load_toml_file(const std::string &path);

} // namespace prdguard::common
