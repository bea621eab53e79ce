#pragma once

#include "prdguard/common/result.hpp"

#include <map>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace prdguard::common {

/// Escape a string for embedding inside a JSON string literal.
[[nodiscard]] std::string json_escape(const std::string &value);

/// Extract a string field value from a JSON document.
[[nodiscard]] std::string json_get_string(const std::string &json, const std::string &field);

/// Extract a numeric field value (as string) from a JSON document.
[[nodiscard]] std::string json_get_number(const std::string &json, const std::string &field);

/// Extract a boolean field; nullopt when absent or not a literal true/false.
[[nodiscard]] std::optional<bool> json_get_bool(const std::string &json,
                                                const std::string &field);

/// Extract a string array from a JSON array string like ["a","b"].
[[nodiscard]] std::vector<std::string> json_get_string_array(const std::string &json,
                                                              const std::string &field);

/// Parse a flat JSON object into a key->value map (top-level only; nested values raw).
using JsonFlatMap = std::unordered_map<std::string, std::string>;
[[nodiscard]] JsonFlatMap json_parse_flat(const std::string &json);

/// Serialize string pairs as a flat JSON object with keys in sorted order.
[[nodiscard]] std::string json_object(const std::map<std::string, std::string> &fields);

/// Strict RFC 8259 syntax check of a complete document. The error names the byte offset.
[[nodiscard]] Status json_validate(const std::string &text);

} // namespace prdguard::common
