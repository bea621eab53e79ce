#pragma once

#include <cstdint>
#include <optional>
#include <string>

namespace prdguard::security {

/// Filesystem-safe name derived from free text: only [A-Za-z0-9_.-], no leading or
/// trailing separators, at most 100 characters before the extension, and a
/// `_<millis>` suffix ahead of the extension.
[[nodiscard]] std::string generate_secure_filename(const std::string &input,
                                                   const std::string &extension = "",
                                                   std::optional<std::uint64_t> timestamp_ms =
                                                       std::nullopt);

/// Hex SHA-256 of the content.
[[nodiscard]] std::string content_hash(const std::string &content);
[[nodiscard]] bool verify_content_integrity(const std::string &content,
                                            const std::string &expected_hash);

} // namespace prdguard::security
