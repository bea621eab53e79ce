#include "prdguard/security/secure_filename.hpp"

#include "prdguard/common/fs.hpp"
#include "prdguard/common/hash.hpp"

#include <cctype>

namespace prdguard::security {

namespace {

constexpr std::size_t kMaxStemChars = 100;

bool is_safe_char(const char ch) {
  return std::isalnum(static_cast<unsigned char>(ch)) != 0 || ch == '_' || ch == '.' ||
         ch == '-';
}

} // namespace

std::string generate_secure_filename(const std::string &input, const std::string &extension,
                                     const std::optional<std::uint64_t> timestamp_ms) {
  std::string clean;
  clean.reserve(input.size());
  for (const char ch : input) {
    const char mapped = is_safe_char(ch) ? ch : '_';
    if (mapped == '_' && !clean.empty() && clean.back() == '_') {
      continue;
    }
    clean.push_back(mapped);
  }

  const auto first = clean.find_first_not_of("._-");
  if (first == std::string::npos) {
    clean.clear();
  } else {
    const auto last = clean.find_last_not_of("._-");
    clean = clean.substr(first, last - first + 1);
  }
  if (clean.empty()) {
    clean = "file";
  }
  clean = clean.substr(0, kMaxStemChars);

  if (!extension.empty() && !common::ends_with(clean, extension)) {
    clean += extension;
  }

  const std::string stamp = "_" + std::to_string(timestamp_ms.value_or(common::now_millis()));
  const auto dot = clean.rfind('.');
  if (dot == std::string::npos) {
    return clean + stamp;
  }
  return clean.substr(0, dot) + stamp + clean.substr(dot);
}

std::string content_hash(const std::string &content) { return common::sha256_hex(content); }

bool verify_content_integrity(const std::string &content, const std::string &expected_hash) {
  return common::to_lower(expected_hash) == content_hash(content);
}

} // namespace prdguard::security
