#include "prdguard/common/toml.hpp"

#include "prdguard/common/fs.hpp"

#include <charconv>
#include <fstream>
#include <set>
#include <sstream>

namespace prdguard::common {

namespace {

// Tracks basic ("...") and literal ('...') strings so '#', ',' and '=' inside them
// are left alone.
struct QuoteState {
  char open = '\0';

  bool step(const std::string &text, const std::size_t i) {
    const char ch = text[i];
    if (open == '\0') {
      if (ch == '"' || ch == '\'') {
        open = ch;
      }
      return open != '\0';
    }
    if (ch == open && (open == '\'' || !escaped(text, i))) {
      open = '\0';
      return true;
    }
    return true;
  }

  static bool escaped(const std::string &text, std::size_t i) {
    std::size_t backslashes = 0;
    while (i > 0 && text[i - 1] == '\\') {
      ++backslashes;
      --i;
    }
    return (backslashes % 2U) == 1U;
  }
};

std::string strip_comment(const std::string &line) {
  QuoteState quotes;
  for (std::size_t i = 0; i < line.size(); ++i) {
    const bool quoted = quotes.step(line, i);
    if (!quoted && line[i] == '#') {
      return line.substr(0, i);
    }
  }
  return line;
}

std::size_t find_unquoted(const std::string &line, const char target) {
  QuoteState quotes;
  for (std::size_t i = 0; i < line.size(); ++i) {
    const bool quoted = quotes.step(line, i);
    if (!quoted && line[i] == target) {
      return i;
    }
  }
  return std::string::npos;
}

std::vector<std::string> split_array_elements(const std::string &array_value) {
  std::vector<std::string> result;
  QuoteState quotes;
  std::size_t start = 0;

  for (std::size_t i = 0; i < array_value.size(); ++i) {
    const bool quoted = quotes.step(array_value, i);
    if (!quoted && array_value[i] == ',') {
      result.push_back(trim(array_value.substr(start, i - start)));
      start = i + 1;
    }
  }

  const std::string tail = trim(array_value.substr(start));
  if (!tail.empty()) {
    result.push_back(tail);
  }
  return result;
}

std::string decode_basic(const std::string &body) {
  std::string out;
  out.reserve(body.size());
  for (std::size_t i = 0; i < body.size(); ++i) {
    if (body[i] != '\\' || i + 1 >= body.size()) {
      out.push_back(body[i]);
      continue;
    }
    const char esc = body[++i];
    switch (esc) {
    case 'n':
      out.push_back('\n');
      break;
    case 't':
      out.push_back('\t');
      break;
    case 'r':
      out.push_back('\r');
      break;
    case '"':
    case '\\':
      out.push_back(esc);
      break;
    default:
      // Unknown escapes are kept verbatim; regex sources rely on this.
      out.push_back('\\');
      out.push_back(esc);
      break;
    }
  }
  return out;
}

std::string unquote(std::string value) {
  value = trim(value);
  if (value.size() >= 2 && value.front() == '\'' && value.back() == '\'') {
    return value.substr(1, value.size() - 2);
  }
  if (value.size() >= 2 && value.front() == '"' && value.back() == '"') {
    return decode_basic(value.substr(1, value.size() - 2));
  }
  return value;
}

template <typename T> T parse_number(const std::string &raw, const T fallback) {
  const std::string normalized = trim(raw);
  T parsed{};
  const auto *first = normalized.data();
  const auto *last = first + normalized.size();
  auto [ptr, ec] = std::from_chars(first, last, parsed);
  if (ec != std::errc() || ptr != last) {
    return fallback;
  }
  return parsed;
}

} // namespace

bool TomlDocument::has(const std::string &key) const { return values.contains(key); }

std::string TomlDocument::get_string(const std::string &key, const std::string &fallback) const {
  const auto it = values.find(key);
  if (it == values.end()) {
    return fallback;
  }
  return unquote(it->second);
}

bool TomlDocument::get_bool(const std::string &key, bool fallback) const {
  const auto it = values.find(key);
  if (it == values.end()) {
    return fallback;
  }
  const std::string normalized = to_lower(trim(it->second));
  if (normalized == "true") {
    return true;
  }
  if (normalized == "false") {
    return false;
  }
  return fallback;
}

int TomlDocument::get_int(const std::string &key, int fallback) const {
  const auto it = values.find(key);
  return it == values.end() ? fallback : parse_number<int>(it->second, fallback);
}

std::uint64_t TomlDocument::get_u64(const std::string &key, std::uint64_t fallback) const {
  const auto it = values.find(key);
  return it == values.end() ? fallback : parse_number<std::uint64_t>(it->second, fallback);
}

std::vector<std::string>
TomlDocument::get_string_array(const std::string &key,
                               const std::vector<std::string> &fallback) const {
  const auto it = values.find(key);
  if (it == values.end()) {
    return fallback;
  }

  const std::string raw = trim(it->second);
  if (raw.size() < 2 || raw.front() != '[' || raw.back() != ']') {
    return fallback;
  }

  std::vector<std::string> values_out;
  for (const auto &element : split_array_elements(raw.substr(1, raw.size() - 2))) {
    if (!element.empty()) {
      values_out.push_back(unquote(element));
    }
  }
  return values_out;
}

std::vector<std::string> TomlDocument::child_names(const std::string &prefix) const {
  const std::string head = prefix + ".";
  std::set<std::string> names;
  for (const auto &[key, _] : values) {
    if (!starts_with(key, head)) {
      continue;
    }
    const std::string rest = key.substr(head.size());
    const auto dot = rest.find('.');
    names.insert(dot == std::string::npos ? rest : rest.substr(0, dot));
  }
  return {names.begin(), names.end()};
}

Result<TomlDocument> parse_toml(const std::string &content) {
  TomlDocument document;
  std::istringstream stream(content);
  std::string line;
  std::string current_section;
  std::size_t line_number = 0;

  while (std::getline(stream, line)) {
    ++line_number;
    const std::string clean_line = trim(strip_comment(line));
    if (clean_line.empty()) {
      continue;
    }

    if (clean_line.front() == '[' && clean_line.back() == ']') {
      current_section = trim(clean_line.substr(1, clean_line.size() - 2));
      if (current_section.empty()) {
        return Result<TomlDocument>::failure("Invalid empty section at line " +
                                             std::to_string(line_number));
      }
      continue;
    }

    const std::size_t equals_index = find_unquoted(clean_line, '=');
    if (equals_index == std::string::npos) {
      return Result<TomlDocument>::failure("Invalid key/value at line " +
                                           std::to_string(line_number));
    }

    const std::string key = unquote(clean_line.substr(0, equals_index));
    const std::string value = trim(clean_line.substr(equals_index + 1));
    if (key.empty()) {
      return Result<TomlDocument>::failure("Missing key at line " +
                                           std::to_string(line_number));
    }
    if (value.empty()) {
      return Result<TomlDocument>::failure("Missing value at line " +
                                           std::to_string(line_number));
    }

    const std::string full_key = current_section.empty() ? key : current_section + "." + key;
    document.values[full_key] = value;
  }

  return Result<TomlDocument>::success(std::move(document));
}

Result<TomlDocument> load_toml_file(const std::string &path) {
  std::ifstream file(path, std::ios::binary);
  if (!file) {
    return Result<TomlDocument>::failure("Failed to open " + path);
  }
  std::stringstream buffer;
  buffer << file.rdbuf();
  auto parsed = parse_toml(buffer.str());
  if (!parsed.ok()) {
    return Result<TomlDocument>::failure(path + ": " + parsed.error());
  }
  return parsed;
}

} // namespace prdguard::common
