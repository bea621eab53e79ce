#include "prdguard/storage/local_file_backend.hpp"

#include "prdguard/common/fs.hpp"

#include <atomic>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <sstream>

namespace prdguard::storage {

namespace {

std::atomic<std::uint64_t> edit_counter{0};

std::size_t count_occurrences(const std::string &haystack, const std::string &needle) {
  std::size_t count = 0;
  std::size_t pos = 0;
  while ((pos = haystack.find(needle, pos)) != std::string::npos) {
    ++count;
    pos += needle.size();
  }
  return count;
}

} // namespace

common::Result<std::optional<std::string>> LocalFileBackend::read(const std::string &path) {
  using ReadResult = common::Result<std::optional<std::string>>;
  std::error_code ec;
  const auto status = std::filesystem::status(path, ec);
  if (ec || !std::filesystem::exists(status)) {
    return ReadResult::success(std::nullopt);
  }
  if (std::filesystem::is_directory(status)) {
    return ReadResult::failure("Path is a directory: " + path);
  }

  std::ifstream in(path, std::ios::binary);
  if (!in) {
    return ReadResult::failure("Failed to open file: " + path);
  }
  std::ostringstream buffer;
  buffer << in.rdbuf();
  if (in.bad()) {
    return ReadResult::failure("Failed to read file: " + path);
  }
  return ReadResult::success(buffer.str());
}

common::Status LocalFileBackend::write(const std::string &path, const std::string &bytes) {
  std::error_code ec;
  const std::filesystem::path target(path);
  if (target.has_parent_path()) {
    std::filesystem::create_directories(target.parent_path(), ec);
    if (ec) {
      return common::Status::error("Failed to create parent directory: " + ec.message());
    }
  }

  std::ofstream out(target, std::ios::binary | std::ios::trunc);
  if (!out) {
    return common::Status::error("Failed to open file for writing: " + path);
  }
  out.write(bytes.data(), static_cast<std::streamsize>(bytes.size()));
  out.close();
  if (!out) {
    return common::Status::error("Failed to write file: " + path);
  }
  return common::Status::success();
}

common::Status LocalFileBackend::remove(const std::string &path) {
  std::error_code ec;
  std::filesystem::remove(path, ec);
  if (ec) {
    return common::Status::error("Failed to remove " + path + ": " + ec.message());
  }
  return common::Status::success();
}

common::Status LocalFileBackend::replace(const std::string &path, const std::string &old_text,
                                         const std::string &new_text, const bool replace_all) {
  auto current = read(path);
  if (!current.ok()) {
    return common::Status::error(current.error());
  }
  if (!current.value().has_value()) {
    return common::Status::error("File not found: " + path);
  }
  if (old_text.empty()) {
    return common::Status::error("old_string must not be empty");
  }

  std::string content = std::move(*current.value());
  const std::size_t occurrences = count_occurrences(content, old_text);
  if (occurrences == 0) {
    return common::Status::error("old_string not found");
  }
  if (occurrences > 1 && !replace_all) {
    return common::Status::error("old_string is not unique");
  }

  std::size_t pos = 0;
  while ((pos = content.find(old_text, pos)) != std::string::npos) {
    content.replace(pos, old_text.size(), new_text);
    pos += new_text.size();
    if (!replace_all) {
      break;
    }
  }

  const std::string temp_path = path + ".edit." + std::to_string(common::now_millis()) + "." +
                                std::to_string(++edit_counter);
  if (auto status = write(temp_path, content); !status.ok()) {
    (void)remove(temp_path);
    return status;
  }
  if (auto status = rename(temp_path, path); !status.ok()) {
    (void)remove(temp_path);
    return status;
  }
  return common::Status::success();
}

common::Status LocalFileBackend::rename(const std::string &from, const std::string &to) {
  std::error_code ec;
  std::filesystem::rename(from, to, ec);
  if (ec) {
    return common::Status::error("Failed to rename " + from + ": " + ec.message());
  }
  return common::Status::success();
}

} // namespace prdguard::storage
