#pragma once

#include "prdguard/storage/file_backend.hpp"

namespace prdguard::storage {

/// std::filesystem backend. rename() is a real rename(2), so promotion of a verified
/// temp file is atomic on one filesystem.
class LocalFileBackend final : public IFileBackend {
public:
  [[nodiscard]] common::Result<std::optional<std::string>> read(const std::string &path) override;
  [[nodiscard]] common::Status write(const std::string &path, const std::string &bytes) override;
  [[nodiscard]] common::Status remove(const std::string &path) override;
  [[nodiscard]] common::Status replace(const std::string &path, const std::string &old_text,
                                       const std::string &new_text, bool replace_all) override;

  [[nodiscard]] bool supports_rename() const override { return true; }
  [[nodiscard]] common::Status rename(const std::string &from, const std::string &to) override;

  [[nodiscard]] std::string_view name() const override { return "local"; }
};

} // namespace prdguard::storage
