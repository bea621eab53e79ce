#pragma once

#include "prdguard/common/result.hpp"

#include <optional>
#include <string>
#include <string_view>

namespace prdguard::storage {

/// Host file primitives. Workspace-unaware: every path handed in has already been
/// resolved by the security layer. Ordinary I/O failures come back as errors; anything
/// thrown is treated as a host fault by callers.
class IFileBackend {
public:
  virtual ~IFileBackend() = default;

  /// nullopt when the file does not exist.
  [[nodiscard]] virtual common::Result<std::optional<std::string>> read(const std::string &path) = 0;
  [[nodiscard]] virtual common::Status write(const std::string &path,
                                             const std::string &bytes) = 0;
  /// Removing a missing file succeeds.
  [[nodiscard]] virtual common::Status remove(const std::string &path) = 0;
  [[nodiscard]] virtual common::Status replace(const std::string &path,
                                               const std::string &old_text,
                                               const std::string &new_text, bool replace_all) = 0;

  [[nodiscard]] virtual bool supports_rename() const { return false; }
  [[nodiscard]] virtual common::Status rename(const std::string &from, const std::string &to) {
    (void)from;
    (void)to;
    return common::Status::error("rename is not supported by this backend");
  }

  [[nodiscard]] virtual std::string_view name() const = 0;
};

} // namespace prdguard::storage
