#pragma once

#include <string>

namespace prdguard::common {

/// Lower-case hex SHA-256 digest of the given bytes.
[[nodiscard]] std::string sha256_hex(const std::string &bytes);

} // namespace prdguard::common
