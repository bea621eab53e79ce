#include "prdguard/common/hash.hpp"

#include <openssl/sha.h>

#include <iomanip>
#include <sstream>

namespace prdguard::common {

std::string sha256_hex(const std::string &bytes) {
  unsigned char digest[SHA256_DIGEST_LENGTH];
  SHA256(reinterpret_cast<const unsigned char *>(bytes.data()), bytes.size(), digest);

  std::ostringstream stream;
  stream << std::hex << std::setfill('0');
  for (const unsigned char c : digest) {
    stream << std::setw(2) << static_cast<int>(c);
  }
  return stream.str();
}

} // namespace prdguard::common
