#pragma once

#include <functional>
#include <stdexcept>
#include <string>
#include <vector>

namespace prdguard::tests {

struct TestCase {
  std::string name;
  std::function<void()> fn;
};

inline void require(bool condition, const std::string &message) {
  if (!condition) {
    throw std::runtime_error(message);
  }
}

/// Requires a failed result tagged with the given threat; the message names what came back.
template <typename R> void require_threat(const R &result, const std::string &threat) {
  if (result.ok()) {
    throw std::runtime_error("expected " + threat + ", got success");
  }
  if (result.threat() != threat) {
    throw std::runtime_error("expected " + threat + ", got " + result.threat() + " (" +
                             result.error() + ")");
  }
}

} // namespace prdguard::tests
