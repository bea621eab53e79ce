#include "prdguard/observability/factory.hpp"

#include "prdguard/common/fs.hpp"
#include "prdguard/observability/log_observer.hpp"
#include "prdguard/observability/multi_observer.hpp"
#include "prdguard/observability/noop_observer.hpp"

#include <iostream>
#include <sstream>
#include <vector>

namespace prdguard::observability {

namespace {

std::unique_ptr<IObserver> build_one(const std::string &name) {
  if (name == "log") {
    return std::make_unique<LogObserver>();
  }
  if (name.empty() || name == "none" || name == "noop") {
    return std::make_unique<NoopObserver>();
  }
  std::cerr << "[WARN] unknown observability backend '" << name << "', using log\n";
  return std::make_unique<LogObserver>();
}

std::vector<std::string> split_backends(const std::string &spec) {
  std::vector<std::string> names;
  std::stringstream stream(spec);
  std::string part;
  while (std::getline(stream, part, ',')) {
    auto name = common::to_lower(common::trim(part));
    if (!name.empty()) {
      names.push_back(std::move(name));
    }
  }
  return names;
}

} // namespace

std::unique_ptr<IObserver> create_observer(const config::Config &config) {
  const auto names = split_backends(config.observability.backend);
  if (names.size() <= 1) {
    return build_one(names.empty() ? std::string() : names.front());
  }

  auto multi = std::make_unique<MultiObserver>();
  for (const auto &name : names) {
    if (name != "none" && name != "noop") {
      multi->add(build_one(name));
    }
  }
  return multi;
}

} // namespace prdguard::observability
