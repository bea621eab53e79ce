#pragma once

#include "prdguard/config/schema.hpp"
#include "prdguard/observability/observer.hpp"

#include <memory>

namespace prdguard::observability {

[[nodiscard]] std::unique_ptr<IObserver> create_observer(const config::Config &config);

} // namespace prdguard::observability
