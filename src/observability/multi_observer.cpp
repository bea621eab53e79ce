#include "prdguard/observability/multi_observer.hpp"

#include <exception>
#include <iostream>

namespace prdguard::observability {

namespace {

// A failing child is reported and skipped so the remaining observers still see the event.
template <typename Fn> void for_each_child(std::vector<std::unique_ptr<IObserver>> &children,
                                           const char *action, Fn &&fn) {
  for (auto &child : children) {
    try {
      fn(*child);
    } catch (const std::exception &ex) {
      std::cerr << "[ERROR] observer '" << child->name() << "' failed to " << action << ": "
                << ex.what() << "\n";
    }
  }
}

} // namespace

void MultiObserver::add(std::unique_ptr<IObserver> observer) {
  if (observer != nullptr) {
    observers_.push_back(std::move(observer));
  }
}

void MultiObserver::record_event(const ObserverEvent &event) {
  for_each_child(observers_, "record event",
                 [&event](IObserver &child) { child.record_event(event); });
}

void MultiObserver::record_metric(const ObserverMetric &metric) {
  for_each_child(observers_, "record metric",
                 [&metric](IObserver &child) { child.record_metric(metric); });
}

void MultiObserver::flush() {
  for_each_child(observers_, "flush", [](IObserver &child) { child.flush(); });
}

} // namespace prdguard::observability
