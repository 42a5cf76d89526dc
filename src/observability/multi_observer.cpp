#include "skillreg/observability/multi_observer.hpp"

#include <algorithm>

namespace skillreg::observability {

MultiObserver::MultiObserver(std::vector<std::unique_ptr<IObserver>> sinks) {
  for (auto &sink : sinks) {
    add(std::move(sink));
  }
}

void MultiObserver::add(std::unique_ptr<IObserver> observer) {
  if (observer != nullptr) {
    sinks_.push_back(std::move(observer));
  }
}

void MultiObserver::record_event(const ObserverEvent &event) {
  std::for_each(sinks_.begin(), sinks_.end(),
                [&event](const auto &sink) { sink->record_event(event); });
}

void MultiObserver::record_metric(const ObserverMetric &metric) {
  std::for_each(sinks_.begin(), sinks_.end(),
                [&metric](const auto &sink) { sink->record_metric(metric); });
}

void MultiObserver::flush() {
  for (const auto &sink : sinks_) {
    sink->flush();
  }
}

} // namespace skillreg::observability
