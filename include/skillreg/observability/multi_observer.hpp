#pragma once

#include "skillreg/observability/observer.hpp"

#include <memory>
#include <vector>

namespace skillreg::observability {

/// Fans events out to every sink. With no sinks it discards everything, which is what the
/// `none` backend uses.
class MultiObserver final : public IObserver {
public:
  MultiObserver() = default;
  explicit MultiObserver(std::vector<std::unique_ptr<IObserver>> sinks);

  void add(std::unique_ptr<IObserver> observer);
  [[nodiscard]] std::size_t size() const { return sinks_.size(); }

  void record_event(const ObserverEvent &event) override;
  void record_metric(const ObserverMetric &metric) override;
  void flush() override;
  [[nodiscard]] std::string_view name() const override { return sinks_.empty() ? "none" : "multi"; }

private:
  std::vector<std::unique_ptr<IObserver>> sinks_;
};

} // namespace skillreg::observability
