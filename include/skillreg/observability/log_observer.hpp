#pragma once

#include "skillreg/observability/observer.hpp"

#include <iostream>
#include <optional>
#include <string>

namespace skillreg::observability {

enum class LogLevel {
  Debug,
  Info,
  Warn,
  Error,
};

[[nodiscard]] std::optional<LogLevel> parse_log_level(const std::string &value);
[[nodiscard]] std::string_view log_level_to_string(LogLevel level);

/// Writes `[LEVEL] message` lines to a stream (stderr by default).
class LogObserver final : public IObserver {
public:
  explicit LogObserver(LogLevel min_level = LogLevel::Info, std::ostream &out = std::cerr);

  void record_event(const ObserverEvent &event) override;
  void record_metric(const ObserverMetric &metric) override;
  void flush() override;
  [[nodiscard]] std::string_view name() const override { return "log"; }

private:
  void log_line(LogLevel level, const std::string &message);

  LogLevel min_level_;
  std::ostream *out_;
};

} // namespace skillreg::observability
