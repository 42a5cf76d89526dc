#include "skillreg/observability/log_observer.hpp"

#include "skillreg/common/fs.hpp"

#include <type_traits>

namespace skillreg::observability {

std::optional<LogLevel> parse_log_level(const std::string &value) {
  const std::string normalized = common::to_lower(common::trim(value));
  if (normalized == "debug") {
    return LogLevel::Debug;
  }
  if (normalized == "info") {
    return LogLevel::Info;
  }
  if (normalized == "warn" || normalized == "warning") {
    return LogLevel::Warn;
  }
  if (normalized == "error") {
    return LogLevel::Error;
  }
  return std::nullopt;
}

std::string_view log_level_to_string(const LogLevel level) {
  switch (level) {
  case LogLevel::Debug:
    return "DEBUG";
  case LogLevel::Info:
    return "INFO";
  case LogLevel::Warn:
    return "WARN";
  case LogLevel::Error:
    return "ERROR";
  }
  return "INFO";
}

LogObserver::LogObserver(const LogLevel min_level, std::ostream &out)
    : min_level_(min_level), out_(&out) {}

void LogObserver::log_line(const LogLevel level, const std::string &message) {
  if (level < min_level_) {
    return;
  }
  *out_ << "[" << log_level_to_string(level) << "] " << message << "\n";
}

void LogObserver::record_event(const ObserverEvent &event) {
  std::visit(
      [this](auto &&evt) {
        using T = std::decay_t<decltype(evt)>;
        if constexpr (std::is_same_v<T, ScanStartEvent>) {
          log_line(LogLevel::Info, "scan.start root=" + evt.root);
        } else if constexpr (std::is_same_v<T, PackageStartEvent>) {
          log_line(LogLevel::Debug, "package.start dir=" + evt.package);
        } else if constexpr (std::is_same_v<T, PackageAcceptedEvent>) {
          log_line(LogLevel::Debug,
                   "package.accepted dir=" + evt.package + " id=" + evt.id + " hash=" +
                       evt.content_hash);
        } else if constexpr (std::is_same_v<T, PackageRejectedEvent>) {
          log_line(LogLevel::Debug, "package.rejected dir=" + evt.package + " kind=" + evt.kind);
        } else if constexpr (std::is_same_v<T, RunCompleteEvent>) {
          log_line(evt.errors == 0 ? LogLevel::Info : LogLevel::Warn,
                   "run.complete accepted=" + std::to_string(evt.accepted) +
                       " errors=" + std::to_string(evt.errors));
        } else if constexpr (std::is_same_v<T, ErrorEvent>) {
          log_line(LogLevel::Error, evt.component + ": " + evt.message);
        }
      },
      event);
}

void LogObserver::record_metric(const ObserverMetric &metric) {
  std::visit(
      [this](auto &&m) {
        using T = std::decay_t<decltype(m)>;
        if constexpr (std::is_same_v<T, BuildDurationMetric>) {
          log_line(LogLevel::Debug, "metric.build_duration_ms=" + std::to_string(m.duration.count()));
        } else if constexpr (std::is_same_v<T, BytesHashedMetric>) {
          log_line(LogLevel::Debug, "metric.hashed dir=" + m.package +
                                        " files=" + std::to_string(m.files) +
                                        " bytes=" + std::to_string(m.bytes));
        }
      },
      metric);
}

void LogObserver::flush() { out_->flush(); }

} // namespace skillreg::observability
