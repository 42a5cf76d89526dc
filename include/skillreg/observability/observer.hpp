#pragma once

#include <chrono>
#include <cstdint>
#include <string>
#include <string_view>
#include <variant>

namespace skillreg::observability {

struct ScanStartEvent {
  std::string root;
};

struct PackageStartEvent {
  std::string package;
};

struct PackageAcceptedEvent {
  std::string package;
  std::string id;
  std::string content_hash;
};

struct PackageRejectedEvent {
  std::string package;
  std::string kind;
  std::string message;
};

struct RunCompleteEvent {
  std::size_t accepted = 0;
  std::size_t errors = 0;
};

struct ErrorEvent {
  std::string component;
  std::string message;
};

using ObserverEvent = std::variant<ScanStartEvent, PackageStartEvent, PackageAcceptedEvent,
                                   PackageRejectedEvent, RunCompleteEvent, ErrorEvent>;

struct BuildDurationMetric {
  std::chrono::milliseconds duration{0};
};

struct BytesHashedMetric {
  std::string package;
  std::uint64_t files = 0;
  std::uint64_t bytes = 0;
};

using ObserverMetric = std::variant<BuildDurationMetric, BytesHashedMetric>;

class IObserver {
public:
  virtual ~IObserver() = default;

  virtual void record_event(const ObserverEvent &event) = 0;
  virtual void record_metric(const ObserverMetric &metric) = 0;
  virtual void flush() {}
  [[nodiscard]] virtual std::string_view name() const = 0;
};

} // namespace skillreg::observability
