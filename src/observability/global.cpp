#include "skillreg/observability/global.hpp"

#include <mutex>

namespace skillreg::observability {

namespace {

std::mutex g_observer_mutex;
std::unique_ptr<IObserver> g_observer;

} // namespace

void set_global_observer(std::unique_ptr<IObserver> observer) {
  std::lock_guard<std::mutex> lock(g_observer_mutex);
  g_observer = std::move(observer);
}

IObserver *get_global_observer() {
  std::lock_guard<std::mutex> lock(g_observer_mutex);
  return g_observer.get();
}

void record_event(const ObserverEvent &event) {
  if (auto *observer = get_global_observer(); observer != nullptr) {
    observer->record_event(event);
  }
}

void record_metric(const ObserverMetric &metric) {
  if (auto *observer = get_global_observer(); observer != nullptr) {
    observer->record_metric(metric);
  }
}

void flush() {
  if (auto *observer = get_global_observer(); observer != nullptr) {
    observer->flush();
  }
}

void record_scan_start(const std::string &root) { record_event(ScanStartEvent{.root = root}); }

void record_package_start(const std::string &package) {
  record_event(PackageStartEvent{.package = package});
}

void record_package_accepted(const std::string &package, const std::string &id,
                             const std::string &content_hash) {
  record_event(
      PackageAcceptedEvent{.package = package, .id = id, .content_hash = content_hash});
}

void record_package_rejected(const std::string &package, const std::string &kind,
                             const std::string &message) {
  record_event(PackageRejectedEvent{.package = package, .kind = kind, .message = message});
}

void record_run_complete(const std::size_t accepted, const std::size_t errors) {
  record_event(RunCompleteEvent{.accepted = accepted, .errors = errors});
}

void record_error(const std::string &component, const std::string &message) {
  record_event(ErrorEvent{.component = component, .message = message});
}

void record_build_duration(const std::chrono::milliseconds duration) {
  record_metric(BuildDurationMetric{.duration = duration});
}

void record_bytes_hashed(const std::string &package, const std::uint64_t files,
                         const std::uint64_t bytes) {
  record_metric(BytesHashedMetric{.package = package, .files = files, .bytes = bytes});
}

} // namespace skillreg::observability
