#pragma once

#include "skillreg/observability/observer.hpp"

#include <memory>

namespace skillreg::observability {

void set_global_observer(std::unique_ptr<IObserver> observer);
IObserver *get_global_observer();

void record_event(const ObserverEvent &event);
void record_metric(const ObserverMetric &metric);
void flush();

void record_scan_start(const std::string &root);
void record_package_start(const std::string &package);
void record_package_accepted(const std::string &package, const std::string &id,
                             const std::string &content_hash);
void record_package_rejected(const std::string &package, const std::string &kind,
                             const std::string &message);
void record_run_complete(std::size_t accepted, std::size_t errors);
void record_error(const std::string &component, const std::string &message);

void record_build_duration(std::chrono::milliseconds duration);
void record_bytes_hashed(const std::string &package, std::uint64_t files, std::uint64_t bytes);

} // namespace skillreg::observability
