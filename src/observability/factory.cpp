#include "skillreg/observability/factory.hpp"

#include "skillreg/common/fs.hpp"
#include "skillreg/observability/log_observer.hpp"
#include "skillreg/observability/multi_observer.hpp"

#include <sstream>

namespace skillreg::observability {

namespace {

bool is_silent_backend(const std::string &name) { return name == "none" || name == "noop"; }

} // namespace

std::unique_ptr<IObserver> create_observer(const config::Config &config) {
  const LogLevel level = parse_log_level(config.observability.level).value_or(LogLevel::Info);
  const std::string backend = common::to_lower(common::trim(config.observability.backend));
  if (is_silent_backend(backend)) {
    return std::make_unique<MultiObserver>();
  }
  if (backend.empty() || backend == "log") {
    return std::make_unique<LogObserver>(level);
  }

  if (backend.find(',') != std::string::npos) {
    auto multi = std::make_unique<MultiObserver>();
    std::stringstream stream(backend);
    std::string part;
    while (std::getline(stream, part, ',')) {
      // silent entries add nothing to the fan-out
      if (common::trim(part) == "log") {
        multi->add(std::make_unique<LogObserver>(level));
      }
    }
    return multi;
  }

  return std::make_unique<LogObserver>(level);
}

} // namespace skillreg::observability
