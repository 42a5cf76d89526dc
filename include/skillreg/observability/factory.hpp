#pragma once

#include "skillreg/config/schema.hpp"
#include "skillreg/observability/observer.hpp"

#include <memory>

namespace skillreg::observability {

[[nodiscard]] std::unique_ptr<IObserver> create_observer(const config::Config &config);

} // namespace skillreg::observability
