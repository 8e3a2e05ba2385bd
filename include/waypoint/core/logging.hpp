#pragma once

#include "config.hpp"

namespace waypoint::core {

// Configure the default spdlog logger from the observability settings.
// Console output always; a rotating file sink when log_path is set.
// Safe to call more than once (the default logger is replaced).
Result<void, Error> init_logging(const ObservabilityConfig& config);

}  // namespace waypoint::core
