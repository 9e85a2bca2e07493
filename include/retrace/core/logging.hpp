#pragma once

#include "config.hpp"
#include "result.hpp"

namespace retrace::core {

// Configure the default spdlog logger: level, pattern and an optional
// file sink next to the console sink.
Result<void, Error> init_logging(const ObservabilityConfig& config);

}  // namespace retrace::core
