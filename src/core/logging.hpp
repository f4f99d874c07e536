#pragma once

#include "core/config.hpp"

namespace apwatch {

/// Install the "apwatch" logger as spdlog's default logger
/// Async mode uses a background thread pool with a stdout color sink
void setup_logging(const Config::Logging& config);

}  // namespace apwatch
