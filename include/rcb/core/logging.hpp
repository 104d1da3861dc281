#pragma once

#include "rcb/config/config_manager.hpp"

namespace rcb::core {

// Installs the process-wide spdlog logger: a colour console sink plus, when
// logging.file is set, a size-rotated file sink.
void configure_logging(const config::LoggingConfig& config);

}  // namespace rcb::core
