#pragma once

#include "rcb/adapter/radio_adapter.hpp"
#include "rcb/config/config_manager.hpp"

namespace rcb::adapter {

// Throws std::invalid_argument for an adapter type it does not know.
AdapterPtr make_adapter(const config::RadioConfig& radio, const config::RigctldConfig& rigctld);

}  // namespace rcb::adapter
