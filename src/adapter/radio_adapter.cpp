#include "rcb/adapter/radio_adapter.hpp"

#include <algorithm>

namespace rcb::adapter {

bool RadioCapabilities::has_level(const std::string& name) const {
    return std::find(levels.begin(), levels.end(), name) != levels.end();
}

RadioCapabilities default_capabilities() {
    RadioCapabilities caps;
    caps.supports = SupportFlags{
        .set_frequency = true,
        .set_mode = true,
        .set_power = false,
        .set_ptt = true
    };
    return caps;
}

}  // namespace rcb::adapter
