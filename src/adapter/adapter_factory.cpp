#include "rcb/adapter/adapter_factory.hpp"

#include "rcb/adapter/rigctld_adapter.hpp"
#include "rcb/adapter/simulated_adapter.hpp"

#include <stdexcept>

namespace rcb::adapter {

AdapterPtr make_adapter(const config::RadioConfig& radio, const config::RigctldConfig& rigctld) {
    if (radio.adapter == "rigctld") {
        RigctldClientOptions options{
            .connect_timeout = rigctld.connect_timeout,
            .command_timeout = rigctld.command_timeout,
            .reconnect_initial = rigctld.reconnect_initial,
            .reconnect_max = rigctld.reconnect_max,
            .reconnect_multiplier = rigctld.reconnect_multiplier
        };
        return std::make_unique<RigctldAdapter>(radio.id, options);
    }
    if (radio.adapter == "simulator") {
        return std::make_unique<SimulatedAdapter>(radio.id);
    }
    throw std::invalid_argument("Unsupported adapter type '" + radio.adapter + "'");
}

}  // namespace rcb::adapter
