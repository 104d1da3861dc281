#pragma once

#include "rcb/adapter/radio_adapter.hpp"
#include <mutex>

namespace rcb::adapter {

// In-process transceiver for running without a rig attached.
class SimulatedAdapter : public IRadioAdapter {
public:
    explicit SimulatedAdapter(std::string id);

    std::string id() const override;

    common::CommandResult connect(const common::Endpoint& endpoint) override;
    void disconnect() override;

    common::Outcome<common::RadioState> read_frequency() override;
    common::Outcome<common::RadioState> read_mode() override;
    common::Outcome<common::RadioState> read_power() override;
    common::Outcome<common::RadioState> read_ptt() override;
    common::Outcome<common::RadioState> read_info() override;
    common::Outcome<common::RadioState> read_vfo() override;

    common::CommandResult set_frequency(double hz) override;
    common::CommandResult set_mode(common::RadioMode mode, std::optional<double> bandwidth_hz) override;
    common::CommandResult set_power(double percent) override;
    common::CommandResult set_ptt(bool enabled) override;

    common::Outcome<RadioCapabilities> get_capabilities() override;

private:
    common::CommandResult require_connected() const;

    std::string id_;
    RadioCapabilities capabilities_;
    common::RadioState state_;
    bool connected_{false};
    mutable std::mutex mutex_;
};

}  // namespace rcb::adapter
