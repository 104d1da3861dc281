#pragma once

#include "rcb/adapter/radio_adapter.hpp"
#include "rcb/adapter/rigctld_client.hpp"

namespace rcb::adapter {

class RigctldAdapter : public IRadioAdapter {
public:
    explicit RigctldAdapter(std::string id, RigctldClientOptions options = {});

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

    RigctldClientMetrics client_metrics() const;

private:
    common::Outcome<std::vector<std::string>> query(const std::string& command);
    common::CommandResult execute(const std::string& command);

    std::string id_;
    RigctldClient client_;
};

}  // namespace rcb::adapter
