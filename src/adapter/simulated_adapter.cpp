#include "rcb/adapter/simulated_adapter.hpp"

#include <spdlog/spdlog.h>

#include <utility>

namespace rcb::adapter {

using common::CommandResult;
using common::CommandResultCode;
using common::Outcome;
using common::RadioState;

SimulatedAdapter::SimulatedAdapter(std::string id)
    : id_(std::move(id)) {
    capabilities_ = default_capabilities();
    capabilities_.model = "Simulated IC-7300";
    capabilities_.modes = {"USB", "LSB", "CW", "CWR", "RTTY", "RTTYR", "AM", "FM", "PKTUSB", "PKTLSB"};
    capabilities_.vfos = {"VFOA", "VFOB"};
    capabilities_.levels = {"RFPOWER", "AF", "RF", "SQL", "STRENGTH", "SWR"};
    capabilities_.settable_levels = {"RFPOWER", "AF", "RF", "SQL"};
    capabilities_.funcs = {"NB", "NR", "COMP", "VOX"};
    capabilities_.supports.set_power = true;

    state_.frequency_hz = 14074000.0;
    state_.mode = common::RadioMode::USB;
    state_.bandwidth_hz = 2800.0;
    state_.power_percent = 50.0;
    state_.ptt = false;
    state_.model = capabilities_.model;
    state_.vfo = "VFOA";
}

std::string SimulatedAdapter::id() const {
    return id_;
}

CommandResult SimulatedAdapter::connect(const common::Endpoint& endpoint) {
    std::lock_guard<std::mutex> lock(mutex_);
    connected_ = true;
    spdlog::info("[SimulatedAdapter] {} attached (requested {})", id_, common::to_string(endpoint));
    return CommandResult::success();
}

void SimulatedAdapter::disconnect() {
    std::lock_guard<std::mutex> lock(mutex_);
    connected_ = false;
}

Outcome<RadioState> SimulatedAdapter::read_frequency() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (auto check = require_connected(); !check.ok()) {
        return Outcome<RadioState>::failure(std::move(check));
    }
    RadioState partial;
    partial.frequency_hz = state_.frequency_hz;
    return Outcome<RadioState>::success(std::move(partial));
}

Outcome<RadioState> SimulatedAdapter::read_mode() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (auto check = require_connected(); !check.ok()) {
        return Outcome<RadioState>::failure(std::move(check));
    }
    RadioState partial;
    partial.mode = state_.mode;
    partial.bandwidth_hz = state_.bandwidth_hz;
    return Outcome<RadioState>::success(std::move(partial));
}

Outcome<RadioState> SimulatedAdapter::read_power() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (auto check = require_connected(); !check.ok()) {
        return Outcome<RadioState>::failure(std::move(check));
    }
    RadioState partial;
    partial.power_percent = state_.power_percent;
    return Outcome<RadioState>::success(std::move(partial));
}

Outcome<RadioState> SimulatedAdapter::read_ptt() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (auto check = require_connected(); !check.ok()) {
        return Outcome<RadioState>::failure(std::move(check));
    }
    RadioState partial;
    partial.ptt = state_.ptt;
    return Outcome<RadioState>::success(std::move(partial));
}

Outcome<RadioState> SimulatedAdapter::read_info() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (auto check = require_connected(); !check.ok()) {
        return Outcome<RadioState>::failure(std::move(check));
    }
    RadioState partial;
    partial.model = state_.model;
    return Outcome<RadioState>::success(std::move(partial));
}

Outcome<RadioState> SimulatedAdapter::read_vfo() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (auto check = require_connected(); !check.ok()) {
        return Outcome<RadioState>::failure(std::move(check));
    }
    RadioState partial;
    partial.vfo = state_.vfo;
    return Outcome<RadioState>::success(std::move(partial));
}

CommandResult SimulatedAdapter::set_frequency(double hz) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (auto check = require_connected(); !check.ok()) {
        return check;
    }
    state_.frequency_hz = hz;
    return CommandResult::success();
}

CommandResult SimulatedAdapter::set_mode(common::RadioMode mode, std::optional<double> bandwidth_hz) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (auto check = require_connected(); !check.ok()) {
        return check;
    }
    state_.mode = mode;
    if (bandwidth_hz) {
        state_.bandwidth_hz = *bandwidth_hz;
    }
    return CommandResult::success();
}

CommandResult SimulatedAdapter::set_power(double percent) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (auto check = require_connected(); !check.ok()) {
        return check;
    }
    state_.power_percent = percent;
    return CommandResult::success();
}

CommandResult SimulatedAdapter::set_ptt(bool enabled) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (auto check = require_connected(); !check.ok()) {
        return check;
    }
    state_.ptt = enabled;
    return CommandResult::success();
}

Outcome<RadioCapabilities> SimulatedAdapter::get_capabilities() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (auto check = require_connected(); !check.ok()) {
        return Outcome<RadioCapabilities>::failure(std::move(check));
    }
    return Outcome<RadioCapabilities>::success(capabilities_);
}

CommandResult SimulatedAdapter::require_connected() const {
    if (!connected_) {
        return CommandResult::failure(CommandResultCode::TransportError, "simulated rig is detached");
    }
    return CommandResult::success();
}

}  // namespace rcb::adapter
