#include "rcb/adapter/rigctld_adapter.hpp"

#include "rcb/adapter/rigctld_protocol.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <cmath>
#include <cstdio>
#include <utility>

namespace rcb::adapter {

using common::CommandResult;
using common::CommandResultCode;
using common::Outcome;
using common::RadioState;

namespace {

constexpr std::chrono::milliseconds kDumpCapsTimeout{8000};

Outcome<RadioState> malformed(const std::string& command, const std::string& detail) {
    return Outcome<RadioState>::failure(CommandResult::failure(
        CommandResultCode::MalformedResponse, "unexpected reply to '" + command + "': " + detail));
}

std::string format_fraction(double value) {
    char buffer[32];
    std::snprintf(buffer, sizeof(buffer), "%.3f", value);
    return buffer;
}

}  // namespace

RigctldAdapter::RigctldAdapter(std::string id, RigctldClientOptions options)
    : id_(std::move(id))
    , client_(options) {}

std::string RigctldAdapter::id() const {
    return id_;
}

CommandResult RigctldAdapter::connect(const common::Endpoint& endpoint) {
    return client_.connect(endpoint);
}

void RigctldAdapter::disconnect() {
    client_.disconnect();
}

Outcome<RadioState> RigctldAdapter::read_frequency() {
    auto reply = query("f");
    if (!reply.ok()) {
        return Outcome<RadioState>::failure(std::move(reply.result));
    }
    const auto hz = reply.value.empty() ? std::nullopt : rigctld::parse_number(reply.value.front());
    if (!hz) {
        return malformed("f", "no frequency value");
    }
    RadioState state;
    state.frequency_hz = *hz;
    return Outcome<RadioState>::success(std::move(state));
}

Outcome<RadioState> RigctldAdapter::read_mode() {
    auto reply = query("m");
    if (!reply.ok()) {
        return Outcome<RadioState>::failure(std::move(reply.result));
    }
    if (reply.value.empty()) {
        return malformed("m", "no mode value");
    }
    RadioState state;
    state.mode = common::parse_radio_mode(reply.value[0]);
    if (reply.value.size() > 1) {
        if (const auto passband = rigctld::parse_number(reply.value[1]); passband && *passband > 0) {
            state.bandwidth_hz = *passband;
        }
    }
    return Outcome<RadioState>::success(std::move(state));
}

Outcome<RadioState> RigctldAdapter::read_power() {
    auto reply = query("l RFPOWER");
    if (!reply.ok()) {
        return Outcome<RadioState>::failure(std::move(reply.result));
    }
    const auto fraction = reply.value.empty() ? std::nullopt : rigctld::parse_number(reply.value.front());
    if (!fraction) {
        return malformed("l RFPOWER", "no level value");
    }
    RadioState state;
    state.power_percent = std::clamp(std::round(*fraction * 100.0), 0.0, 100.0);
    return Outcome<RadioState>::success(std::move(state));
}

Outcome<RadioState> RigctldAdapter::read_ptt() {
    auto reply = query("t");
    if (!reply.ok()) {
        return Outcome<RadioState>::failure(std::move(reply.result));
    }
    const auto ptt = reply.value.empty() ? std::nullopt : rigctld::parse_flag(reply.value.front());
    if (!ptt) {
        return malformed("t", "no PTT value");
    }
    RadioState state;
    state.ptt = *ptt;
    return Outcome<RadioState>::success(std::move(state));
}

Outcome<RadioState> RigctldAdapter::read_info() {
    auto reply = query("_");
    if (!reply.ok()) {
        return Outcome<RadioState>::failure(std::move(reply.result));
    }
    RadioState state;
    std::string info;
    for (const auto& value : reply.value) {
        if (!info.empty()) {
            info += ' ';
        }
        info += value;
    }
    // Many backends answer with an empty info string; that is not an error.
    if (!info.empty()) {
        state.model = std::move(info);
    }
    return Outcome<RadioState>::success(std::move(state));
}

Outcome<RadioState> RigctldAdapter::read_vfo() {
    auto reply = query("v");
    if (!reply.ok()) {
        return Outcome<RadioState>::failure(std::move(reply.result));
    }
    if (reply.value.empty() || reply.value.front().empty()) {
        return malformed("v", "no VFO name");
    }
    RadioState state;
    state.vfo = reply.value.front();
    return Outcome<RadioState>::success(std::move(state));
}

CommandResult RigctldAdapter::set_frequency(double hz) {
    return execute("F " + std::to_string(std::llround(hz)));
}

CommandResult RigctldAdapter::set_mode(common::RadioMode mode, std::optional<double> bandwidth_hz) {
    const long long passband = bandwidth_hz ? std::llround(*bandwidth_hz) : 0;
    return execute("M " + std::string{common::to_string(mode)} + " " + std::to_string(passband));
}

CommandResult RigctldAdapter::set_power(double percent) {
    const double fraction = std::clamp(percent / 100.0, 0.0, 1.0);
    return execute("L RFPOWER " + format_fraction(fraction));
}

CommandResult RigctldAdapter::set_ptt(bool enabled) {
    return execute(enabled ? "T 1" : "T 0");
}

Outcome<RadioCapabilities> RigctldAdapter::get_capabilities() {
    auto raw = client_.request("\\dump_caps", kDumpCapsTimeout);
    if (!raw.ok()) {
        return Outcome<RadioCapabilities>::failure(std::move(raw.result));
    }
    auto reply = rigctld::parse_reply(raw.value);
    if (!reply.ok()) {
        return Outcome<RadioCapabilities>::failure(std::move(reply.result));
    }
    auto caps = rigctld::parse_dump_caps(raw.value);
    spdlog::debug("[RigctldAdapter] {} capabilities: {} modes, {} levels, {} funcs",
                  id_, caps.modes.size(), caps.levels.size(), caps.funcs.size());
    return Outcome<RadioCapabilities>::success(std::move(caps));
}

RigctldClientMetrics RigctldAdapter::client_metrics() const {
    return client_.metrics();
}

Outcome<std::vector<std::string>> RigctldAdapter::query(const std::string& command) {
    auto raw = client_.request(command);
    if (!raw.ok()) {
        return raw;
    }
    auto reply = rigctld::parse_reply(raw.value);
    if (!reply.ok()) {
        return Outcome<std::vector<std::string>>::failure(std::move(reply.result));
    }
    return Outcome<std::vector<std::string>>::success(std::move(reply.value.values));
}

CommandResult RigctldAdapter::execute(const std::string& command) {
    auto raw = client_.request(command);
    if (!raw.ok()) {
        return raw.result;
    }
    auto reply = rigctld::parse_reply(raw.value);
    if (!reply.ok()) {
        spdlog::warn("[RigctldAdapter] '{}' failed: {}", command, reply.result.message);
    }
    return reply.result;
}

}  // namespace rcb::adapter
