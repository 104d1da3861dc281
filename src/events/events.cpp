#include "rcb/events/events.hpp"

#include <type_traits>

namespace rcb::events {

namespace {

template <typename>
inline constexpr bool kUnhandled = false;

nlohmann::json endpoint_json(const common::Endpoint& endpoint) {
    return {{"host", endpoint.host}, {"port", endpoint.port}};
}

}  // namespace

std::string_view event_name(const Event& event) noexcept {
    return std::visit([](const auto& payload) -> std::string_view {
        using T = std::decay_t<decltype(payload)>;
        if constexpr (std::is_same_v<T, Connected>) {
            return "connected";
        } else if constexpr (std::is_same_v<T, ConnectionFailed>) {
            return "connectionFailed";
        } else if constexpr (std::is_same_v<T, ConnectionDegraded>) {
            return "connectionDegraded";
        } else if constexpr (std::is_same_v<T, Disconnected>) {
            return "disconnected";
        } else if constexpr (std::is_same_v<T, RadioStateChanged>) {
            return "radioState";
        } else if constexpr (std::is_same_v<T, FrequencyChanged>) {
            return "frequencyChanged";
        } else if constexpr (std::is_same_v<T, ModeChanged>) {
            return "modeChanged";
        } else if constexpr (std::is_same_v<T, PowerChanged>) {
            return "powerChanged";
        } else if constexpr (std::is_same_v<T, PttChanged>) {
            return "pttChanged";
        } else if constexpr (std::is_same_v<T, PollingStarted>) {
            return "pollingStarted";
        } else if constexpr (std::is_same_v<T, PollingStopped>) {
            return "pollingStopped";
        } else if constexpr (std::is_same_v<T, PollingError>) {
            return "pollingError";
        } else {
            static_assert(kUnhandled<T>, "event without a catalog name");
        }
    }, event);
}

nlohmann::json to_json(const common::RadioState& state) {
    nlohmann::json payload = {{"connected", state.connected}};
    if (state.frequency_hz) {
        payload["frequencyHz"] = *state.frequency_hz;
    }
    if (state.mode) {
        payload["mode"] = common::to_string(*state.mode);
    }
    if (state.bandwidth_hz) {
        payload["bandwidthHz"] = *state.bandwidth_hz;
    }
    if (state.power_percent) {
        payload["powerPercent"] = *state.power_percent;
    }
    if (state.ptt) {
        payload["ptt"] = *state.ptt;
    }
    if (state.model) {
        payload["model"] = *state.model;
    }
    if (state.vfo) {
        payload["vfo"] = *state.vfo;
    }
    return payload;
}

nlohmann::json to_json(const Event& event) {
    return std::visit([](const auto& payload) -> nlohmann::json {
        using T = std::decay_t<decltype(payload)>;
        if constexpr (std::is_same_v<T, Connected>) {
            auto json = endpoint_json(payload.endpoint);
            json["connected"] = true;
            return json;
        } else if constexpr (std::is_same_v<T, ConnectionFailed>) {
            auto json = endpoint_json(payload.endpoint);
            json["code"] = common::to_string(payload.code);
            json["reason"] = payload.reason;
            return json;
        } else if constexpr (std::is_same_v<T, ConnectionDegraded>) {
            return {{"code", common::to_string(payload.code)}, {"reason", payload.reason}};
        } else if constexpr (std::is_same_v<T, Disconnected>) {
            nlohmann::json json = {{"connected", false}, {"reason", payload.reason}};
            if (payload.endpoint) {
                json["host"] = payload.endpoint->host;
                json["port"] = payload.endpoint->port;
            }
            return json;
        } else if constexpr (std::is_same_v<T, RadioStateChanged>) {
            return to_json(payload.state);
        } else if constexpr (std::is_same_v<T, FrequencyChanged>) {
            return {{"frequencyHz", payload.frequency_hz}};
        } else if constexpr (std::is_same_v<T, ModeChanged>) {
            nlohmann::json json = {{"mode", common::to_string(payload.mode)}};
            if (payload.bandwidth_hz) {
                json["bandwidthHz"] = *payload.bandwidth_hz;
            }
            return json;
        } else if constexpr (std::is_same_v<T, PowerChanged>) {
            return {{"powerPercent", payload.power_percent}};
        } else if constexpr (std::is_same_v<T, PttChanged>) {
            return {{"ptt", payload.ptt}};
        } else if constexpr (std::is_same_v<T, PollingStarted>) {
            return {{"intervalMs", payload.interval.count()}};
        } else if constexpr (std::is_same_v<T, PollingStopped>) {
            return nlohmann::json::object();
        } else if constexpr (std::is_same_v<T, PollingError>) {
            return {{"code", common::to_string(payload.code)},
                    {"reason", payload.reason},
                    {"consecutiveFailures", payload.consecutive_failures}};
        } else {
            static_assert(kUnhandled<T>, "event without a JSON mapping");
        }
    }, event);
}

}  // namespace rcb::events
