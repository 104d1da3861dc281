#pragma once

#include "rcb/common/types.hpp"
#include <nlohmann/json.hpp>
#include <chrono>
#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <variant>

namespace rcb::events {

struct Connected {
    common::Endpoint endpoint;
};

struct ConnectionFailed {
    common::Endpoint endpoint;
    common::CommandResultCode code{common::CommandResultCode::ConnectionError};
    std::string reason;
};

struct ConnectionDegraded {
    common::CommandResultCode code{common::CommandResultCode::TransportError};
    std::string reason;
};

struct Disconnected {
    std::optional<common::Endpoint> endpoint;
    std::string reason;
};

struct RadioStateChanged {
    common::RadioState state;
};

struct FrequencyChanged {
    double frequency_hz{0.0};
};

struct ModeChanged {
    common::RadioMode mode{common::RadioMode::Unknown};
    std::optional<double> bandwidth_hz;
};

struct PowerChanged {
    double power_percent{0.0};
};

struct PttChanged {
    bool ptt{false};
};

struct PollingStarted {
    std::chrono::milliseconds interval{0};
};

struct PollingStopped {};

struct PollingError {
    common::CommandResultCode code{common::CommandResultCode::TransportError};
    std::string reason;
    std::size_t consecutive_failures{0};
};

using Event = std::variant<Connected,
                           ConnectionFailed,
                           ConnectionDegraded,
                           Disconnected,
                           RadioStateChanged,
                           FrequencyChanged,
                           ModeChanged,
                           PowerChanged,
                           PttChanged,
                           PollingStarted,
                           PollingStopped,
                           PollingError>;

// Catalog name of the event, e.g. "radioState" or "connectionDegraded".
std::string_view event_name(const Event& event) noexcept;

nlohmann::json to_json(const common::RadioState& state);
nlohmann::json to_json(const Event& event);

}  // namespace rcb::events
