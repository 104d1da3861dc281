#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace rcb::common {

enum class CommandResultCode {
    Ok,
    ConnectionError,
    CommandTimeout,
    TransportError,
    CommandRejected,
    MalformedResponse,
    NotConnected,
    AlreadyConnecting,
    InvalidRange,
    Unsupported,
    Busy,
    InternalError
};

std::string_view to_string(CommandResultCode code) noexcept;

// Timeouts and link failures are the only errors that say something about
// the health of the session itself.
inline bool is_link_failure(CommandResultCode code) noexcept {
    return code == CommandResultCode::CommandTimeout || code == CommandResultCode::TransportError;
}

struct CommandResult {
    CommandResultCode code{CommandResultCode::Ok};
    std::string message;

    bool ok() const noexcept { return code == CommandResultCode::Ok; }

    static CommandResult success() { return {}; }
    static CommandResult failure(CommandResultCode code, std::string message) {
        return {.code = code, .message = std::move(message)};
    }
};

template <typename T>
struct Outcome {
    CommandResult result;
    T value{};

    bool ok() const noexcept { return result.ok(); }

    static Outcome success(T value) { return {.result = {}, .value = std::move(value)}; }
    static Outcome failure(CommandResult result) { return {.result = std::move(result), .value = {}}; }
};

enum class RadioMode {
    USB,
    LSB,
    CW,
    CWR,
    RTTY,
    RTTYR,
    AM,
    FM,
    WFM,
    AMS,
    PKTUSB,
    PKTLSB,
    PKTFM,
    PKTAM,
    FMN,
    SAM,
    DSB,
    Unknown
};

std::string_view to_string(RadioMode mode) noexcept;
RadioMode parse_radio_mode(std::string_view token) noexcept;

enum class ConnectionLifecycle {
    Disconnected,
    Connecting,
    Connected,
    Degraded
};

std::string_view to_string(ConnectionLifecycle lifecycle) noexcept;

struct Endpoint {
    std::string host;
    std::uint16_t port{4532};

    bool operator==(const Endpoint&) const = default;
};

std::string to_string(const Endpoint& endpoint);

struct RadioState {
    bool connected{false};
    std::optional<double> frequency_hz;
    std::optional<RadioMode> mode;
    std::optional<double> bandwidth_hz;
    std::optional<double> power_percent;
    std::optional<bool> ptt;
    std::optional<std::string> model;
    // Active VFO as the daemon names it, e.g. "VFOA".
    std::optional<std::string> vfo;

    bool operator==(const RadioState&) const = default;
};

}  // namespace rcb::common
