#include "rcb/common/types.hpp"

#include <algorithm>
#include <array>
#include <cctype>
#include <utility>

namespace rcb::common {

namespace {

constexpr std::array<std::pair<RadioMode, std::string_view>, 17> kModeTokens{{
    {RadioMode::USB, "USB"},
    {RadioMode::LSB, "LSB"},
    {RadioMode::CW, "CW"},
    {RadioMode::CWR, "CWR"},
    {RadioMode::RTTY, "RTTY"},
    {RadioMode::RTTYR, "RTTYR"},
    {RadioMode::AM, "AM"},
    {RadioMode::FM, "FM"},
    {RadioMode::WFM, "WFM"},
    {RadioMode::AMS, "AMS"},
    {RadioMode::PKTUSB, "PKTUSB"},
    {RadioMode::PKTLSB, "PKTLSB"},
    {RadioMode::PKTFM, "PKTFM"},
    {RadioMode::PKTAM, "PKTAM"},
    {RadioMode::FMN, "FMN"},
    {RadioMode::SAM, "SAM"},
    {RadioMode::DSB, "DSB"},
}};

bool iequals(std::string_view lhs, std::string_view rhs) {
    return lhs.size() == rhs.size() &&
           std::equal(lhs.begin(), lhs.end(), rhs.begin(), [](char a, char b) {
               return std::toupper(static_cast<unsigned char>(a)) ==
                      std::toupper(static_cast<unsigned char>(b));
           });
}

}  // namespace

std::string_view to_string(CommandResultCode code) noexcept {
    switch (code) {
        case CommandResultCode::Ok: return "ok";
        case CommandResultCode::ConnectionError: return "connection_error";
        case CommandResultCode::CommandTimeout: return "command_timeout";
        case CommandResultCode::TransportError: return "transport_error";
        case CommandResultCode::CommandRejected: return "command_rejected";
        case CommandResultCode::MalformedResponse: return "malformed_response";
        case CommandResultCode::NotConnected: return "not_connected";
        case CommandResultCode::AlreadyConnecting: return "already_connecting";
        case CommandResultCode::InvalidRange: return "invalid_range";
        case CommandResultCode::Unsupported: return "unsupported";
        case CommandResultCode::Busy: return "busy";
        case CommandResultCode::InternalError: return "internal";
    }
    return "internal";
}

std::string_view to_string(RadioMode mode) noexcept {
    for (const auto& [value, token] : kModeTokens) {
        if (value == mode) {
            return token;
        }
    }
    return "UNKNOWN";
}

RadioMode parse_radio_mode(std::string_view token) noexcept {
    for (const auto& [value, name] : kModeTokens) {
        if (iequals(name, token)) {
            return value;
        }
    }
    return RadioMode::Unknown;
}

std::string_view to_string(ConnectionLifecycle lifecycle) noexcept {
    switch (lifecycle) {
        case ConnectionLifecycle::Disconnected: return "disconnected";
        case ConnectionLifecycle::Connecting: return "connecting";
        case ConnectionLifecycle::Connected: return "connected";
        case ConnectionLifecycle::Degraded: return "degraded";
    }
    return "disconnected";
}

std::string to_string(const Endpoint& endpoint) {
    return endpoint.host + ":" + std::to_string(endpoint.port);
}

}  // namespace rcb::common
