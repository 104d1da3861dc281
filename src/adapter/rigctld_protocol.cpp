#include "rcb/adapter/rigctld_protocol.hpp"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <cstdlib>
#include <sstream>

namespace rcb::adapter::rigctld {

namespace {

constexpr std::string_view kReportPrefix = "RPRT";

bool is_echo_line(std::string_view line) {
    const auto colon = line.find(':');
    if (colon == std::string_view::npos || colon == 0) {
        return false;
    }
    return std::all_of(line.begin(), line.begin() + static_cast<std::ptrdiff_t>(colon), [](char c) {
        return std::islower(static_cast<unsigned char>(c)) || c == '_' || c == '\\' ||
               std::isdigit(static_cast<unsigned char>(c));
    });
}

bool starts_with(std::string_view text, std::string_view prefix) {
    return text.size() >= prefix.size() && text.compare(0, prefix.size(), prefix) == 0;
}

std::vector<std::string> split_tokens(std::string_view text) {
    std::vector<std::string> tokens;
    std::istringstream stream{std::string{text}};
    std::string token;
    while (stream >> token) {
        // "ATT(0..20/20)" carries the level range; only the name matters.
        if (const auto paren = token.find('('); paren != std::string::npos) {
            token.erase(paren);
        }
        if (!token.empty()) {
            tokens.push_back(std::move(token));
        }
    }
    return tokens;
}

void append_unique(std::vector<std::string>& into, const std::vector<std::string>& tokens) {
    for (const auto& token : tokens) {
        if (std::find(into.begin(), into.end(), token) == into.end()) {
            into.push_back(token);
        }
    }
}

}  // namespace

std::string trim(std::string_view text) {
    const auto first = text.find_first_not_of(" \t\r\n");
    if (first == std::string_view::npos) {
        return {};
    }
    const auto last = text.find_last_not_of(" \t\r\n");
    return std::string{text.substr(first, last - first + 1)};
}

bool is_report_line(std::string_view line) noexcept {
    return starts_with(line, kReportPrefix) &&
           (line.size() == kReportPrefix.size() || line[kReportPrefix.size()] == ' ');
}

std::optional<int> parse_report_code(std::string_view line) noexcept {
    if (!is_report_line(line)) {
        return std::nullopt;
    }
    const std::string digits = trim(line.substr(kReportPrefix.size()));
    if (digits.empty()) {
        return std::nullopt;
    }
    char* end = nullptr;
    const long code = std::strtol(digits.c_str(), &end, 10);
    if (end == digits.c_str() || *end != '\0') {
        return std::nullopt;
    }
    return static_cast<int>(code);
}

std::string_view describe_report_code(int code) noexcept {
    switch (code) {
        case 0: return "ok";
        case -1: return "invalid parameter";
        case -2: return "invalid configuration";
        case -3: return "memory shortage";
        case -4: return "function not implemented";
        case -5: return "communication timed out";
        case -6: return "IO error";
        case -7: return "internal Hamlib error";
        case -8: return "protocol error";
        case -9: return "command rejected by the rig";
        case -10: return "command performed, but arg truncated";
        case -11: return "feature not available";
        case -12: return "target VFO unaccessible";
        case -13: return "communication bus error";
        case -14: return "communication bus collision";
        case -15: return "NULL RIG handle or invalid pointer parameter";
        case -16: return "invalid VFO";
        case -17: return "argument out of domain of func";
        default: return "unknown error";
    }
}

common::CommandResultCode classify_report_code(int code) noexcept {
    switch (code) {
        case 0:
            return common::CommandResultCode::Ok;
        case -5:
            return common::CommandResultCode::CommandTimeout;
        case -6:
        case -13:
        case -14:
            return common::CommandResultCode::TransportError;
        default:
            return common::CommandResultCode::CommandRejected;
    }
}

common::Outcome<Reply> parse_reply(const std::vector<std::string>& lines) {
    const auto report = std::find_if(lines.begin(), lines.end(),
                                     [](const std::string& line) { return is_report_line(line); });
    if (report == lines.end()) {
        return common::Outcome<Reply>::failure(common::CommandResult::failure(
            common::CommandResultCode::MalformedResponse, "reply has no RPRT line"));
    }

    const auto code = parse_report_code(*report);
    if (!code) {
        return common::Outcome<Reply>::failure(common::CommandResult::failure(
            common::CommandResultCode::MalformedResponse, "unparseable report line '" + *report + "'"));
    }

    if (*code != 0) {
        return common::Outcome<Reply>::failure(common::CommandResult::failure(
            classify_report_code(*code),
            "RPRT " + std::to_string(*code) + " (" + std::string{describe_report_code(*code)} + ")"));
    }

    Reply reply;
    reply.report_code = *code;
    auto it = lines.begin();
    if (it != report && is_echo_line(*it)) {
        ++it;
    }
    for (; it != report; ++it) {
        auto value = value_of(*it);
        if (!value.empty()) {
            reply.values.push_back(std::move(value));
        }
    }
    return common::Outcome<Reply>::success(std::move(reply));
}

std::string value_of(std::string_view line) {
    const auto separator = line.find(": ");
    if (separator == std::string_view::npos) {
        if (!line.empty() && line.back() == ':') {
            return {};
        }
        return trim(line);
    }
    return trim(line.substr(separator + 2));
}

std::optional<double> parse_number(std::string_view text) noexcept {
    const std::string value = trim(text);
    if (value.empty()) {
        return std::nullopt;
    }
    char* end = nullptr;
    const double number = std::strtod(value.c_str(), &end);
    if (end == value.c_str() || *end != '\0' || !std::isfinite(number)) {
        return std::nullopt;
    }
    return number;
}

std::optional<bool> parse_flag(std::string_view text) noexcept {
    const std::string value = trim(text);
    if (value == "1" || value == "Y") {
        return true;
    }
    if (value == "0" || value == "N") {
        return false;
    }
    return std::nullopt;
}

RadioCapabilities parse_dump_caps(const std::vector<std::string>& lines) {
    RadioCapabilities caps = default_capabilities();
    std::optional<std::string> manufacturer;

    for (const auto& raw : lines) {
        const auto colon = raw.find(':');
        if (colon == std::string::npos) {
            continue;
        }
        const std::string key = trim(std::string_view{raw}.substr(0, colon));
        const std::string value = trim(std::string_view{raw}.substr(colon + 1));

        if (key == "Model name") {
            if (!value.empty()) {
                caps.model = value;
            }
        } else if (key == "Mfg name") {
            if (!value.empty()) {
                manufacturer = value;
            }
        } else if (key == "Mode list") {
            append_unique(caps.modes, split_tokens(value));
        } else if (key == "VFO list") {
            append_unique(caps.vfos, split_tokens(value));
        } else if (key == "Get level") {
            append_unique(caps.levels, split_tokens(value));
        } else if (key == "Set level") {
            append_unique(caps.settable_levels, split_tokens(value));
        } else if (key == "Get functions" || key == "Set functions") {
            append_unique(caps.funcs, split_tokens(value));
        } else if (key == "Can set Frequency") {
            caps.supports.set_frequency = parse_flag(value).value_or(caps.supports.set_frequency);
        } else if (key == "Can set Mode") {
            caps.supports.set_mode = parse_flag(value).value_or(caps.supports.set_mode);
        } else if (key == "Can set PTT") {
            caps.supports.set_ptt = parse_flag(value).value_or(caps.supports.set_ptt);
        }
    }

    if (manufacturer && caps.model) {
        caps.model = *manufacturer + " " + *caps.model;
    }
    caps.supports.set_power = std::find(caps.settable_levels.begin(), caps.settable_levels.end(),
                                        "RFPOWER") != caps.settable_levels.end();
    return caps;
}

}  // namespace rcb::adapter::rigctld
