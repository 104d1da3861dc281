#pragma once

#include "rcb/adapter/radio_adapter.hpp"
#include "rcb/common/types.hpp"
#include <optional>
#include <string>
#include <string_view>
#include <vector>

// Helpers for rigctld's extended response protocol. A command prefixed with
// '+' is answered with an echo line ("get_freq:"), zero or more
// "Key: value" lines and a final "RPRT <code>" line.
namespace rcb::adapter::rigctld {

struct Reply {
    int report_code{0};
    std::vector<std::string> values;
};

bool is_report_line(std::string_view line) noexcept;
std::optional<int> parse_report_code(std::string_view line) noexcept;

// Hamlib error name for an RPRT code, e.g. -11 -> "feature not available".
std::string_view describe_report_code(int code) noexcept;

// RPRT codes that mean the rig or its bus stopped answering map to link
// failures; everything else is a rejection of the command itself.
common::CommandResultCode classify_report_code(int code) noexcept;

// Splits the raw lines of one reply (including the RPRT line) into the
// value payload. Fails with MalformedResponse when the RPRT line is missing
// and with the classified code when RPRT is negative.
common::Outcome<Reply> parse_reply(const std::vector<std::string>& lines);

// "Frequency: 14074000" -> "14074000"; a bare value is returned trimmed.
std::string value_of(std::string_view line);

std::optional<double> parse_number(std::string_view text) noexcept;
std::optional<bool> parse_flag(std::string_view text) noexcept;

RadioCapabilities parse_dump_caps(const std::vector<std::string>& lines);

std::string trim(std::string_view text);

}  // namespace rcb::adapter::rigctld
