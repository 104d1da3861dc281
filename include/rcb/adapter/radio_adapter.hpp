#pragma once

#include "rcb/common/types.hpp"
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace rcb::adapter {

struct SupportFlags {
    bool set_frequency{false};
    bool set_mode{false};
    bool set_power{false};
    bool set_ptt{false};

    bool operator==(const SupportFlags&) const = default;
};

struct RadioCapabilities {
    std::optional<std::string> model;
    std::vector<std::string> levels;
    std::vector<std::string> settable_levels;
    std::vector<std::string> funcs;
    std::vector<std::string> modes;
    std::vector<std::string> vfos;
    SupportFlags supports;

    bool has_level(const std::string& name) const;

    bool operator==(const RadioCapabilities&) const = default;
};

// Used when the daemon cannot describe the rig.
RadioCapabilities default_capabilities();

// One method per control primitive. Every call is a single round trip to
// the daemon and never retries; retry and health policy belong to the caller.
// The read_* methods return a partial RadioState carrying only the fields
// that read produced.
class IRadioAdapter {
public:
    virtual ~IRadioAdapter() = default;

    virtual std::string id() const = 0;

    virtual common::CommandResult connect(const common::Endpoint& endpoint) = 0;
    virtual void disconnect() = 0;

    virtual common::Outcome<common::RadioState> read_frequency() = 0;
    virtual common::Outcome<common::RadioState> read_mode() = 0;
    virtual common::Outcome<common::RadioState> read_power() = 0;
    virtual common::Outcome<common::RadioState> read_ptt() = 0;
    virtual common::Outcome<common::RadioState> read_info() = 0;
    virtual common::Outcome<common::RadioState> read_vfo() = 0;

    virtual common::CommandResult set_frequency(double hz) = 0;
    virtual common::CommandResult set_mode(common::RadioMode mode, std::optional<double> bandwidth_hz) = 0;
    virtual common::CommandResult set_power(double percent) = 0;
    virtual common::CommandResult set_ptt(bool enabled) = 0;

    virtual common::Outcome<RadioCapabilities> get_capabilities() = 0;
};

using AdapterPtr = std::unique_ptr<IRadioAdapter>;

}  // namespace rcb::adapter
