#pragma once

#include "rcb/common/types.hpp"
#include <nlohmann/json.hpp>
#include <string>

namespace rcb::audit {

struct AuditRecord {
    std::string actor;
    std::string action;
    std::string radio_id;
    nlohmann::json parameters;
    common::CommandResultCode result{common::CommandResultCode::Ok};
    std::string message;
};

class AuditLogger {
public:
    explicit AuditLogger(std::string default_actor = "local");

    // Fills in the default actor when the record carries none.
    void record(AuditRecord record) const;

    const std::string& default_actor() const noexcept { return default_actor_; }

private:
    std::string default_actor_;
};

}  // namespace rcb::audit
