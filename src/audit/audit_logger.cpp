#include "rcb/audit/audit_logger.hpp"

#include <spdlog/spdlog.h>

#include <utility>

namespace rcb::audit {

AuditLogger::AuditLogger(std::string default_actor)
    : default_actor_(std::move(default_actor)) {}

void AuditLogger::record(AuditRecord record) const {
    if (record.actor.empty()) {
        record.actor = default_actor_;
    }

    nlohmann::json payload = {
        {"actor", record.actor},
        {"action", record.action},
        {"radioId", record.radio_id},
        {"result", common::to_string(record.result)},
        {"message", record.message},
        {"parameters", record.parameters.is_null() ? nlohmann::json::object() : record.parameters}
    };

    if (record.result == common::CommandResultCode::Ok) {
        spdlog::info("[AUDIT] {}", payload.dump());
    } else {
        spdlog::warn("[AUDIT] {}", payload.dump());
    }
}

}  // namespace rcb::audit
