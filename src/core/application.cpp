#include "rcb/core/application.hpp"

#include "rcb/adapter/adapter_factory.hpp"
#include "rcb/audit/audit_logger.hpp"
#include "rcb/core/logging.hpp"
#include "rcb/session/session_manager.hpp"
#include "rcb/telemetry/telemetry_hub.hpp"

#include <spdlog/spdlog.h>

#include <utility>

namespace rcb::core {

Application::Application(asio::io_context& io, std::filesystem::path config_path)
    : io_(io)
    , config_manager_(std::move(config_path)) {
    const auto& cfg = config_manager_.get();
    configure_logging(cfg.logging);
    spdlog::info("[Application] configuration loaded from {}", config_manager_.path().string());

    audit_ = std::make_unique<audit::AuditLogger>(cfg.container_id);
    session_ = std::make_unique<session::SessionManager>(
        io_, adapter::make_adapter(cfg.radio, cfg.rigctld), cfg.session, *audit_);
    telemetry_ = std::make_unique<telemetry::TelemetryHub>(session_->event_bus(), cfg.telemetry, cfg.radio.id);
}

// The hub unsubscribes from the session's bus, so it goes first.
Application::~Application() {
    telemetry_.reset();
    session_.reset();
}

void Application::start() {
    const auto& cfg = config_manager_.get();
    telemetry_->publish_ready(cfg.container_id, cfg.deployment);

    if (!cfg.radio.auto_connect) {
        spdlog::info("[Application] auto_connect disabled, waiting for a connect request");
        return;
    }

    const auto result = session_->connect(cfg.radio.host, cfg.radio.port);
    if (!result.ok()) {
        // The rig may simply be powered off; the session stays usable.
        spdlog::warn("[Application] initial connect to {}:{} failed: {}",
                     cfg.radio.host, cfg.radio.port, result.message);
    }
}

void Application::stop() {
    if (session_) {
        session_->disconnect();
    }
    io_.stop();
}

}  // namespace rcb::core
