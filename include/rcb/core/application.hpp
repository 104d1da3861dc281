#pragma once

#include "rcb/config/config_manager.hpp"
#include <asio/io_context.hpp>
#include <filesystem>
#include <memory>

namespace rcb::audit {
class AuditLogger;
}  // namespace rcb::audit

namespace rcb::session {
class SessionManager;
}  // namespace rcb::session

namespace rcb::telemetry {
class TelemetryHub;
}  // namespace rcb::telemetry

namespace rcb::core {

class Application {
public:
    Application(asio::io_context& io, std::filesystem::path config_path);
    ~Application();

    Application(const Application&) = delete;
    Application& operator=(const Application&) = delete;

    void start();
    void stop();

    const config::Configuration& config() const noexcept { return config_manager_.get(); }
    session::SessionManager& session() noexcept { return *session_; }
    telemetry::TelemetryHub& telemetry() noexcept { return *telemetry_; }

private:
    asio::io_context& io_;
    config::ConfigManager config_manager_;
    std::unique_ptr<audit::AuditLogger> audit_;
    std::unique_ptr<session::SessionManager> session_;
    std::unique_ptr<telemetry::TelemetryHub> telemetry_;
};

}  // namespace rcb::core
