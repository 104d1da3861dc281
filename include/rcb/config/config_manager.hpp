#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <string>

namespace rcb::config {

struct RadioConfig {
    std::string id{"rig-1"};
    std::string adapter{"rigctld"};
    std::string host{"127.0.0.1"};
    std::uint16_t port{4532};
    bool auto_connect{true};
};

struct RigctldConfig {
    std::chrono::milliseconds connect_timeout{std::chrono::seconds{3}};
    std::chrono::milliseconds command_timeout{std::chrono::seconds{3}};
    std::chrono::milliseconds reconnect_initial{std::chrono::seconds{1}};
    std::chrono::milliseconds reconnect_max{std::chrono::seconds{15}};
    double reconnect_multiplier{1.5};
};

struct SessionConfig {
    std::chrono::milliseconds command_timeout{std::chrono::seconds{5}};
    std::chrono::milliseconds poll_interval{std::chrono::seconds{1}};
    bool auto_poll{true};
    // Consecutive link failures before the session is torn down; 0 disables.
    std::size_t failure_threshold{5};
    std::size_t max_pending_commands{16};
    std::size_t worker_threads{4};
};

struct TelemetryConfig {
    std::size_t event_buffer_size{512};
    std::chrono::seconds event_retention{std::chrono::hours{1}};
};

struct LoggingConfig {
    std::string level{"info"};
    std::string pattern{"[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] %v"};
    std::string file;
    std::size_t max_file_size{5 * 1024 * 1024};
    std::size_t max_files{3};
};

struct Configuration {
    std::string container_id{"radio-control-bridge"};
    std::string deployment{"development"};
    RadioConfig radio;
    RigctldConfig rigctld;
    SessionConfig session;
    TelemetryConfig telemetry;
    LoggingConfig logging;
};

class ConfigManager {
public:
    explicit ConfigManager(std::filesystem::path path);

    const Configuration& get() const noexcept { return config_; }
    const std::filesystem::path& path() const noexcept { return path_; }

    // Throws std::runtime_error on malformed documents or invalid values.
    static Configuration parse(const std::string& document);

private:
    std::filesystem::path path_;
    Configuration config_;

    static Configuration load_from_file(const std::filesystem::path& path);
};

// "250ms", "5s", "2m", "1h"; a bare number is taken as seconds.
std::chrono::milliseconds parse_duration(const std::string& value);

}  // namespace rcb::config
