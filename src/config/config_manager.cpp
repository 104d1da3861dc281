#include "rcb/config/config_manager.hpp"

#include <yaml-cpp/yaml.h>

#include <array>
#include <algorithm>
#include <cctype>
#include <stdexcept>

namespace rcb::config {

namespace {

constexpr std::array<const char*, 2> kAdapters{"rigctld", "simulator"};
constexpr std::array<const char*, 7> kLogLevels{"trace", "debug", "info", "warn", "error", "critical", "off"};

std::chrono::milliseconds positive_duration(const YAML::Node& node, const std::string& key,
                                            std::chrono::milliseconds fallback) {
    if (!node[key]) {
        return fallback;
    }
    const auto value = parse_duration(node[key].as<std::string>());
    if (value.count() <= 0) {
        throw std::runtime_error("Duration for '" + key + "' must be positive");
    }
    return value;
}

template <typename T>
T positive_number(const YAML::Node& node, const std::string& key, T fallback) {
    if (!node[key]) {
        return fallback;
    }
    const auto value = node[key].as<T>();
    if (value <= T{0}) {
        throw std::runtime_error("Value for '" + key + "' must be positive");
    }
    return value;
}

RadioConfig parse_radio(const YAML::Node& node) {
    RadioConfig radio;
    if (!node) {
        return radio;
    }

    radio.id = node["id"].as<std::string>(radio.id);
    radio.adapter = node["adapter"].as<std::string>(radio.adapter);
    radio.host = node["host"].as<std::string>(radio.host);
    radio.auto_connect = node["auto_connect"].as<bool>(radio.auto_connect);
    if (const auto port = node["port"]) {
        const auto value = port.as<int>();
        if (value <= 0 || value > 65535) {
            throw std::runtime_error("radio.port out of range: " + std::to_string(value));
        }
        radio.port = static_cast<std::uint16_t>(value);
    }

    if (std::find(kAdapters.begin(), kAdapters.end(), radio.adapter) == kAdapters.end()) {
        throw std::runtime_error("Unsupported adapter type '" + radio.adapter + "'");
    }
    if (radio.id.empty() || radio.host.empty()) {
        throw std::runtime_error("radio entries require 'id' and 'host'");
    }
    return radio;
}

RigctldConfig parse_rigctld(const YAML::Node& node) {
    RigctldConfig rigctld;
    if (!node) {
        return rigctld;
    }

    rigctld.connect_timeout = positive_duration(node, "connect_timeout", rigctld.connect_timeout);
    rigctld.command_timeout = positive_duration(node, "command_timeout", rigctld.command_timeout);
    rigctld.reconnect_initial = positive_duration(node, "reconnect_initial", rigctld.reconnect_initial);
    rigctld.reconnect_max = positive_duration(node, "reconnect_max", rigctld.reconnect_max);
    rigctld.reconnect_multiplier = node["reconnect_multiplier"].as<double>(rigctld.reconnect_multiplier);
    if (rigctld.reconnect_multiplier < 1.0) {
        throw std::runtime_error("rigctld.reconnect_multiplier must be at least 1.0");
    }
    if (rigctld.reconnect_max < rigctld.reconnect_initial) {
        throw std::runtime_error("rigctld.reconnect_max must not be below reconnect_initial");
    }
    return rigctld;
}

SessionConfig parse_session(const YAML::Node& node) {
    SessionConfig session;
    if (!node) {
        return session;
    }

    session.command_timeout = positive_duration(node, "command_timeout", session.command_timeout);
    session.poll_interval = positive_duration(node, "poll_interval", session.poll_interval);
    session.auto_poll = node["auto_poll"].as<bool>(session.auto_poll);
    session.failure_threshold = node["failure_threshold"].as<std::size_t>(session.failure_threshold);
    session.max_pending_commands =
        positive_number<std::size_t>(node, "max_pending_commands", session.max_pending_commands);
    session.worker_threads = positive_number<std::size_t>(node, "worker_threads", session.worker_threads);
    return session;
}

TelemetryConfig parse_telemetry(const YAML::Node& node) {
    TelemetryConfig telemetry;
    if (!node) {
        return telemetry;
    }

    telemetry.event_buffer_size =
        positive_number<std::size_t>(node, "event_buffer_size", telemetry.event_buffer_size);
    telemetry.event_retention = std::chrono::duration_cast<std::chrono::seconds>(
        positive_duration(node, "event_retention", telemetry.event_retention));
    return telemetry;
}

LoggingConfig parse_logging(const YAML::Node& node) {
    LoggingConfig logging;
    if (!node) {
        return logging;
    }

    logging.level = node["level"].as<std::string>(logging.level);
    logging.pattern = node["pattern"].as<std::string>(logging.pattern);
    logging.file = node["file"].as<std::string>(logging.file);
    logging.max_file_size = positive_number<std::size_t>(node, "max_file_size", logging.max_file_size);
    logging.max_files = positive_number<std::size_t>(node, "max_files", logging.max_files);

    if (std::find(kLogLevels.begin(), kLogLevels.end(), logging.level) == kLogLevels.end()) {
        throw std::runtime_error("Unknown log level '" + logging.level + "'");
    }
    return logging;
}

Configuration parse_root(const YAML::Node& root) {
    Configuration config;
    if (!root || root.IsNull()) {
        return config;
    }
    if (!root.IsMap()) {
        throw std::runtime_error("Configuration root must be a mapping");
    }

    if (const auto container = root["container"]) {
        config.container_id = container["id"].as<std::string>(config.container_id);
        config.deployment = container["deployment"].as<std::string>(config.deployment);
    }

    config.radio = parse_radio(root["radio"]);
    config.rigctld = parse_rigctld(root["rigctld"]);
    config.session = parse_session(root["session"]);
    config.telemetry = parse_telemetry(root["telemetry"]);
    config.logging = parse_logging(root["logging"]);
    return config;
}

}  // namespace

std::chrono::milliseconds parse_duration(const std::string& value) {
    if (value.empty()) {
        throw std::invalid_argument("Empty duration");
    }

    std::string number_part = value;
    std::string suffix;
    while (!number_part.empty() && std::isalpha(static_cast<unsigned char>(number_part.back()))) {
        suffix.insert(suffix.begin(), static_cast<char>(std::tolower(static_cast<unsigned char>(number_part.back()))));
        number_part.pop_back();
    }

    std::size_t consumed = 0;
    const double numeric = std::stod(number_part, &consumed);
    if (consumed != number_part.size()) {
        throw std::invalid_argument("Malformed duration: " + value);
    }

    if (suffix.empty() || suffix == "s") {
        return std::chrono::milliseconds{static_cast<std::int64_t>(numeric * 1000.0)};
    }
    if (suffix == "ms") {
        return std::chrono::milliseconds{static_cast<std::int64_t>(numeric)};
    }
    if (suffix == "m") {
        return std::chrono::milliseconds{static_cast<std::int64_t>(numeric * 60'000.0)};
    }
    if (suffix == "h") {
        return std::chrono::milliseconds{static_cast<std::int64_t>(numeric * 3'600'000.0)};
    }
    throw std::invalid_argument("Unsupported duration suffix: " + suffix);
}

ConfigManager::ConfigManager(std::filesystem::path path)
    : path_(std::move(path))
    , config_(load_from_file(path_)) {}

Configuration ConfigManager::parse(const std::string& document) {
    try {
        return parse_root(YAML::Load(document));
    } catch (const YAML::Exception& e) {
        throw std::runtime_error(std::string{"Failed to parse configuration: "} + e.what());
    } catch (const std::logic_error& e) {
        throw std::runtime_error(std::string{"Invalid configuration value: "} + e.what());
    }
}

Configuration ConfigManager::load_from_file(const std::filesystem::path& path) {
    if (!std::filesystem::exists(path)) {
        throw std::runtime_error("Config file not found: " + path.string());
    }

    try {
        return parse_root(YAML::LoadFile(path.string()));
    } catch (const YAML::Exception& e) {
        throw std::runtime_error("Failed to parse " + path.string() + ": " + e.what());
    } catch (const std::logic_error& e) {
        throw std::runtime_error("Invalid value in " + path.string() + ": " + e.what());
    }
}

}  // namespace rcb::config
