#include "rcb/telemetry/telemetry_hub.hpp"

#include <spdlog/fmt/fmt.h>
#include <spdlog/spdlog.h>

#include <ctime>
#include <utility>

namespace rcb::telemetry {

namespace tags {
constexpr auto READY = "rcb.ready";
constexpr auto PREFIX = "rcb.";
}  // namespace tags

namespace {

std::string utc_now_iso8601_ms() {
    const auto now = std::chrono::system_clock::now();
    const auto seconds = std::chrono::system_clock::to_time_t(now);
    const auto millis =
        std::chrono::duration_cast<std::chrono::milliseconds>(now.time_since_epoch()).count() % 1000;

    std::tm utc{};
    gmtime_r(&seconds, &utc);
    char buffer[32];
    std::strftime(buffer, sizeof(buffer), "%Y-%m-%dT%H:%M:%S", &utc);
    return fmt::format("{}.{:03}Z", buffer, millis);
}

}  // namespace

TelemetryHub::TelemetryHub(events::EventBus& bus, const config::TelemetryConfig& config, std::string radio_id)
    : bus_(bus)
    , capacity_(config.event_buffer_size)
    , retention_(config.event_retention)
    , radio_id_(std::move(radio_id)) {
    subscription_ = bus_.subscribe([this](const events::Event& event) { on_event(event); });
}

TelemetryHub::~TelemetryHub() {
    bus_.unsubscribe(subscription_);
}

void TelemetryHub::publish_ready(const std::string& container_id, const std::string& deployment) {
    nlohmann::json payload = {
        {"containerId", container_id},
        {"deployment", deployment},
        {"status", "ready"}
    };
    publish(tags::READY, std::move(payload));
}

SinkId TelemetryHub::add_sink(Sink sink) {
    std::lock_guard<std::mutex> lock(mutex_);
    const auto id = next_sink_id_++;
    sinks_.emplace(id, std::move(sink));
    return id;
}

bool TelemetryHub::remove_sink(SinkId id) {
    std::lock_guard<std::mutex> lock(mutex_);
    return sinks_.erase(id) > 0;
}

std::vector<nlohmann::json> TelemetryHub::recent() const {
    return since(0);
}

std::vector<nlohmann::json> TelemetryHub::since(std::uint64_t sequence) const {
    std::lock_guard<std::mutex> lock(mutex_);
    prune_locked(std::chrono::steady_clock::now());

    std::vector<nlohmann::json> records;
    for (const auto& entry : buffer_) {
        if (entry.record.at("sequence").get<std::uint64_t>() > sequence) {
            records.push_back(entry.record);
        }
    }
    return records;
}

std::uint64_t TelemetryHub::last_sequence() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return sequence_;
}

void TelemetryHub::on_event(const events::Event& event) {
    auto payload = events::to_json(event);
    payload["radioId"] = radio_id_;
    publish(tags::PREFIX + std::string{events::event_name(event)}, std::move(payload));
}

void TelemetryHub::publish(std::string tag, nlohmann::json payload) {
    const auto now = std::chrono::steady_clock::now();
    nlohmann::json record;
    std::vector<Sink> targets;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        record = {
            {"tag", std::move(tag)},
            {"sequence", ++sequence_},
            {"timestamp", utc_now_iso8601_ms()},
            {"payload", std::move(payload)}
        };
        buffer_.push_back(Entry{now, record});
        while (buffer_.size() > capacity_) {
            buffer_.pop_front();
        }
        prune_locked(now);

        targets.reserve(sinks_.size());
        for (const auto& [id, sink] : sinks_) {
            targets.push_back(sink);
        }
    }

    spdlog::debug("[TelemetryHub] {}", record.dump());
    for (const auto& sink : targets) {
        try {
            sink(record);
        } catch (const std::exception& e) {
            spdlog::warn("[TelemetryHub] sink rejected {}: {}", record.at("tag").get<std::string>(), e.what());
        }
    }
}

void TelemetryHub::prune_locked(std::chrono::steady_clock::time_point now) const {
    while (!buffer_.empty() && now - buffer_.front().recorded_at > retention_) {
        buffer_.pop_front();
    }
}

}  // namespace rcb::telemetry
