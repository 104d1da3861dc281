#pragma once

#include "rcb/config/config_manager.hpp"
#include "rcb/events/event_bus.hpp"
#include <nlohmann/json.hpp>
#include <chrono>
#include <cstdint>
#include <deque>
#include <functional>
#include <map>
#include <mutex>
#include <string>
#include <vector>

namespace rcb::telemetry {

using SinkId = std::uint64_t;

// Relays session events as tagged JSON records:
//   {"tag": "rcb.<event>", "sequence": n, "timestamp": "...Z", "payload": {...}}
// Recent records are retained (bounded by count and age) so a client that
// reconnects can resume from the last sequence it saw.
class TelemetryHub {
public:
    using Sink = std::function<void(const nlohmann::json&)>;

    TelemetryHub(events::EventBus& bus, const config::TelemetryConfig& config, std::string radio_id);
    ~TelemetryHub();

    TelemetryHub(const TelemetryHub&) = delete;
    TelemetryHub& operator=(const TelemetryHub&) = delete;

    void publish_ready(const std::string& container_id, const std::string& deployment);

    SinkId add_sink(Sink sink);
    bool remove_sink(SinkId id);

    std::vector<nlohmann::json> recent() const;
    std::vector<nlohmann::json> since(std::uint64_t sequence) const;
    std::uint64_t last_sequence() const;

private:
    struct Entry {
        std::chrono::steady_clock::time_point recorded_at;
        nlohmann::json record;
    };

    void on_event(const events::Event& event);
    void publish(std::string tag, nlohmann::json payload);
    void prune_locked(std::chrono::steady_clock::time_point now) const;

    events::EventBus& bus_;
    events::SubscriptionId subscription_{0};
    std::size_t capacity_;
    std::chrono::seconds retention_;
    std::string radio_id_;

    mutable std::mutex mutex_;
    mutable std::deque<Entry> buffer_;
    std::map<SinkId, Sink> sinks_;
    SinkId next_sink_id_{1};
    std::uint64_t sequence_{0};
};

}  // namespace rcb::telemetry
