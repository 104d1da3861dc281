#pragma once

#include "rcb/adapter/radio_adapter.hpp"
#include "rcb/common/types.hpp"
#include "rcb/config/config_manager.hpp"
#include "rcb/events/event_bus.hpp"
#include <asio/io_context.hpp>
#include <asio/steady_timer.hpp>
#include <asio/thread_pool.hpp>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <future>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace rcb::audit {
class AuditLogger;
}  // namespace rcb::audit

namespace rcb::session {

struct PendingCommand {
    std::string primitive;
    std::chrono::steady_clock::time_point issued_at;
    std::chrono::steady_clock::time_point deadline;
};

struct SessionMetrics {
    common::ConnectionLifecycle lifecycle{common::ConnectionLifecycle::Disconnected};
    std::optional<common::Endpoint> endpoint;
    std::vector<PendingCommand> pending;
    bool polling{false};
    std::chrono::milliseconds poll_interval{0};
    std::size_t consecutive_failures{0};
    std::uint64_t skipped_ticks{0};
    std::uint64_t completed_cycles{0};
    std::uint64_t failed_cycles{0};
    std::optional<common::CommandResult> last_error;
};

// Owns the single logical session to the rig-control daemon.
//
// Lifecycle: Disconnected -> Connecting -> Connected <-> Degraded, and back
// to Disconnected on disconnect(), a failed connect, or when consecutive link
// failures reach the configured threshold. RadioState::connected stays true
// while Degraded so that the last-known-good snapshot is served unchanged.
//
// Adapter calls run on an internal worker pool and are bounded by
// session.command_timeout; refreshes are orchestrated on a second pool and
// poll ticks are driven by a steady_timer on the supplied io_context. Events
// are delivered through event_bus() in the order the state changed.
class SessionManager {
public:
    SessionManager(asio::io_context& io,
                   adapter::AdapterPtr adapter,
                   const config::SessionConfig& config,
                   audit::AuditLogger& audit);
    ~SessionManager();

    SessionManager(const SessionManager&) = delete;
    SessionManager& operator=(const SessionManager&) = delete;

    events::EventBus& event_bus() noexcept { return bus_; }

    common::CommandResult connect(const std::string& host, std::uint16_t port);
    common::CommandResult connect(const common::Endpoint& endpoint);
    common::CommandResult disconnect();

    common::CommandResult set_frequency(double hz);
    common::CommandResult set_mode(common::RadioMode mode, std::optional<double> bandwidth_hz = std::nullopt);
    common::CommandResult set_power(double percent);
    common::CommandResult set_ptt(bool enabled);

    // Cached snapshot; never touches the adapter.
    common::RadioState get_state() const;
    std::optional<adapter::RadioCapabilities> get_capabilities() const;
    common::ConnectionLifecycle lifecycle() const;

    common::CommandResult start_polling(std::chrono::milliseconds interval);
    common::CommandResult stop_polling();

    SessionMetrics metrics() const;

private:
    struct FieldStamps {
        std::uint64_t frequency{0};
        std::uint64_t mode{0};
        std::uint64_t power{0};
        std::uint64_t ptt{0};
    };

    // Lets io_context handlers outlive the manager without touching it.
    struct LifetimeGuard {
        std::mutex mutex;
        bool active{true};
    };

    enum class RefreshOrigin { Poll, Reconcile };

    common::CommandResult open_session(const common::Endpoint& target);
    common::CommandResult fail_connect(const common::Endpoint& target, common::CommandResult failure);
    common::CommandResult teardown(const std::string& reason);

    template <typename Result, typename Call>
    std::future<Result> submit(std::uint64_t epoch, std::string_view primitive, Call call);

    template <typename Result>
    Result await(std::future<Result>& future, std::string_view primitive,
                 std::chrono::steady_clock::time_point deadline);

    template <typename Result, typename Call>
    Result call_adapter(std::uint64_t epoch, std::string_view primitive, Call call);

    template <typename Call, typename Apply>
    common::CommandResult write(std::string_view action, bool adapter::SupportFlags::*flag, Call call, Apply apply);
    common::CommandResult audited(std::string action, nlohmann::json parameters, common::CommandResult result) const;

    common::Outcome<common::RadioState> read_snapshot(std::uint64_t epoch, bool include_power, bool include_vfo);
    void refresh(std::uint64_t epoch, RefreshOrigin origin);
    void schedule_reconcile(std::uint64_t epoch);

    bool apply_refresh_locked(std::uint64_t stamp, const common::RadioState& fresh, bool force_emit);
    bool record_failure_locked(const common::CommandResult& failure, bool degrade);
    std::uint64_t begin_polling_locked(std::chrono::milliseconds interval);
    bool active_locked() const noexcept;

    void arm_poll_timer(std::uint64_t generation);
    void schedule_tick_locked(std::uint64_t generation);
    void on_poll_tick(std::uint64_t generation);
    void cancel_poll_timer();
    void release_pending(std::uint64_t id);

    template <typename Fn>
    auto guarded(Fn fn);

    asio::io_context& io_;
    adapter::AdapterPtr adapter_;
    config::SessionConfig config_;
    audit::AuditLogger& audit_;
    events::EventBus bus_;

    std::shared_ptr<LifetimeGuard> lifetime_;
    asio::steady_timer poll_timer_;

    mutable std::mutex mutex_;
    std::condition_variable state_cv_;

    common::ConnectionLifecycle lifecycle_{common::ConnectionLifecycle::Disconnected};
    std::optional<common::Endpoint> endpoint_;
    common::RadioState state_;
    std::optional<adapter::RadioCapabilities> capabilities_;
    std::uint64_t epoch_{0};
    std::uint64_t clock_{0};
    FieldStamps stamps_;
    std::uint64_t last_merge_stamp_{0};
    bool abort_connect_{false};
    bool tearing_down_{false};

    std::map<std::uint64_t, PendingCommand> pending_;
    std::uint64_t next_pending_id_{1};

    bool polling_{false};
    std::chrono::milliseconds poll_interval_{0};
    std::uint64_t poll_generation_{0};
    std::chrono::steady_clock::time_point next_tick_{};
    bool poll_refresh_outstanding_{false};

    std::size_t consecutive_failures_{0};
    std::uint64_t skipped_ticks_{0};
    std::uint64_t completed_cycles_{0};
    std::uint64_t failed_cycles_{0};
    std::optional<common::CommandResult> last_error_;

    // Declared last: joined in the destructor before the state above goes away.
    asio::thread_pool io_pool_;
    asio::thread_pool control_pool_;
};

}  // namespace rcb::session
