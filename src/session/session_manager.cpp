#include "rcb/session/session_manager.hpp"

#include "rcb/audit/audit_logger.hpp"

#include <asio/post.hpp>
#include <spdlog/fmt/fmt.h>
#include <spdlog/spdlog.h>

#include <cmath>
#include <stdexcept>
#include <type_traits>
#include <utility>

namespace rcb::session {

using common::CommandResult;
using common::CommandResultCode;
using common::ConnectionLifecycle;
using common::Outcome;
using common::RadioState;

namespace {

constexpr std::size_t kControlThreads = 2;

template <typename Result>
Result failed(CommandResult result) {
    if constexpr (std::is_same_v<Result, CommandResult>) {
        return result;
    } else {
        return Result::failure(std::move(result));
    }
}

// Copies every field the partial read produced.
void overlay(RadioState& target, const RadioState& partial) {
    if (partial.frequency_hz) {
        target.frequency_hz = partial.frequency_hz;
    }
    if (partial.mode) {
        target.mode = partial.mode;
    }
    if (partial.bandwidth_hz) {
        target.bandwidth_hz = partial.bandwidth_hz;
    }
    if (partial.power_percent) {
        target.power_percent = partial.power_percent;
    }
    if (partial.ptt) {
        target.ptt = partial.ptt;
    }
    if (partial.model) {
        target.model = partial.model;
    }
    if (partial.vfo) {
        target.vfo = partial.vfo;
    }
}

}  // namespace

template <typename Fn>
auto SessionManager::guarded(Fn fn) {
    return [guard = std::weak_ptr<LifetimeGuard>(lifetime_), fn = std::move(fn)](auto&&... args) mutable {
        auto alive = guard.lock();
        if (!alive) {
            return;
        }
        std::lock_guard<std::mutex> lock(alive->mutex);
        if (!alive->active) {
            return;
        }
        fn(std::forward<decltype(args)>(args)...);
    };
}

SessionManager::SessionManager(asio::io_context& io,
                               adapter::AdapterPtr adapter,
                               const config::SessionConfig& config,
                               audit::AuditLogger& audit)
    : io_(io)
    , adapter_(std::move(adapter))
    , config_(config)
    , audit_(audit)
    , lifetime_(std::make_shared<LifetimeGuard>())
    , poll_timer_(io)
    , io_pool_(config.worker_threads)
    , control_pool_(kControlThreads) {
    if (!adapter_) {
        throw std::invalid_argument("SessionManager requires an adapter");
    }
}

SessionManager::~SessionManager() {
    {
        std::lock_guard<std::mutex> lock(lifetime_->mutex);
        lifetime_->active = false;
    }
    teardown("session manager shutting down");
    control_pool_.join();
    io_pool_.join();
}

// ---------------------------------------------------------------------------
// Adapter execution

template <typename Result, typename Call>
std::future<Result> SessionManager::submit(std::uint64_t epoch, std::string_view primitive, Call call) {
    auto promise = std::make_shared<std::promise<Result>>();
    auto future = promise->get_future();

    std::uint64_t id = 0;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (tearing_down_ || epoch != epoch_) {
            promise->set_value(failed<Result>(CommandResult::failure(
                CommandResultCode::NotConnected, fmt::format("{} issued outside the current session", primitive))));
            return future;
        }
        if (pending_.size() >= config_.max_pending_commands) {
            promise->set_value(failed<Result>(CommandResult::failure(
                CommandResultCode::Busy,
                fmt::format("{} rejected: {} commands already pending", primitive, pending_.size()))));
            return future;
        }
        id = next_pending_id_++;
        const auto now = std::chrono::steady_clock::now();
        pending_.emplace(id, PendingCommand{std::string{primitive}, now, now + config_.command_timeout});
    }

    asio::post(io_pool_, [this, id, epoch, promise, call = std::move(call), name = std::string{primitive}]() mutable {
        bool stale = false;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            stale = tearing_down_ || epoch != epoch_;
        }
        if (stale) {
            promise->set_value(failed<Result>(CommandResult::failure(
                CommandResultCode::NotConnected, name + " dropped, session ended before it ran")));
            release_pending(id);
            return;
        }
        try {
            promise->set_value(call());
        } catch (const std::exception& e) {
            spdlog::error("[SessionManager] {} threw: {}", name, e.what());
            promise->set_value(failed<Result>(
                CommandResult::failure(CommandResultCode::InternalError, name + " failed: " + e.what())));
        }
        release_pending(id);
    });
    return future;
}

template <typename Result>
Result SessionManager::await(std::future<Result>& future,
                             std::string_view primitive,
                             std::chrono::steady_clock::time_point deadline) {
    if (future.wait_until(deadline) != std::future_status::ready) {
        return failed<Result>(CommandResult::failure(
            CommandResultCode::CommandTimeout,
            fmt::format("{} timed out after {} ms", primitive, config_.command_timeout.count())));
    }
    return future.get();
}

template <typename Result, typename Call>
Result SessionManager::call_adapter(std::uint64_t epoch, std::string_view primitive, Call call) {
    const auto deadline = std::chrono::steady_clock::now() + config_.command_timeout;
    auto future = submit<Result>(epoch, primitive, std::move(call));
    return await(future, primitive, deadline);
}

void SessionManager::release_pending(std::uint64_t id) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        pending_.erase(id);
    }
    state_cv_.notify_all();
}

// ---------------------------------------------------------------------------
// Lifecycle

CommandResult SessionManager::connect(const std::string& host, std::uint16_t port) {
    return connect(common::Endpoint{.host = host, .port = port});
}

CommandResult SessionManager::connect(const common::Endpoint& endpoint) {
    auto result = open_session(endpoint);
    return audited("connect", {{"host", endpoint.host}, {"port", endpoint.port}}, std::move(result));
}

CommandResult SessionManager::disconnect() {
    return audited("disconnect", nlohmann::json::object(), teardown("disconnect requested"));
}

CommandResult SessionManager::open_session(const common::Endpoint& target) {
    bool replace = false;
    {
        std::unique_lock<std::mutex> lock(mutex_);
        state_cv_.wait(lock, [this] { return !tearing_down_; });
        if (lifecycle_ == ConnectionLifecycle::Connecting) {
            return CommandResult::failure(CommandResultCode::AlreadyConnecting,
                                          "connect to " + common::to_string(*endpoint_) + " already in progress");
        }
        if (active_locked() && endpoint_ == target) {
            return CommandResult::success();
        }
        replace = active_locked();
    }

    if (replace) {
        teardown("replaced by connection to " + common::to_string(target));
    }

    std::uint64_t epoch = 0;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (lifecycle_ != ConnectionLifecycle::Disconnected || tearing_down_) {
            return CommandResult::failure(CommandResultCode::AlreadyConnecting,
                                          "session changed while connecting to " + common::to_string(target));
        }
        lifecycle_ = ConnectionLifecycle::Connecting;
        endpoint_ = target;
        abort_connect_ = false;
        epoch = ++epoch_;
    }
    spdlog::info("[SessionManager] connecting to {}", common::to_string(target));

    auto linked = call_adapter<CommandResult>(epoch, "connect", [this, target] { return adapter_->connect(target); });
    if (!linked.ok()) {
        return fail_connect(target, std::move(linked));
    }

    auto fetched = call_adapter<Outcome<adapter::RadioCapabilities>>(
        epoch, "get_capabilities", [this] { return adapter_->get_capabilities(); });
    adapter::RadioCapabilities capabilities;
    if (fetched.ok()) {
        capabilities = std::move(fetched.value);
    } else {
        spdlog::warn("[SessionManager] capabilities unavailable ({}), using defaults", fetched.result.message);
        capabilities = adapter::default_capabilities();
    }

    std::uint64_t stamp = 0;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        stamp = ++clock_;
    }
    auto snapshot = read_snapshot(epoch, capabilities.has_level("RFPOWER"), !capabilities.vfos.empty());

    bool aborted = false;
    bool threshold_reached = false;
    std::uint64_t generation = 0;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (abort_connect_) {
            aborted = true;
        } else {
            lifecycle_ = ConnectionLifecycle::Connected;
            capabilities_ = std::move(capabilities);
            state_ = RadioState{};
            state_.connected = true;
            stamps_ = FieldStamps{};
            last_merge_stamp_ = 0;
            consecutive_failures_ = 0;
            last_error_.reset();
            bus_.enqueue(events::Connected{target});

            if (snapshot.ok()) {
                apply_refresh_locked(stamp, snapshot.value, true);
            } else {
                spdlog::warn("[SessionManager] initial refresh failed: {}", snapshot.result.message);
                threshold_reached = record_failure_locked(snapshot.result, true);
            }
            if (config_.auto_poll) {
                generation = begin_polling_locked(config_.poll_interval);
            }
        }
    }

    if (aborted) {
        return fail_connect(target, CommandResult::failure(CommandResultCode::ConnectionError,
                                                           "connection attempt aborted by disconnect"));
    }

    state_cv_.notify_all();
    bus_.dispatch();
    if (generation != 0) {
        asio::post(io_, guarded([this, generation] { arm_poll_timer(generation); }));
    }
    spdlog::info("[SessionManager] connected to {}", common::to_string(target));

    if (threshold_reached) {
        spdlog::error("[SessionManager] {} consecutive link failures, dropping session", config_.failure_threshold);
        teardown("failure threshold reached");
    }
    return CommandResult::success();
}

CommandResult SessionManager::fail_connect(const common::Endpoint& target, CommandResult failure) {
    if (failure.code != CommandResultCode::ConnectionError) {
        failure = CommandResult::failure(CommandResultCode::ConnectionError, std::move(failure.message));
    }

    {
        std::unique_lock<std::mutex> lock(mutex_);
        state_cv_.wait(lock, [this] { return pending_.empty(); });
    }
    adapter_->disconnect();

    {
        std::lock_guard<std::mutex> lock(mutex_);
        ++epoch_;
        lifecycle_ = ConnectionLifecycle::Disconnected;
        endpoint_.reset();
        capabilities_.reset();
        state_ = RadioState{};
        last_error_ = failure;
        bus_.enqueue(events::ConnectionFailed{target, failure.code, failure.message});
    }
    state_cv_.notify_all();
    bus_.dispatch();

    spdlog::warn("[SessionManager] connect to {} failed: {}", common::to_string(target), failure.message);
    return failure;
}

CommandResult SessionManager::teardown(const std::string& reason) {
    std::unique_lock<std::mutex> lock(mutex_);
    if (lifecycle_ == ConnectionLifecycle::Connecting) {
        abort_connect_ = true;
        state_cv_.wait(lock, [this] { return lifecycle_ != ConnectionLifecycle::Connecting; });
    }
    if (tearing_down_) {
        state_cv_.wait(lock, [this] { return !tearing_down_; });
        return CommandResult::success();
    }
    if (lifecycle_ == ConnectionLifecycle::Disconnected) {
        return CommandResult::success();
    }

    tearing_down_ = true;
    ++epoch_;
    const bool was_polling = polling_;
    polling_ = false;
    ++poll_generation_;

    lock.unlock();
    cancel_poll_timer();
    lock.lock();

    // In-flight adapter calls finish or time out on their own.
    state_cv_.wait(lock, [this] { return pending_.empty(); });

    lock.unlock();
    adapter_->disconnect();
    lock.lock();

    const auto endpoint = endpoint_;
    lifecycle_ = ConnectionLifecycle::Disconnected;
    endpoint_.reset();
    state_ = RadioState{};
    capabilities_.reset();
    stamps_ = FieldStamps{};
    last_merge_stamp_ = 0;
    consecutive_failures_ = 0;
    tearing_down_ = false;

    if (was_polling) {
        bus_.enqueue(events::PollingStopped{});
    }
    bus_.enqueue(events::Disconnected{endpoint, reason});
    lock.unlock();

    state_cv_.notify_all();
    bus_.dispatch();
    spdlog::info("[SessionManager] disconnected from {} ({})",
                 endpoint ? common::to_string(*endpoint) : std::string{"<none>"}, reason);
    return CommandResult::success();
}

bool SessionManager::active_locked() const noexcept {
    return lifecycle_ == ConnectionLifecycle::Connected || lifecycle_ == ConnectionLifecycle::Degraded;
}

// ---------------------------------------------------------------------------
// Writes

template <typename Call, typename Apply>
CommandResult SessionManager::write(std::string_view action,
                                    bool adapter::SupportFlags::*flag,
                                    Call call,
                                    Apply apply) {
    std::uint64_t epoch = 0;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!active_locked() || tearing_down_) {
            return CommandResult::failure(CommandResultCode::NotConnected,
                                          fmt::format("{} requires a connected radio", action));
        }
        if (capabilities_ && !(capabilities_->supports.*flag)) {
            return CommandResult::failure(CommandResultCode::Unsupported,
                                          fmt::format("radio does not support {}", action));
        }
        epoch = epoch_;
    }

    auto result = call_adapter<CommandResult>(epoch, action, std::move(call));

    bool reconcile = false;
    bool threshold_reached = false;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (epoch == epoch_ && active_locked()) {
            if (result.ok()) {
                apply(++clock_);
                reconcile = true;
            } else if (common::is_link_failure(result.code)) {
                threshold_reached = record_failure_locked(result, true);
            }
        }
    }
    bus_.dispatch();

    if (reconcile) {
        schedule_reconcile(epoch);
    }
    if (threshold_reached) {
        spdlog::error("[SessionManager] {} consecutive link failures, dropping session", config_.failure_threshold);
        teardown("failure threshold reached");
    }
    return result;
}

CommandResult SessionManager::set_frequency(double hz) {
    CommandResult result;
    if (!std::isfinite(hz) || hz <= 0.0) {
        result = CommandResult::failure(CommandResultCode::InvalidRange, fmt::format("frequency {} Hz is out of range", hz));
    } else {
        result = write(
            "set_frequency", &adapter::SupportFlags::set_frequency,
            [this, hz] { return adapter_->set_frequency(hz); },
            [this, hz](std::uint64_t stamp) {
                state_.frequency_hz = hz;
                stamps_.frequency = stamp;
                bus_.enqueue(events::FrequencyChanged{hz});
            });
    }
    return audited("set_frequency", {{"frequencyHz", hz}}, std::move(result));
}

CommandResult SessionManager::set_mode(common::RadioMode mode, std::optional<double> bandwidth_hz) {
    nlohmann::json parameters = {{"mode", common::to_string(mode)}};
    if (bandwidth_hz) {
        parameters["bandwidthHz"] = *bandwidth_hz;
    }

    CommandResult result;
    if (mode == common::RadioMode::Unknown) {
        result = CommandResult::failure(CommandResultCode::InvalidRange, "mode must be a known Hamlib mode");
    } else if (bandwidth_hz && (!std::isfinite(*bandwidth_hz) || *bandwidth_hz <= 0.0)) {
        result = CommandResult::failure(CommandResultCode::InvalidRange,
                                        fmt::format("bandwidth {} Hz is out of range", *bandwidth_hz));
    } else {
        result = write(
            "set_mode", &adapter::SupportFlags::set_mode,
            [this, mode, bandwidth_hz] { return adapter_->set_mode(mode, bandwidth_hz); },
            [this, mode, bandwidth_hz](std::uint64_t stamp) {
                state_.mode = mode;
                if (bandwidth_hz) {
                    state_.bandwidth_hz = bandwidth_hz;
                }
                stamps_.mode = stamp;
                bus_.enqueue(events::ModeChanged{mode, bandwidth_hz});
            });
    }
    return audited("set_mode", std::move(parameters), std::move(result));
}

CommandResult SessionManager::set_power(double percent) {
    CommandResult result;
    if (!std::isfinite(percent) || percent < 0.0 || percent > 100.0) {
        result = CommandResult::failure(CommandResultCode::InvalidRange,
                                        fmt::format("power {}% is outside 0-100", percent));
    } else {
        result = write(
            "set_power", &adapter::SupportFlags::set_power,
            [this, percent] { return adapter_->set_power(percent); },
            [this, percent](std::uint64_t stamp) {
                state_.power_percent = percent;
                stamps_.power = stamp;
                bus_.enqueue(events::PowerChanged{percent});
            });
    }
    return audited("set_power", {{"powerPercent", percent}}, std::move(result));
}

CommandResult SessionManager::set_ptt(bool enabled) {
    auto result = write(
        "set_ptt", &adapter::SupportFlags::set_ptt,
        [this, enabled] { return adapter_->set_ptt(enabled); },
        [this, enabled](std::uint64_t stamp) {
            state_.ptt = enabled;
            stamps_.ptt = stamp;
            bus_.enqueue(events::PttChanged{enabled});
        });
    return audited("set_ptt", {{"ptt", enabled}}, std::move(result));
}

CommandResult SessionManager::audited(std::string action, nlohmann::json parameters, CommandResult result) const {
    audit_.record(audit::AuditRecord{
        .actor = {},
        .action = std::move(action),
        .radio_id = adapter_->id(),
        .parameters = std::move(parameters),
        .result = result.code,
        .message = result.message
    });
    return result;
}

// ---------------------------------------------------------------------------
// Refresh

Outcome<RadioState> SessionManager::read_snapshot(std::uint64_t epoch, bool include_power, bool include_vfo) {
    using Read = Outcome<RadioState>;
    const auto deadline = std::chrono::steady_clock::now() + config_.command_timeout;

    std::vector<std::pair<std::string_view, std::future<Read>>> reads;
    reads.emplace_back("read_frequency", submit<Read>(epoch, "read_frequency", [this] { return adapter_->read_frequency(); }));
    reads.emplace_back("read_mode", submit<Read>(epoch, "read_mode", [this] { return adapter_->read_mode(); }));
    if (include_power) {
        reads.emplace_back("read_power", submit<Read>(epoch, "read_power", [this] { return adapter_->read_power(); }));
    }
    reads.emplace_back("read_ptt", submit<Read>(epoch, "read_ptt", [this] { return adapter_->read_ptt(); }));
    reads.emplace_back("read_info", submit<Read>(epoch, "read_info", [this] { return adapter_->read_info(); }));
    if (include_vfo) {
        reads.emplace_back("read_vfo", submit<Read>(epoch, "read_vfo", [this] { return adapter_->read_vfo(); }));
    }

    RadioState merged;
    for (auto& [primitive, future] : reads) {
        auto outcome = await(future, primitive, deadline);
        if (!outcome.ok()) {
            // Sibling results from this batch are dropped with it.
            return outcome;
        }
        overlay(merged, outcome.value);
    }
    return Read::success(std::move(merged));
}

void SessionManager::schedule_reconcile(std::uint64_t epoch) {
    asio::post(control_pool_, [this, epoch] { refresh(epoch, RefreshOrigin::Reconcile); });
}

void SessionManager::refresh(std::uint64_t epoch, RefreshOrigin origin) {
    const bool poll = origin == RefreshOrigin::Poll;
    std::uint64_t stamp = 0;
    bool include_power = true;
    bool include_vfo = false;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (epoch != epoch_ || !active_locked() || tearing_down_) {
            if (poll) {
                poll_refresh_outstanding_ = false;
            }
            return;
        }
        stamp = ++clock_;
        include_power = !capabilities_ || capabilities_->has_level("RFPOWER");
        include_vfo = capabilities_ && !capabilities_->vfos.empty();
    }

    auto snapshot = read_snapshot(epoch, include_power, include_vfo);

    bool threshold_reached = false;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        // Cleared by whichever cycle set it, so a restarted poller waits for it.
        if (poll) {
            poll_refresh_outstanding_ = false;
        }
        if (epoch == epoch_ && active_locked() && !tearing_down_) {
            if (snapshot.ok()) {
                apply_refresh_locked(stamp, snapshot.value, !poll);
                if (poll) {
                    ++completed_cycles_;
                }
            } else {
                threshold_reached = record_failure_locked(snapshot.result, true);
                if (poll) {
                    ++failed_cycles_;
                    bus_.enqueue(events::PollingError{snapshot.result.code, snapshot.result.message,
                                                      consecutive_failures_});
                }
            }
        }
    }
    bus_.dispatch();

    if (threshold_reached) {
        spdlog::error("[SessionManager] {} consecutive link failures, dropping session", config_.failure_threshold);
        teardown("failure threshold reached");
    }
}

bool SessionManager::apply_refresh_locked(std::uint64_t stamp, const RadioState& fresh, bool force_emit) {
    if (stamp < last_merge_stamp_) {
        spdlog::debug("[SessionManager] discarding refresh {} older than {}", stamp, last_merge_stamp_);
        return false;
    }

    RadioState next = state_;
    // A field written after this refresh was issued keeps its optimistic value.
    if (fresh.frequency_hz && stamps_.frequency < stamp) {
        next.frequency_hz = fresh.frequency_hz;
    }
    if (stamps_.mode < stamp) {
        if (fresh.mode) {
            next.mode = fresh.mode;
        }
        if (fresh.bandwidth_hz) {
            next.bandwidth_hz = fresh.bandwidth_hz;
        }
    }
    if (fresh.power_percent && stamps_.power < stamp) {
        next.power_percent = fresh.power_percent;
    }
    if (fresh.ptt && stamps_.ptt < stamp) {
        next.ptt = fresh.ptt;
    }
    if (fresh.model) {
        next.model = fresh.model;
    }
    if (fresh.vfo) {
        next.vfo = fresh.vfo;
    }
    next.connected = true;

    last_merge_stamp_ = stamp;
    consecutive_failures_ = 0;

    const bool recovered = lifecycle_ == ConnectionLifecycle::Degraded;
    if (recovered) {
        lifecycle_ = ConnectionLifecycle::Connected;
        spdlog::info("[SessionManager] session recovered");
    }

    const bool changed = next != state_;
    state_ = std::move(next);
    if (changed || recovered || force_emit) {
        bus_.enqueue(events::RadioStateChanged{state_});
    }
    return true;
}

bool SessionManager::record_failure_locked(const CommandResult& failure, bool degrade) {
    last_error_ = failure;
    if (common::is_link_failure(failure.code)) {
        ++consecutive_failures_;
    }
    if (degrade && lifecycle_ == ConnectionLifecycle::Connected) {
        lifecycle_ = ConnectionLifecycle::Degraded;
        spdlog::warn("[SessionManager] session degraded: {}", failure.message);
        bus_.enqueue(events::ConnectionDegraded{failure.code, failure.message});
    }
    return config_.failure_threshold > 0 && consecutive_failures_ >= config_.failure_threshold;
}

// ---------------------------------------------------------------------------
// Polling

CommandResult SessionManager::start_polling(std::chrono::milliseconds interval) {
    const nlohmann::json parameters = {{"intervalMs", interval.count()}};
    if (interval.count() <= 0) {
        return audited("start_polling", parameters,
                       CommandResult::failure(CommandResultCode::InvalidRange, "poll interval must be positive"));
    }

    std::uint64_t generation = 0;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!active_locked() || tearing_down_) {
            return audited("start_polling", parameters,
                           CommandResult::failure(CommandResultCode::NotConnected, "polling requires a connected radio"));
        }
        if (polling_) {
            return audited("start_polling", parameters, CommandResult::success());
        }
        generation = begin_polling_locked(interval);
    }

    bus_.dispatch();
    asio::post(io_, guarded([this, generation] { arm_poll_timer(generation); }));
    return audited("start_polling", parameters, CommandResult::success());
}

CommandResult SessionManager::stop_polling() {
    bool stopped = false;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (polling_) {
            polling_ = false;
            ++poll_generation_;
            bus_.enqueue(events::PollingStopped{});
            stopped = true;
        }
    }

    if (stopped) {
        cancel_poll_timer();
        bus_.dispatch();
        spdlog::info("[SessionManager] polling stopped");
    }
    return audited("stop_polling", nlohmann::json::object(), CommandResult::success());
}

std::uint64_t SessionManager::begin_polling_locked(std::chrono::milliseconds interval) {
    polling_ = true;
    poll_interval_ = interval;
    bus_.enqueue(events::PollingStarted{interval});
    spdlog::info("[SessionManager] polling every {} ms", interval.count());
    return ++poll_generation_;
}

// Timer members run on the io_context only.
void SessionManager::arm_poll_timer(std::uint64_t generation) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!polling_ || generation != poll_generation_) {
        return;
    }
    next_tick_ = std::chrono::steady_clock::now() + poll_interval_;
    schedule_tick_locked(generation);
}

void SessionManager::schedule_tick_locked(std::uint64_t generation) {
    poll_timer_.expires_at(next_tick_);
    poll_timer_.async_wait(guarded([this, generation](const std::error_code& ec) {
        if (!ec) {
            on_poll_tick(generation);
        }
    }));
}

void SessionManager::on_poll_tick(std::uint64_t generation) {
    std::uint64_t epoch = 0;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!polling_ || generation != poll_generation_) {
            return;
        }

        const auto now = std::chrono::steady_clock::now();
        next_tick_ += poll_interval_;
        if (next_tick_ <= now) {
            next_tick_ = now + poll_interval_;
        }
        schedule_tick_locked(generation);

        if (poll_refresh_outstanding_) {
            ++skipped_ticks_;
            spdlog::debug("[SessionManager] poll tick skipped, previous cycle still running");
            return;
        }
        poll_refresh_outstanding_ = true;
        epoch = epoch_;
    }

    asio::post(control_pool_, [this, epoch] { refresh(epoch, RefreshOrigin::Poll); });
}

void SessionManager::cancel_poll_timer() {
    asio::post(io_, guarded([this] { poll_timer_.cancel(); }));
}

// ---------------------------------------------------------------------------
// Queries

RadioState SessionManager::get_state() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return state_;
}

std::optional<adapter::RadioCapabilities> SessionManager::get_capabilities() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return capabilities_;
}

ConnectionLifecycle SessionManager::lifecycle() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return lifecycle_;
}

SessionMetrics SessionManager::metrics() const {
    std::lock_guard<std::mutex> lock(mutex_);
    SessionMetrics metrics;
    metrics.lifecycle = lifecycle_;
    metrics.endpoint = endpoint_;
    metrics.pending.reserve(pending_.size());
    for (const auto& [id, command] : pending_) {
        metrics.pending.push_back(command);
    }
    metrics.polling = polling_;
    metrics.poll_interval = poll_interval_;
    metrics.consecutive_failures = consecutive_failures_;
    metrics.skipped_ticks = skipped_ticks_;
    metrics.completed_cycles = completed_cycles_;
    metrics.failed_cycles = failed_cycles_;
    metrics.last_error = last_error_;
    return metrics;
}

}  // namespace rcb::session
