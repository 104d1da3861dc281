#include "rcb/audit/audit_logger.hpp"
#include "rcb/session/session_manager.hpp"

#include "fake_adapter.hpp"

#include <asio/executor_work_guard.hpp>
#include <gtest/gtest.h>

#include <algorithm>
#include <cmath>
#include <functional>
#include <thread>

using namespace std::chrono_literals;

namespace {

using rcb::common::CommandResultCode;
using rcb::common::ConnectionLifecycle;
using rcb::common::RadioMode;
using rcb::common::RadioState;
using rcb::session::SessionManager;
using rcb::testing::FakeAdapter;
using rcb::testing::FakeRig;

bool eventually(const std::function<bool()>& condition, std::chrono::milliseconds timeout = 2s) {
    const auto deadline = std::chrono::steady_clock::now() + timeout;
    while (std::chrono::steady_clock::now() < deadline) {
        if (condition()) {
            return true;
        }
        std::this_thread::sleep_for(5ms);
    }
    return condition();
}

class EventRecorder {
public:
    void attach(rcb::events::EventBus& bus) {
        bus.subscribe([this](const rcb::events::Event& event) {
            std::lock_guard<std::mutex> lock(mutex_);
            events_.push_back(event);
        });
    }

    std::vector<rcb::events::Event> events() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return events_;
    }

    std::vector<std::string> names() const {
        std::vector<std::string> result;
        for (const auto& event : events()) {
            result.emplace_back(rcb::events::event_name(event));
        }
        return result;
    }

    std::size_t count(std::string_view name) const {
        const auto all = names();
        return static_cast<std::size_t>(std::count(all.begin(), all.end(), name));
    }

    template <typename T>
    std::vector<T> of() const {
        std::vector<T> result;
        for (const auto& event : events()) {
            if (const auto* payload = std::get_if<T>(&event)) {
                result.push_back(*payload);
            }
        }
        return result;
    }

    void clear() {
        std::lock_guard<std::mutex> lock(mutex_);
        events_.clear();
    }

private:
    mutable std::mutex mutex_;
    std::vector<rcb::events::Event> events_;
};

rcb::config::SessionConfig fast_config() {
    rcb::config::SessionConfig config;
    config.command_timeout = 500ms;
    config.poll_interval = 40ms;
    config.auto_poll = false;
    config.failure_threshold = 0;
    config.max_pending_commands = 16;
    config.worker_threads = 8;
    return config;
}

class SessionManagerTest : public ::testing::Test {
protected:
    void SetUp() override {
        runner_ = std::thread([this] { io_.run(); });
    }

    void TearDown() override {
        rig_->release_all();
        session_.reset();
        work_.reset();
        io_.stop();
        runner_.join();
    }

    SessionManager& start(rcb::config::SessionConfig config = fast_config()) {
        session_ = std::make_unique<SessionManager>(io_, std::make_unique<FakeAdapter>(rig_), config, audit_);
        recorder_.attach(session_->event_bus());
        return *session_;
    }

    asio::io_context io_;
    asio::executor_work_guard<asio::io_context::executor_type> work_{asio::make_work_guard(io_)};
    std::thread runner_;
    std::shared_ptr<FakeRig> rig_ = std::make_shared<FakeRig>();
    rcb::audit::AuditLogger audit_{"test"};
    EventRecorder recorder_;
    std::unique_ptr<SessionManager> session_;
};

TEST_F(SessionManagerTest, StateBeforeAnyConnectionIsDisconnectedSnapshot) {
    auto& session = start();

    EXPECT_EQ(session.get_state(), RadioState{});
    EXPECT_FALSE(session.get_state().connected);
    EXPECT_EQ(session.lifecycle(), ConnectionLifecycle::Disconnected);
    EXPECT_FALSE(session.get_capabilities().has_value());
    EXPECT_EQ(rig_->total_calls(), 0);
}

TEST_F(SessionManagerTest, ConnectRefreshesBeforeDeclaringConnected) {
    auto& session = start();

    const auto result = session.connect("127.0.0.1", 4532);

    ASSERT_TRUE(result.ok()) << result.message;
    const auto state = session.get_state();
    EXPECT_TRUE(state.connected);
    EXPECT_EQ(state.frequency_hz, 14200000.0);
    EXPECT_EQ(state.mode, RadioMode::USB);
    EXPECT_EQ(state.model, "Fake FT-991A");
    EXPECT_EQ(state.vfo, "VFOA");
    EXPECT_EQ(session.lifecycle(), ConnectionLifecycle::Connected);
    ASSERT_TRUE(session.get_capabilities().has_value());
    EXPECT_EQ(session.get_capabilities()->model, "Fake FT-991A");
    EXPECT_EQ(rig_->calls("get_capabilities"), 1);
    EXPECT_EQ(rig_->calls("read_frequency"), 1);
    EXPECT_EQ(rig_->calls("read_power"), 1);
    EXPECT_EQ(rig_->calls("read_vfo"), 1);
    EXPECT_EQ(recorder_.names(), (std::vector<std::string>{"connected", "radioState"}));
}

TEST_F(SessionManagerTest, FailedConnectEmitsConnectionFailedAndStaysDisconnected) {
    auto& session = start();
    rig_->fail("connect", CommandResultCode::ConnectionError, "connection refused");

    const auto result = session.connect("10.0.0.7", 4533);

    EXPECT_EQ(result.code, CommandResultCode::ConnectionError);
    EXPECT_EQ(session.lifecycle(), ConnectionLifecycle::Disconnected);
    EXPECT_EQ(session.get_state(), RadioState{});
    EXPECT_FALSE(session.get_capabilities().has_value());

    const auto failures = recorder_.of<rcb::events::ConnectionFailed>();
    ASSERT_EQ(failures.size(), 1u);
    EXPECT_EQ(failures[0].endpoint.host, "10.0.0.7");
    EXPECT_EQ(failures[0].endpoint.port, 4533);
    EXPECT_EQ(failures[0].reason, "connection refused");
    EXPECT_EQ(recorder_.names(), (std::vector<std::string>{"connectionFailed"}));
}

TEST_F(SessionManagerTest, WriteWhileDisconnectedFailsWithoutAdapterCall) {
    auto& session = start();

    const auto result = session.set_frequency(7150000.0);

    EXPECT_EQ(result.code, CommandResultCode::NotConnected);
    EXPECT_EQ(rig_->total_calls(), 0);
}

TEST_F(SessionManagerTest, SetFrequencyIsVisibleBeforeReconcileCompletes) {
    auto& session = start();
    ASSERT_TRUE(session.connect("127.0.0.1", 4532).ok());
    recorder_.clear();
    rig_->block("read_frequency");

    const auto result = session.set_frequency(7150000.0);

    ASSERT_TRUE(result.ok()) << result.message;
    EXPECT_EQ(session.get_state().frequency_hz, 7150000.0);
    ASSERT_TRUE(rig_->wait_for_parked("read_frequency"));
    EXPECT_EQ(recorder_.names(), (std::vector<std::string>{"frequencyChanged"}));
    EXPECT_EQ(recorder_.of<rcb::events::FrequencyChanged>().front().frequency_hz, 7150000.0);

    rig_->release("read_frequency");
    ASSERT_TRUE(eventually([&] { return recorder_.count("radioState") == 1; }));
    EXPECT_EQ(recorder_.names(), (std::vector<std::string>{"frequencyChanged", "radioState"}));
    EXPECT_EQ(recorder_.of<rcb::events::RadioStateChanged>().front().state.frequency_hz, 7150000.0);
}

TEST_F(SessionManagerTest, ReconcileCorrectsSilentlyIgnoredWrite) {
    auto& session = start();
    ASSERT_TRUE(session.connect("127.0.0.1", 4532).ok());
    rig_->ignore("set_power");

    ASSERT_TRUE(session.set_power(80.0).ok());

    EXPECT_EQ(recorder_.of<rcb::events::PowerChanged>().front().power_percent, 80.0);
    ASSERT_TRUE(eventually([&] { return recorder_.count("radioState") == 2; }));
    EXPECT_EQ(session.get_state().power_percent, 50.0);
    EXPECT_EQ(recorder_.of<rcb::events::RadioStateChanged>().back().state.power_percent, 50.0);
}

TEST_F(SessionManagerTest, StaleRefreshDoesNotOverwriteNewerWrite) {
    auto config = fast_config();
    config.command_timeout = 2s;
    auto& session = start(config);
    ASSERT_TRUE(session.connect("127.0.0.1", 4532).ok());
    const int reads_before = rig_->calls("read_frequency");
    rig_->block("read_frequency");

    ASSERT_TRUE(session.set_frequency(7000000.0).ok());
    ASSERT_TRUE(rig_->wait_for_parked("read_frequency", 1));
    ASSERT_TRUE(session.set_frequency(7100000.0).ok());
    ASSERT_TRUE(rig_->wait_for_parked("read_frequency", 2));
    recorder_.clear();

    rig_->release("read_frequency");
    ASSERT_TRUE(eventually([&] {
        return rig_->calls("read_frequency") == reads_before + 2 && session.metrics().pending.empty() &&
               recorder_.count("radioState") >= 1;
    }));
    std::this_thread::sleep_for(100ms);

    EXPECT_EQ(session.get_state().frequency_hz, 7100000.0);
    for (const auto& update : recorder_.of<rcb::events::RadioStateChanged>()) {
        EXPECT_EQ(update.state.frequency_hz, 7100000.0);
    }
}

TEST_F(SessionManagerTest, PollTimeoutDegradesAndKeepsSnapshot) {
    auto config = fast_config();
    config.command_timeout = 150ms;
    auto& session = start(config);
    ASSERT_TRUE(session.connect("127.0.0.1", 4532).ok());
    const auto snapshot = session.get_state();
    rig_->block("read_mode");

    ASSERT_TRUE(session.start_polling(40ms).ok());
    ASSERT_TRUE(eventually([&] { return session.lifecycle() == ConnectionLifecycle::Degraded; }));

    EXPECT_EQ(session.get_state(), snapshot);
    EXPECT_TRUE(session.get_state().connected);
    ASSERT_TRUE(eventually([&] { return recorder_.count("pollingError") >= 1; }));
    const auto degraded = recorder_.of<rcb::events::ConnectionDegraded>();
    ASSERT_EQ(degraded.size(), 1u);
    EXPECT_EQ(degraded[0].code, CommandResultCode::CommandTimeout);
    EXPECT_TRUE(session.get_capabilities().has_value());
}

TEST_F(SessionManagerTest, FailedCycleLeavesWholeSnapshotUntouched) {
    auto& session = start();
    ASSERT_TRUE(session.connect("127.0.0.1", 4532).ok());
    const auto snapshot = session.get_state();
    rig_->update([](RadioState& state) {
        state.frequency_hz = 7000000.0;
        state.vfo = "VFOB";
    });
    rig_->fail("read_mode", CommandResultCode::TransportError, "link down");

    ASSERT_TRUE(session.start_polling(30ms).ok());
    ASSERT_TRUE(eventually([&] { return session.lifecycle() == ConnectionLifecycle::Degraded; }));
    ASSERT_TRUE(session.stop_polling().ok());

    // read_frequency succeeded in the same cycle but its value is not merged.
    EXPECT_GE(rig_->calls("read_frequency"), 2);
    EXPECT_EQ(session.get_state(), snapshot);
    EXPECT_EQ(session.get_state().frequency_hz, 14200000.0);
    EXPECT_EQ(session.get_state().vfo, "VFOA");
}

TEST_F(SessionManagerTest, NextSuccessfulCycleRecoversFromDegraded) {
    auto& session = start();
    ASSERT_TRUE(session.connect("127.0.0.1", 4532).ok());
    rig_->fail("read_ptt", CommandResultCode::TransportError, "link down");

    ASSERT_TRUE(session.start_polling(30ms).ok());
    ASSERT_TRUE(eventually([&] { return session.lifecycle() == ConnectionLifecycle::Degraded; }));
    recorder_.clear();

    rig_->heal("read_ptt");
    ASSERT_TRUE(eventually([&] { return session.lifecycle() == ConnectionLifecycle::Connected; }));
    ASSERT_TRUE(eventually([&] { return recorder_.count("radioState") >= 1; }));
    EXPECT_EQ(session.metrics().consecutive_failures, 0u);
    EXPECT_EQ(recorder_.count("connectionDegraded"), 0u);
}

TEST_F(SessionManagerTest, TickIsSkippedWhilePreviousCycleOutstanding) {
    auto config = fast_config();
    config.command_timeout = 2s;
    auto& session = start(config);
    ASSERT_TRUE(session.connect("127.0.0.1", 4532).ok());
    const int reads_before = rig_->calls("read_frequency");
    rig_->block("read_frequency");

    ASSERT_TRUE(session.start_polling(20ms).ok());
    ASSERT_TRUE(rig_->wait_for_parked("read_frequency"));
    std::this_thread::sleep_for(200ms);

    EXPECT_EQ(rig_->calls("read_frequency"), reads_before + 1);
    EXPECT_GE(session.metrics().skipped_ticks, 1u);
    rig_->release("read_frequency");
    ASSERT_TRUE(eventually([&] { return session.metrics().completed_cycles >= 1; }));
}

TEST_F(SessionManagerTest, RestartingPollingDoesNotOverlapOutstandingCycle) {
    auto config = fast_config();
    config.command_timeout = 2s;
    auto& session = start(config);
    ASSERT_TRUE(session.connect("127.0.0.1", 4532).ok());
    const int reads_before = rig_->calls("read_frequency");
    rig_->block("read_frequency");

    ASSERT_TRUE(session.start_polling(20ms).ok());
    ASSERT_TRUE(rig_->wait_for_parked("read_frequency"));
    ASSERT_TRUE(session.stop_polling().ok());
    ASSERT_TRUE(session.start_polling(20ms).ok());
    std::this_thread::sleep_for(200ms);

    EXPECT_EQ(rig_->calls("read_frequency"), reads_before + 1);
    EXPECT_GE(session.metrics().skipped_ticks, 1u);

    rig_->release("read_frequency");
    ASSERT_TRUE(eventually([&] { return session.metrics().completed_cycles >= 2; }));
    EXPECT_GT(rig_->calls("read_frequency"), reads_before + 1);
}

TEST_F(SessionManagerTest, DisconnectClearsStateAndAllowsCleanReconnect) {
    auto& session = start();
    ASSERT_TRUE(session.connect("127.0.0.1", 4532).ok());
    ASSERT_TRUE(session.start_polling(50ms).ok());
    recorder_.clear();

    ASSERT_TRUE(session.disconnect().ok());

    EXPECT_EQ(session.lifecycle(), ConnectionLifecycle::Disconnected);
    EXPECT_EQ(session.get_state(), RadioState{});
    EXPECT_FALSE(session.get_capabilities().has_value());
    EXPECT_FALSE(rig_->connected());
    EXPECT_FALSE(session.metrics().polling);
    EXPECT_EQ(recorder_.names(), (std::vector<std::string>{"pollingStopped", "disconnected"}));

    ASSERT_TRUE(session.connect("127.0.0.1", 4532).ok());
    EXPECT_EQ(session.lifecycle(), ConnectionLifecycle::Connected);
    EXPECT_TRUE(session.get_capabilities().has_value());
    EXPECT_TRUE(session.get_state().connected);
}

TEST_F(SessionManagerTest, DisconnectWaitsForInFlightCommand) {
    auto config = fast_config();
    config.command_timeout = 2s;
    auto& session = start(config);
    ASSERT_TRUE(session.connect("127.0.0.1", 4532).ok());
    rig_->block("set_ptt");

    std::thread writer([&] { session.set_ptt(true); });
    ASSERT_TRUE(rig_->wait_for_parked("set_ptt"));
    std::thread closer([&] { session.disconnect(); });
    std::this_thread::sleep_for(100ms);

    EXPECT_EQ(rig_->calls("disconnect"), 0);
    EXPECT_TRUE(rig_->connected());

    rig_->release("set_ptt");
    writer.join();
    closer.join();
    EXPECT_EQ(rig_->calls("disconnect"), 1);
    EXPECT_EQ(session.lifecycle(), ConnectionLifecycle::Disconnected);
}

TEST_F(SessionManagerTest, CommandsQueuedBehindDisconnectNeverReachTheRig) {
    auto config = fast_config();
    config.command_timeout = 2s;
    config.worker_threads = 1;
    auto& session = start(config);
    ASSERT_TRUE(session.connect("127.0.0.1", 4532).ok());
    rig_->block("set_frequency");

    std::thread first([&] { session.set_frequency(7074000.0); });
    ASSERT_TRUE(rig_->wait_for_parked("set_frequency"));
    rcb::common::CommandResult queued;
    std::thread second([&] { queued = session.set_ptt(true); });
    ASSERT_TRUE(eventually([&] { return session.metrics().pending.size() == 2; }));

    std::thread closer([&] { session.disconnect(); });
    std::this_thread::sleep_for(100ms);
    rig_->release("set_frequency");
    first.join();
    second.join();
    closer.join();

    EXPECT_EQ(rig_->calls("set_ptt"), 0);
    EXPECT_EQ(queued.code, CommandResultCode::NotConnected);
    EXPECT_EQ(session.lifecycle(), ConnectionLifecycle::Disconnected);
}

TEST_F(SessionManagerTest, SecondConnectWhileConnectingIsRejected) {
    auto& session = start();
    rig_->block("connect");

    std::thread first([&] { EXPECT_TRUE(session.connect("127.0.0.1", 4532).ok()); });
    ASSERT_TRUE(rig_->wait_for_parked("connect"));
    EXPECT_EQ(session.lifecycle(), ConnectionLifecycle::Connecting);

    const auto second = session.connect("127.0.0.1", 4540);
    EXPECT_EQ(second.code, CommandResultCode::AlreadyConnecting);

    rig_->release("connect");
    first.join();
    EXPECT_EQ(session.lifecycle(), ConnectionLifecycle::Connected);
    EXPECT_EQ(rig_->calls("connect"), 1);
}

TEST_F(SessionManagerTest, DisconnectDuringConnectAbortsAttempt) {
    auto config = fast_config();
    config.command_timeout = 2s;
    auto& session = start(config);
    rig_->block("connect");

    rcb::common::CommandResult outcome;
    std::thread connecting([&] { outcome = session.connect("127.0.0.1", 4532); });
    ASSERT_TRUE(rig_->wait_for_parked("connect"));
    std::thread closer([&] { session.disconnect(); });
    std::this_thread::sleep_for(50ms);

    rig_->release("connect");
    connecting.join();
    closer.join();

    EXPECT_EQ(outcome.code, CommandResultCode::ConnectionError);
    EXPECT_EQ(session.lifecycle(), ConnectionLifecycle::Disconnected);
    EXPECT_FALSE(rig_->connected());
    EXPECT_EQ(recorder_.count("connected"), 0u);
}

TEST_F(SessionManagerTest, SameTargetWhileConnectedIsNoOp) {
    auto& session = start();
    ASSERT_TRUE(session.connect("127.0.0.1", 4532).ok());

    EXPECT_TRUE(session.connect("127.0.0.1", 4532).ok());

    EXPECT_EQ(rig_->calls("connect"), 1);
    EXPECT_EQ(recorder_.count("connected"), 1u);
}

TEST_F(SessionManagerTest, ConnectToDifferentTargetReplacesSession) {
    auto& session = start();
    ASSERT_TRUE(session.connect("127.0.0.1", 4532).ok());

    ASSERT_TRUE(session.connect("192.168.1.20", 4532).ok());

    EXPECT_EQ(rig_->calls("connect"), 2);
    EXPECT_EQ(rig_->calls("disconnect"), 1);
    EXPECT_EQ(session.metrics().endpoint->host, "192.168.1.20");
    EXPECT_EQ(recorder_.names(),
              (std::vector<std::string>{"connected", "radioState", "disconnected", "connected", "radioState"}));
}

TEST_F(SessionManagerTest, PollingControlIsIdempotent) {
    auto& session = start();
    EXPECT_EQ(session.start_polling(50ms).code, CommandResultCode::NotConnected);
    ASSERT_TRUE(session.connect("127.0.0.1", 4532).ok());

    EXPECT_TRUE(session.start_polling(50ms).ok());
    EXPECT_TRUE(session.start_polling(50ms).ok());
    EXPECT_TRUE(session.stop_polling().ok());
    EXPECT_TRUE(session.stop_polling().ok());

    EXPECT_EQ(recorder_.count("pollingStarted"), 1u);
    EXPECT_EQ(recorder_.count("pollingStopped"), 1u);
    EXPECT_EQ(session.start_polling(0ms).code, CommandResultCode::InvalidRange);
}

TEST_F(SessionManagerTest, AutoPollStartsAfterConnect) {
    auto config = fast_config();
    config.auto_poll = true;
    config.poll_interval = 30ms;
    auto& session = start(config);

    ASSERT_TRUE(session.connect("127.0.0.1", 4532).ok());

    EXPECT_TRUE(session.metrics().polling);
    ASSERT_TRUE(eventually([&] { return session.metrics().completed_cycles >= 2; }));
    const auto started = recorder_.of<rcb::events::PollingStarted>();
    ASSERT_EQ(started.size(), 1u);
    EXPECT_EQ(started[0].interval, 30ms);
}

TEST_F(SessionManagerTest, ConsecutiveLinkFailuresForceDisconnect) {
    auto config = fast_config();
    config.failure_threshold = 3;
    auto& session = start(config);
    ASSERT_TRUE(session.connect("127.0.0.1", 4532).ok());
    rig_->fail("read_frequency", CommandResultCode::TransportError, "bus error");

    ASSERT_TRUE(session.start_polling(20ms).ok());
    ASSERT_TRUE(eventually([&] { return session.lifecycle() == ConnectionLifecycle::Disconnected; }));

    const auto disconnected = recorder_.of<rcb::events::Disconnected>();
    ASSERT_EQ(disconnected.size(), 1u);
    EXPECT_EQ(disconnected[0].reason, "failure threshold reached");
    EXPECT_GE(recorder_.count("pollingError"), 3u);
    EXPECT_FALSE(rig_->connected());
}

TEST_F(SessionManagerTest, ArgumentsAreValidatedBeforeIo) {
    auto& session = start();
    ASSERT_TRUE(session.connect("127.0.0.1", 4532).ok());

    EXPECT_EQ(session.set_frequency(-5.0).code, CommandResultCode::InvalidRange);
    EXPECT_EQ(session.set_frequency(std::nan("")).code, CommandResultCode::InvalidRange);
    EXPECT_EQ(session.set_power(120.0).code, CommandResultCode::InvalidRange);
    EXPECT_EQ(session.set_mode(RadioMode::Unknown).code, CommandResultCode::InvalidRange);
    EXPECT_EQ(session.set_mode(RadioMode::CW, -100.0).code, CommandResultCode::InvalidRange);

    EXPECT_EQ(rig_->calls("set_frequency"), 0);
    EXPECT_EQ(rig_->calls("set_power"), 0);
    EXPECT_EQ(rig_->calls("set_mode"), 0);
}

TEST_F(SessionManagerTest, UnsupportedWriteIsRejectedBeforeIo) {
    auto capabilities = rig_->capabilities();
    capabilities.supports.set_power = false;
    rig_->set_capabilities(capabilities);
    auto& session = start();
    ASSERT_TRUE(session.connect("127.0.0.1", 4532).ok());

    EXPECT_EQ(session.set_power(25.0).code, CommandResultCode::Unsupported);
    EXPECT_EQ(rig_->calls("set_power"), 0);
}

TEST_F(SessionManagerTest, MissingCapabilitiesFallBackToDefaults) {
    auto& session = start();
    rig_->fail("get_capabilities", CommandResultCode::CommandRejected, "RPRT -11");

    ASSERT_TRUE(session.connect("127.0.0.1", 4532).ok());

    ASSERT_TRUE(session.get_capabilities().has_value());
    EXPECT_EQ(*session.get_capabilities(), rcb::adapter::default_capabilities());
    EXPECT_EQ(rig_->calls("read_power"), 0);
    EXPECT_EQ(session.set_power(10.0).code, CommandResultCode::Unsupported);
}

TEST_F(SessionManagerTest, FailedInitialRefreshLeavesSessionDegraded) {
    auto& session = start();
    rig_->fail("read_mode", CommandResultCode::TransportError, "rig not answering");

    ASSERT_TRUE(session.connect("127.0.0.1", 4532).ok());

    EXPECT_EQ(session.lifecycle(), ConnectionLifecycle::Degraded);
    EXPECT_TRUE(session.get_state().connected);
    EXPECT_FALSE(session.get_state().frequency_hz.has_value());
    EXPECT_EQ(recorder_.names(), (std::vector<std::string>{"connected", "connectionDegraded"}));
}

TEST_F(SessionManagerTest, FailedInitialRefreshAtThresholdDropsSession) {
    auto config = fast_config();
    config.failure_threshold = 1;
    auto& session = start(config);
    rig_->fail("read_mode", CommandResultCode::TransportError, "rig not answering");

    ASSERT_TRUE(session.connect("127.0.0.1", 4532).ok());

    EXPECT_EQ(session.lifecycle(), ConnectionLifecycle::Disconnected);
    EXPECT_EQ(session.get_state(), RadioState{});
    EXPECT_FALSE(rig_->connected());
    EXPECT_EQ(recorder_.names(),
              (std::vector<std::string>{"connected", "connectionDegraded", "disconnected"}));
    const auto disconnected = recorder_.of<rcb::events::Disconnected>();
    ASSERT_EQ(disconnected.size(), 1u);
    EXPECT_EQ(disconnected[0].reason, "failure threshold reached");
}

TEST_F(SessionManagerTest, WriteTimeoutDegradesButRejectionDoesNot) {
    auto& session = start();
    ASSERT_TRUE(session.connect("127.0.0.1", 4532).ok());

    rig_->fail("set_mode", CommandResultCode::CommandRejected, "RPRT -9");
    EXPECT_EQ(session.set_mode(RadioMode::LSB).code, CommandResultCode::CommandRejected);
    EXPECT_EQ(session.lifecycle(), ConnectionLifecycle::Connected);
    EXPECT_EQ(session.get_state().mode, RadioMode::USB);

    rig_->fail("set_ptt", CommandResultCode::TransportError, "link down");
    EXPECT_EQ(session.set_ptt(true).code, CommandResultCode::TransportError);
    EXPECT_EQ(session.lifecycle(), ConnectionLifecycle::Degraded);
    EXPECT_EQ(session.get_state().ptt, false);
}

TEST_F(SessionManagerTest, PendingCommandsAreBounded) {
    auto config = fast_config();
    config.command_timeout = 2s;
    // Room for the six reads of the connect refresh.
    config.max_pending_commands = 6;
    auto& session = start(config);
    ASSERT_TRUE(session.connect("127.0.0.1", 4532).ok());
    ASSERT_EQ(session.lifecycle(), ConnectionLifecycle::Connected);
    rig_->block("set_ptt");

    std::vector<std::thread> writers;
    for (int i = 0; i < 6; ++i) {
        writers.emplace_back([&] { session.set_ptt(true); });
    }
    ASSERT_TRUE(rig_->wait_for_parked("set_ptt", 6));
    EXPECT_EQ(session.metrics().pending.size(), 6u);

    EXPECT_EQ(session.set_frequency(7074000.0).code, CommandResultCode::Busy);
    EXPECT_EQ(rig_->calls("set_frequency"), 0);

    rig_->release("set_ptt");
    for (auto& writer : writers) {
        writer.join();
    }
}

TEST_F(SessionManagerTest, CommandTimeoutIsReportedToCaller) {
    auto config = fast_config();
    config.command_timeout = 100ms;
    auto& session = start(config);
    ASSERT_TRUE(session.connect("127.0.0.1", 4532).ok());
    rig_->block("set_frequency");

    const auto result = session.set_frequency(3573000.0);

    EXPECT_EQ(result.code, CommandResultCode::CommandTimeout);
    EXPECT_EQ(session.lifecycle(), ConnectionLifecycle::Degraded);
    EXPECT_EQ(session.get_state().frequency_hz, 14200000.0);
}

}  // namespace
