#pragma once

#include "rcb/common/types.hpp"
#include <asio/io_context.hpp>
#include <asio/ip/tcp.hpp>
#include <chrono>
#include <cstdint>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace rcb::adapter {

struct RigctldClientOptions {
    std::chrono::milliseconds connect_timeout{std::chrono::seconds{3}};
    std::chrono::milliseconds command_timeout{std::chrono::seconds{3}};
    std::chrono::milliseconds reconnect_initial{std::chrono::seconds{1}};
    std::chrono::milliseconds reconnect_max{std::chrono::seconds{15}};
    double reconnect_multiplier{1.5};
};

struct RigctldClientMetrics {
    bool link_up{false};
    std::optional<common::Endpoint> target;
    std::optional<std::string> inflight_command;
    std::optional<std::chrono::steady_clock::time_point> last_report_at;
    std::string last_error;
    std::uint64_t requests{0};
    std::uint64_t reconnects{0};
    // Window imposed by the last failed reconnect; zero once the link is up.
    std::chrono::milliseconds reconnect_backoff{0};
};

// Owns the TCP connection to rigctld. Requests are serialised: exactly one
// command is on the wire at a time and its reply is the sequence of lines
// up to and including the terminating RPRT line. Each blocking call drives
// a private io_context for at most its deadline; on expiry the socket is
// closed so the stream never carries a stale reply into the next request.
class RigctldClient {
public:
    explicit RigctldClient(RigctldClientOptions options = {});
    ~RigctldClient();

    RigctldClient(const RigctldClient&) = delete;
    RigctldClient& operator=(const RigctldClient&) = delete;

    common::CommandResult connect(const common::Endpoint& endpoint);
    void disconnect();

    // Sends "+<command>" and returns the raw reply lines. A dropped link is
    // re-opened first, subject to the reconnect backoff window; the command
    // itself is never re-sent.
    common::Outcome<std::vector<std::string>> request(const std::string& command);
    common::Outcome<std::vector<std::string>> request(const std::string& command,
                                                      std::chrono::milliseconds timeout);

    RigctldClientMetrics metrics() const;

private:
    using Clock = std::chrono::steady_clock;

    common::CommandResult open_locked(const common::Endpoint& endpoint);
    common::CommandResult restore_link_locked();
    void close_locked();
    bool run_until(Clock::time_point deadline, asio::ip::tcp::resolver* resolver = nullptr);
    asio::error_code write_line(const std::string& line, Clock::time_point deadline);
    asio::error_code read_line(std::string& line, Clock::time_point deadline);
    void record_error(const std::string& message);

    RigctldClientOptions options_;
    asio::io_context io_;
    asio::ip::tcp::socket socket_;
    std::string read_buffer_;

    std::mutex request_mutex_;
    std::optional<common::Endpoint> target_;
    bool link_wanted_{false};
    std::chrono::milliseconds reconnect_delay_;
    Clock::time_point next_reconnect_at_{};

    mutable std::mutex metrics_mutex_;
    RigctldClientMetrics metrics_;
};

}  // namespace rcb::adapter
