#include "rcb/adapter/rigctld_client.hpp"

#include "rcb/adapter/rigctld_protocol.hpp"

#include <asio/connect.hpp>
#include <asio/read_until.hpp>
#include <asio/write.hpp>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <utility>

namespace rcb::adapter {

using common::CommandResult;
using common::CommandResultCode;

namespace {

// rigctld lines are short; dump_caps rows are the longest by far.
constexpr std::size_t kMaxReplyLine = 64 * 1024;

}  // namespace

RigctldClient::RigctldClient(RigctldClientOptions options)
    : options_(options)
    , socket_(io_)
    , reconnect_delay_(options.reconnect_initial) {}

RigctldClient::~RigctldClient() {
    std::lock_guard<std::mutex> lock(request_mutex_);
    close_locked();
}

CommandResult RigctldClient::connect(const common::Endpoint& endpoint) {
    std::lock_guard<std::mutex> lock(request_mutex_);
    close_locked();

    target_ = endpoint;
    {
        std::lock_guard<std::mutex> metrics_lock(metrics_mutex_);
        metrics_.target = endpoint;
    }

    auto result = open_locked(endpoint);
    if (!result.ok()) {
        link_wanted_ = false;
        return CommandResult::failure(CommandResultCode::ConnectionError, result.message);
    }

    link_wanted_ = true;
    reconnect_delay_ = options_.reconnect_initial;
    next_reconnect_at_ = Clock::time_point{};
    {
        std::lock_guard<std::mutex> metrics_lock(metrics_mutex_);
        metrics_.reconnect_backoff = std::chrono::milliseconds{0};
    }
    spdlog::info("[RigctldClient] connected to {}", common::to_string(endpoint));
    return result;
}

void RigctldClient::disconnect() {
    std::lock_guard<std::mutex> lock(request_mutex_);
    if (link_wanted_ || socket_.is_open()) {
        spdlog::info("[RigctldClient] disconnecting from {}",
                     target_ ? common::to_string(*target_) : std::string{"<none>"});
    }
    link_wanted_ = false;
    close_locked();
}

common::Outcome<std::vector<std::string>> RigctldClient::request(const std::string& command) {
    return request(command, options_.command_timeout);
}

common::Outcome<std::vector<std::string>> RigctldClient::request(const std::string& command,
                                                                 std::chrono::milliseconds timeout) {
    using Result = common::Outcome<std::vector<std::string>>;

    std::lock_guard<std::mutex> lock(request_mutex_);
    if (!socket_.is_open()) {
        auto restored = restore_link_locked();
        if (!restored.ok()) {
            return Result::failure(std::move(restored));
        }
    }

    {
        std::lock_guard<std::mutex> metrics_lock(metrics_mutex_);
        metrics_.inflight_command = command;
        ++metrics_.requests;
    }
    auto clear_inflight = [this] {
        std::lock_guard<std::mutex> metrics_lock(metrics_mutex_);
        metrics_.inflight_command.reset();
    };

    const auto deadline = Clock::now() + timeout;
    if (auto ec = write_line("+" + command, deadline)) {
        clear_inflight();
        const bool timed_out = ec == asio::error::timed_out;
        const std::string message = timed_out ? "timeout writing '" + command + "'"
                                              : "write failed for '" + command + "': " + ec.message();
        record_error(message);
        close_locked();
        return Result::failure(CommandResult::failure(
            timed_out ? CommandResultCode::CommandTimeout : CommandResultCode::TransportError, message));
    }

    std::vector<std::string> lines;
    for (;;) {
        std::string line;
        if (auto ec = read_line(line, deadline)) {
            clear_inflight();
            const bool timed_out = ec == asio::error::timed_out;
            std::string message;
            if (timed_out) {
                message = "rigctld timeout for '" + command + "'";
            } else if (ec == asio::error::not_found) {
                message = "reply to '" + command + "' has a line longer than " +
                          std::to_string(kMaxReplyLine) + " bytes";
            } else {
                message = "read failed for '" + command + "': " + ec.message();
            }
            record_error(message);
            close_locked();
            return Result::failure(CommandResult::failure(
                timed_out ? CommandResultCode::CommandTimeout : CommandResultCode::TransportError, message));
        }

        const bool terminal = rigctld::is_report_line(line);
        lines.push_back(std::move(line));
        if (terminal) {
            break;
        }
    }

    {
        std::lock_guard<std::mutex> metrics_lock(metrics_mutex_);
        metrics_.inflight_command.reset();
        metrics_.last_report_at = Clock::now();
    }
    return Result::success(std::move(lines));
}

RigctldClientMetrics RigctldClient::metrics() const {
    std::lock_guard<std::mutex> lock(metrics_mutex_);
    return metrics_;
}

CommandResult RigctldClient::open_locked(const common::Endpoint& endpoint) {
    const auto deadline = Clock::now() + options_.connect_timeout;

    asio::ip::tcp::resolver resolver(io_);
    asio::error_code result = asio::error::would_block;
    resolver.async_resolve(endpoint.host, std::to_string(endpoint.port),
        [this, &result](const asio::error_code& ec, asio::ip::tcp::resolver::results_type endpoints) {
            if (ec) {
                result = ec;
                return;
            }
            asio::async_connect(socket_, endpoints,
                [&result](const asio::error_code& connect_ec, const asio::ip::tcp::endpoint&) {
                    result = connect_ec;
                });
        });

    if (!run_until(deadline, &resolver)) {
        const std::string message = "timed out connecting to " + common::to_string(endpoint);
        record_error(message);
        close_locked();
        return CommandResult::failure(CommandResultCode::CommandTimeout, message);
    }

    if (result) {
        const std::string message =
            "cannot connect to " + common::to_string(endpoint) + ": " + result.message();
        record_error(message);
        close_locked();
        return CommandResult::failure(CommandResultCode::TransportError, message);
    }

    asio::error_code ignored;
    socket_.set_option(asio::ip::tcp::no_delay(true), ignored);
    read_buffer_.clear();

    std::lock_guard<std::mutex> metrics_lock(metrics_mutex_);
    metrics_.link_up = true;
    return CommandResult::success();
}

CommandResult RigctldClient::restore_link_locked() {
    if (!link_wanted_ || !target_) {
        return CommandResult::failure(CommandResultCode::TransportError, "not connected to rigctld");
    }

    const auto now = Clock::now();
    if (now < next_reconnect_at_) {
        const auto wait = std::chrono::duration_cast<std::chrono::milliseconds>(next_reconnect_at_ - now);
        return CommandResult::failure(CommandResultCode::TransportError,
            "link to rigctld is down, next reconnect attempt in " + std::to_string(wait.count()) + " ms");
    }

    auto result = open_locked(*target_);
    if (!result.ok()) {
        next_reconnect_at_ = Clock::now() + reconnect_delay_;
        {
            std::lock_guard<std::mutex> metrics_lock(metrics_mutex_);
            metrics_.reconnect_backoff = reconnect_delay_;
        }
        const auto grown = std::chrono::milliseconds{
            static_cast<std::chrono::milliseconds::rep>(reconnect_delay_.count() * options_.reconnect_multiplier)};
        reconnect_delay_ = std::min(grown, options_.reconnect_max);
        spdlog::warn("[RigctldClient] reconnect to {} failed: {}", common::to_string(*target_), result.message);
        return CommandResult::failure(CommandResultCode::TransportError, "reconnect failed: " + result.message);
    }

    reconnect_delay_ = options_.reconnect_initial;
    next_reconnect_at_ = Clock::time_point{};
    {
        std::lock_guard<std::mutex> metrics_lock(metrics_mutex_);
        ++metrics_.reconnects;
        metrics_.reconnect_backoff = std::chrono::milliseconds{0};
    }
    spdlog::info("[RigctldClient] link to {} restored", common::to_string(*target_));
    return result;
}

void RigctldClient::close_locked() {
    asio::error_code ignored;
    if (socket_.is_open()) {
        socket_.shutdown(asio::ip::tcp::socket::shutdown_both, ignored);
        socket_.close(ignored);
    }
    read_buffer_.clear();

    std::lock_guard<std::mutex> metrics_lock(metrics_mutex_);
    metrics_.link_up = false;
    metrics_.inflight_command.reset();
}

bool RigctldClient::run_until(Clock::time_point deadline, asio::ip::tcp::resolver* resolver) {
    io_.restart();
    const auto now = Clock::now();
    if (deadline > now) {
        io_.run_for(deadline - now);
    }
    if (!io_.stopped()) {
        // Closing the socket completes the outstanding operation with
        // operation_aborted; run the io_context until its handler has fired.
        if (resolver) {
            resolver->cancel();
        }
        asio::error_code ignored;
        socket_.close(ignored);
        io_.run();
        return false;
    }
    return true;
}

asio::error_code RigctldClient::write_line(const std::string& line, Clock::time_point deadline) {
    const std::string payload = line + "\n";
    asio::error_code result = asio::error::would_block;
    asio::async_write(socket_, asio::buffer(payload),
        [&result](const asio::error_code& ec, std::size_t) { result = ec; });

    if (!run_until(deadline)) {
        return asio::error::timed_out;
    }
    return result;
}

asio::error_code RigctldClient::read_line(std::string& line, Clock::time_point deadline) {
    asio::error_code result = asio::error::would_block;
    std::size_t length = 0;
    asio::async_read_until(socket_, asio::dynamic_buffer(read_buffer_, kMaxReplyLine), '\n',
        [&result, &length](const asio::error_code& ec, std::size_t n) {
            result = ec;
            length = n;
        });

    if (!run_until(deadline)) {
        return asio::error::timed_out;
    }
    if (result) {
        return result;
    }

    line = read_buffer_.substr(0, length);
    read_buffer_.erase(0, length);
    while (!line.empty() && (line.back() == '\n' || line.back() == '\r')) {
        line.pop_back();
    }
    return {};
}

void RigctldClient::record_error(const std::string& message) {
    spdlog::debug("[RigctldClient] {}", message);
    std::lock_guard<std::mutex> lock(metrics_mutex_);
    metrics_.last_error = message;
}

}  // namespace rcb::adapter
