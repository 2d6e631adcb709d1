#include "shell_session.hpp"
#include <core/log.hpp>
#include <fmt/format.h>

// Upper bound on reads per pump so a chatty device cannot pin the loop
static constexpr int MAX_READS_PER_PUMP = 256;

static bool loses_shell(ErrorKind kind) {
    return kind == ErrorKind::Channel || kind == ErrorKind::Connection;
}

const char* to_string(ConnectionState state) {
    switch (state) {
        case ConnectionState::Disconnected: return "disconnected";
        case ConnectionState::Connected:    return "connected";
        case ConnectionState::ShellActive:  return "shell-active";
    }
    return "unknown";
}

ShellSession::ShellSession(std::unique_ptr<Transport> transport, Clock& clock)
    : transport_(std::move(transport)), clock_(clock) {
}

ShellSession::~ShellSession() {
    disconnect();
}

Result<void> ShellSession::connect(const ConnectOptions& options) {
    options_ = options;
    probe_log(fmt::format("session: connecting to {}:{}", options.host, options.port));

    auto r = transport_->connect(options);
    if (r.is_err()) {
        state_ = ConnectionState::Disconnected;
        probe_log(fmt::format("session: connect failed [{}]: {}", to_string(r.kind), r.error));
        return r;
    }

    // Transport::connect opens the shell as well
    state_ = ConnectionState::ShellActive;
    return Result<void>::Ok();
}

Result<void> ShellSession::pump() {
    if (state_ != ConnectionState::ShellActive) {
        return Result<void>::Err("Shell is not active", ErrorKind::Channel);
    }

    for (int i = 0; i < MAX_READS_PER_PUMP; i++) {
        auto r = transport_->receive_if_available();
        if (r.is_err()) {
            if (loses_shell(r.kind)) state_ = ConnectionState::Disconnected;
            probe_log(fmt::format("session: receive failed [{}]: {}", to_string(r.kind), r.error));
            return Result<void>::Err(r.error, r.kind);
        }
        if (r.value.empty()) break;
        buffer_.append(r.value);
    }
    return Result<void>::Ok();
}

Result<void> ShellSession::send(const std::string& text) {
    if (state_ != ConnectionState::ShellActive) {
        return Result<void>::Err("Shell is not active", ErrorKind::Channel);
    }

    auto r = transport_->send(text);
    if (r.is_err()) {
        if (loses_shell(r.kind)) state_ = ConnectionState::Disconnected;
        probe_log(fmt::format("session: send failed [{}]: {}", to_string(r.kind), r.error));
    }
    return r;
}

Result<void> ShellSession::reconnect(int delay_ms) {
    probe_log(fmt::format("session: reconnecting to {}:{} in {}ms",
                          options_.host, options_.port, delay_ms));
    transport_->close();
    state_ = ConnectionState::Disconnected;
    clock_.sleep_for(Clock::duration(delay_ms));
    return connect(options_);
}

void ShellSession::disconnect() {
    if (state_ != ConnectionState::Disconnected) {
        probe_log("session: disconnecting from " + options_.host);
    }
    if (transport_) {
        transport_->close();
    }
    state_ = ConnectionState::Disconnected;
}

Result<void> ShellSession::settle(int ms, int poll_interval_ms) {
    Deadline deadline(clock_, Clock::duration(ms));
    while (!deadline.expired()) {
        auto r = pump();
        if (r.is_err()) return r;
        clock_.sleep_for(Clock::duration(poll_interval_ms));
    }
    return pump();
}

bool ShellSession::is_alive() {
    if (state_ != ConnectionState::ShellActive) return false;
    return transport_->is_alive();
}
