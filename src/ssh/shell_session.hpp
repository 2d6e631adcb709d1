#pragma once

#include <memory>
#include <optional>
#include <string>
#include <core/clock.hpp>
#include <core/types.hpp>
#include "output_buffer.hpp"
#include "transport.hpp"

enum class ConnectionState {
    Disconnected,
    Connected,
    ShellActive,
};

const char* to_string(ConnectionState state);

// One interactive shell on one device. Owns the transport, the output
// accumulated over the whole interaction, and the discovered prompt.
// Not shared between callers; one command is outstanding at a time.
class ShellSession {
public:
    ShellSession(std::unique_ptr<Transport> transport, Clock& clock);
    ~ShellSession();

    Result<void> connect(const ConnectOptions& options);

    // Move everything the transport has pending into the buffer.
    Result<void> pump();

    Result<void> send(const std::string& text);

    // Close, wait delay_ms, connect again with the same options. The buffer
    // and prompt survive.
    Result<void> reconnect(int delay_ms);

    void disconnect();

    // Keep pumping for ms milliseconds so banners and echoes land in the buffer.
    Result<void> settle(int ms, int poll_interval_ms);

    bool is_alive();

    OutputBuffer& buffer() { return buffer_; }
    const OutputBuffer& buffer() const { return buffer_; }
    Clock& clock() { return clock_; }

    const std::optional<std::string>& prompt() const { return prompt_; }
    // How many times the prompt must appear before a command counts as done
    int prompt_count() const { return prompt_count_; }
    void set_prompt(const std::string& prompt, int count = 1) {
        prompt_ = prompt;
        prompt_count_ = count < 1 ? 1 : count;
    }
    void clear_prompt() {
        prompt_.reset();
        prompt_count_ = 1;
    }

    ConnectionState state() const { return state_; }

    // Non-copyable
    ShellSession(const ShellSession&) = delete;
    ShellSession& operator=(const ShellSession&) = delete;

private:
    std::unique_ptr<Transport> transport_;
    Clock& clock_;
    OutputBuffer buffer_;
    std::optional<std::string> prompt_;
    int prompt_count_ = 1;
    ConnectionState state_ = ConnectionState::Disconnected;
    ConnectOptions options_;
};
