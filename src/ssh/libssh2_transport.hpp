#pragma once

#include <memory>
#include <mutex>
#include <string>
#include <platform/socket_util.hpp>
#include "transport.hpp"

// libssh2 forward declarations
typedef struct _LIBSSH2_SESSION LIBSSH2_SESSION;
typedef struct _LIBSSH2_CHANNEL LIBSSH2_CHANNEL;

// Transport over a libssh2 session with one PTY shell channel.
// Non-blocking throughout; every libssh2 call takes a brief io_mutex_ hold.
class Libssh2Transport : public Transport {
public:
    Libssh2Transport();
    ~Libssh2Transport() override;

    Result<void> connect(const ConnectOptions& options) override;
    Result<void> send(const std::string& data) override;
    Result<std::string> receive_if_available() override;
    bool is_alive() override;
    void close() override;

    // Non-copyable
    Libssh2Transport(const Libssh2Transport&) = delete;
    Libssh2Transport& operator=(const Libssh2Transport&) = delete;

private:
    ConnectOptions options_;
    LIBSSH2_SESSION* session_;
    LIBSSH2_CHANNEL* channel_;
    socket_t sock_;
    bool active_;
    std::mutex io_mutex_;

    Result<void> handshake();
    Result<void> authenticate();
    Result<void> open_shell();
    void teardown(const char* reason);
};
