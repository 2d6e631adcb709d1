#pragma once

#include <string>
#include <core/types.hpp>

struct ConnectOptions {
    std::string host;
    int port = 22;
    std::string user;
    std::string password;
    int timeout_secs = 30;
};

// Byte pipe to an interactive remote shell. Implementations report
// failures through ErrorKind:
//   connect(): Connection or Authentication
//   send()/receive_if_available(): Channel
class Transport {
public:
    virtual ~Transport() = default;

    // Open the connection and start an interactive shell on it.
    virtual Result<void> connect(const ConnectOptions& options) = 0;

    virtual Result<void> send(const std::string& data) = 0;

    // Whatever arrived since the last call; empty when nothing is pending.
    virtual Result<std::string> receive_if_available() = 0;

    virtual bool is_alive() = 0;

    // Idempotent.
    virtual void close() = 0;
};
