#pragma once

#include <string>

namespace platform {

// True when stdin is an interactive terminal (not a pipe or file).
bool stdin_is_tty();

// RAII guard that turns terminal echo off for password entry.
// Destructor restores the saved mode.
struct NoEchoGuard {
    NoEchoGuard();
    ~NoEchoGuard();

    NoEchoGuard(const NoEchoGuard&) = delete;
    NoEchoGuard& operator=(const NoEchoGuard&) = delete;

private:
#ifdef _WIN32
    unsigned long old_mode_ = 0;
#else
    struct Impl;
    Impl* impl_ = nullptr;
#endif
};

// Poll stdin for input readability with a timeout.
// Returns true if stdin has data to read.
bool poll_stdin(int timeout_ms);

// Prompt on stdout and read one line from stdin without echo.
// Gives up after timeout_ms of no input and returns what was typed so far.
std::string read_secret(const std::string& prompt, int timeout_ms);

} // namespace platform
