#include "libssh2_transport.hpp"
#include <core/constants.hpp>
#include <core/log.hpp>
#include <platform/platform.hpp>
#include <fmt/format.h>
#include <libssh2.h>
#include <cstdlib>
#include <cstring>

// Password handed to the keyboard-interactive callback via the session abstract pointer
struct KbdAuthData {
    std::string password;
    int prompt_round;
};

// libssh2 keyboard-interactive callback. Network devices commonly offer only
// keyboard-interactive; every prompt is answered with the password.
static void kbd_callback(const char* /*name*/, int /*name_len*/,
                          const char* /*instruction*/, int /*instruction_len*/,
                          int num_prompts,
                          const LIBSSH2_USERAUTH_KBDINT_PROMPT* /*prompts*/,
                          LIBSSH2_USERAUTH_KBDINT_RESPONSE* responses,
                          void** abstract) {
    KbdAuthData* data = static_cast<KbdAuthData*>(*abstract);
    for (int i = 0; i < num_prompts; i++) {
        responses[i].text = strdup(data->password.c_str());
        responses[i].length = static_cast<unsigned int>(data->password.length());
    }
    data->prompt_round++;
}

Libssh2Transport::Libssh2Transport()
    : session_(nullptr), channel_(nullptr), sock_(DEVPROBE_INVALID_SOCKET), active_(false) {
}

Libssh2Transport::~Libssh2Transport() {
    close();
}

Result<void> Libssh2Transport::connect(const ConnectOptions& options) {
    close();
    options_ = options;

    if (libssh2_init(0) != 0) {
        return Result<void>::Err("Failed to initialize libssh2", ErrorKind::Connection);
    }

    auto sock = platform::connect_tcp(options_.host, options_.port,
                                      options_.timeout_secs * 1000);
    if (sock.is_err()) {
        return Result<void>::Err(sock.error, sock.kind);
    }
    sock_ = sock.value;
    platform::enable_keepalive(sock_);

    auto hs = handshake();
    if (hs.is_err()) {
        teardown("Handshake failed");
        return hs;
    }

    auto auth = authenticate();
    if (auth.is_err()) {
        teardown("Authentication failed");
        return auth;
    }

    auto shell = open_shell();
    if (shell.is_err()) {
        teardown("Shell request failed");
        return shell;
    }

    active_ = true;
    probe_log(fmt::format("transport: shell open on {}@{}:{}",
                          options_.user, options_.host, options_.port));
    return Result<void>::Ok();
}

Result<void> Libssh2Transport::handshake() {
    session_ = libssh2_session_init_ex(nullptr, nullptr, nullptr, nullptr);
    if (!session_) {
        return Result<void>::Err("Failed to create SSH session", ErrorKind::Connection);
    }

    libssh2_session_set_blocking(session_, 0);

    int ret;
    while ((ret = libssh2_session_handshake(session_, sock_)) == LIBSSH2_ERROR_EAGAIN) {
        platform::poll_socket(sock_, POLLIN | POLLOUT, SSH_EAGAIN_SLEEP_MS);
    }
    if (ret != 0) {
        return Result<void>::Err("SSH handshake failed", ErrorKind::Connection);
    }

    libssh2_keepalive_config(session_, 1, SSH_KEEPALIVE_SECS);
    return Result<void>::Ok();
}

Result<void> Libssh2Transport::authenticate() {
    const std::string& user = options_.user;
    int ret;

    char* auth_list = nullptr;
    while ((auth_list = libssh2_userauth_list(session_, user.c_str(),
                                              static_cast<unsigned int>(user.length()))) == nullptr) {
        if (libssh2_session_last_errno(session_) != LIBSSH2_ERROR_EAGAIN) {
            break;
        }
        platform::sleep_ms(SSH_EAGAIN_SLEEP_MS);
    }

    std::string methods = auth_list ? auth_list : "";
    probe_log("transport: auth methods: " + methods);

    if (methods.find("keyboard-interactive") != std::string::npos) {
        KbdAuthData kbd_data{options_.password, 0};
        *libssh2_session_abstract(session_) = &kbd_data;

        while ((ret = libssh2_userauth_keyboard_interactive(session_,
                user.c_str(), kbd_callback)) == LIBSSH2_ERROR_EAGAIN) {
            platform::sleep_ms(SSH_EAGAIN_SLEEP_MS);
        }
        *libssh2_session_abstract(session_) = nullptr;

        if (ret == 0) {
            return Result<void>::Ok();
        }
        probe_log("transport: keyboard-interactive rejected, trying password");
    }

    if (methods.empty() || methods.find("password") != std::string::npos) {
        while ((ret = libssh2_userauth_password(session_,
                user.c_str(), options_.password.c_str())) == LIBSSH2_ERROR_EAGAIN) {
            platform::sleep_ms(SSH_EAGAIN_SLEEP_MS);
        }
        if (ret == 0) {
            return Result<void>::Ok();
        }
    }

    return Result<void>::Err("Authentication failed (check username/password)",
                             ErrorKind::Authentication);
}

Result<void> Libssh2Transport::open_shell() {
    while ((channel_ = libssh2_channel_open_session(session_)) == nullptr) {
        if (libssh2_session_last_errno(session_) != LIBSSH2_ERROR_EAGAIN) {
            return Result<void>::Err("Failed to open SSH channel", ErrorKind::Channel);
        }
        platform::sleep_ms(SSH_EAGAIN_SLEEP_MS);
    }

    int ret;
    while ((ret = libssh2_channel_request_pty_ex(
                channel_, "xterm", 5, nullptr, 0, PTY_COLS, PTY_ROWS, 0, 0)) == LIBSSH2_ERROR_EAGAIN) {
        platform::sleep_ms(SSH_EAGAIN_SLEEP_MS);
    }
    if (ret != 0) {
        return Result<void>::Err("PTY request refused", ErrorKind::Channel);
    }

    while ((ret = libssh2_channel_shell(channel_)) == LIBSSH2_ERROR_EAGAIN) {
        platform::sleep_ms(SSH_EAGAIN_SLEEP_MS);
    }
    if (ret != 0) {
        return Result<void>::Err("Failed to request shell", ErrorKind::Channel);
    }
    return Result<void>::Ok();
}

Result<void> Libssh2Transport::send(const std::string& data) {
    if (!active_ || !channel_) {
        return Result<void>::Err("Channel is not open", ErrorKind::Channel);
    }

    size_t written = 0;
    int stalls = 0;
    while (written < data.size()) {
        ssize_t n;
        {
            std::lock_guard<std::mutex> lock(io_mutex_);
            n = libssh2_channel_write(channel_, data.c_str() + written, data.size() - written);
        }
        if (n == LIBSSH2_ERROR_EAGAIN) {
            if (++stalls > SSH_WRITE_MAX_EAGAIN) {
                return Result<void>::Err("Channel write stalled (EAGAIN for too long)",
                                         ErrorKind::Channel);
            }
            platform::poll_socket(sock_, POLLOUT, 10);
            continue;
        }
        if (n < 0) {
            active_ = false;
            return Result<void>::Err(fmt::format("Channel write error ({})", n), ErrorKind::Channel);
        }
        stalls = 0;
        written += static_cast<size_t>(n);
    }
    return Result<void>::Ok();
}

Result<std::string> Libssh2Transport::receive_if_available() {
    if (!active_ || !channel_) {
        return Result<std::string>::Err("Channel is not open", ErrorKind::Channel);
    }

    std::string out;
    char buf[SSH_READ_BUF_SIZE];
    while (true) {
        ssize_t n;
        {
            std::lock_guard<std::mutex> lock(io_mutex_);
            n = libssh2_channel_read(channel_, buf, sizeof(buf));
        }
        if (n > 0) {
            out.append(buf, static_cast<size_t>(n));
            continue;
        }
        if (n == LIBSSH2_ERROR_EAGAIN) {
            break;
        }
        if (n == 0) {
            std::lock_guard<std::mutex> lock(io_mutex_);
            if (libssh2_channel_eof(channel_)) {
                active_ = false;
                if (!out.empty()) break;
                return Result<std::string>::Err("Channel closed by remote", ErrorKind::Channel);
            }
            break;
        }
        active_ = false;
        return Result<std::string>::Err(fmt::format("Channel read error ({})", n), ErrorKind::Channel);
    }
    return Result<std::string>::Ok(out);
}

bool Libssh2Transport::is_alive() {
    std::lock_guard<std::mutex> lock(io_mutex_);
    if (!active_ || !session_ || !channel_ || sock_ == DEVPROBE_INVALID_SOCKET) return false;

    if (libssh2_channel_eof(channel_)) {
        active_ = false;
        return false;
    }

    int seconds_to_next = 0;
    int ret = libssh2_keepalive_send(session_, &seconds_to_next);
    if (ret != 0 && ret != LIBSSH2_ERROR_EAGAIN) {
        active_ = false;
        return false;
    }

    int revents = platform::poll_socket(sock_, POLLIN, 0);
    if (revents & (POLLERR | POLLHUP | POLLNVAL)) {
        active_ = false;
        return false;
    }
    return true;
}

void Libssh2Transport::close() {
    if (session_ || channel_ || sock_ != DEVPROBE_INVALID_SOCKET) {
        probe_log("transport: closing " + options_.host);
    }
    teardown("Normal disconnection");
}

void Libssh2Transport::teardown(const char* reason) {
    // Mark inactive first so a concurrent reader bails out early
    active_ = false;

    if (channel_) {
        {
            std::lock_guard<std::mutex> lock(io_mutex_);
            libssh2_channel_close(channel_);
        }
        {
            std::lock_guard<std::mutex> lock(io_mutex_);
            libssh2_channel_free(channel_);
        }
        channel_ = nullptr;
    }

    if (session_) {
        {
            std::lock_guard<std::mutex> lock(io_mutex_);
            libssh2_session_disconnect(session_, reason);
        }
        {
            std::lock_guard<std::mutex> lock(io_mutex_);
            libssh2_session_free(session_);
        }
        session_ = nullptr;
    }

    if (sock_ != DEVPROBE_INVALID_SOCKET) {
        platform::close_socket(sock_);
        sock_ = DEVPROBE_INVALID_SOCKET;
    }
}
