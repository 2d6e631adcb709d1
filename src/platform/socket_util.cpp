#include "socket_util.hpp"
#include <cerrno>
#include <cstring>

#ifndef _WIN32
#  include <sys/socket.h>
#  include <netinet/in.h>
#  include <netinet/tcp.h>
#  include <arpa/inet.h>
#  include <netdb.h>
#  include <fcntl.h>
#  include <poll.h>
#  include <unistd.h>
#endif

namespace platform {

Result<socket_t> connect_tcp(const std::string& host, int port, int timeout_ms) {
    socket_t sock = socket(AF_INET, SOCK_STREAM, 0);
    if (sock == DEVPROBE_INVALID_SOCKET) {
        return Result<socket_t>::Err("Failed to create socket", ErrorKind::Connection);
    }

    set_nonblocking(sock);

    struct sockaddr_in addr;
    std::memset(&addr, 0, sizeof(addr));
    addr.sin_family = AF_INET;
    addr.sin_port = htons(static_cast<uint16_t>(port));

    if (inet_pton(AF_INET, host.c_str(), &addr.sin_addr) != 1) {
        struct hostent* host_info = gethostbyname(host.c_str());
        if (!host_info) {
            close_socket(sock);
            return Result<socket_t>::Err("Failed to resolve host: " + host, ErrorKind::Connection);
        }
        std::memcpy(&addr.sin_addr, host_info->h_addr, sizeof(in_addr));
    }

    int ret = ::connect(sock, reinterpret_cast<struct sockaddr*>(&addr), sizeof(addr));
    if (ret < 0 && errno != EINPROGRESS) {
        std::string reason = strerror(errno);
        close_socket(sock);
        return Result<socket_t>::Err("Failed to connect: " + reason, ErrorKind::Connection);
    }

    // Wait for non-blocking connect to complete
    if (ret < 0) {
        int revents = poll_socket(sock, POLLOUT, timeout_ms);
        if (revents == 0) {
            close_socket(sock);
            return Result<socket_t>::Err("Connection timed out: " + host, ErrorKind::Connection);
        }
        int sock_err = 0;
        socklen_t err_len = sizeof(sock_err);
        getsockopt(sock, SOL_SOCKET, SO_ERROR, reinterpret_cast<char*>(&sock_err), &err_len);
        if (sock_err != 0) {
            close_socket(sock);
            return Result<socket_t>::Err("Connection failed: " + std::string(strerror(sock_err)),
                                         ErrorKind::Connection);
        }
    }

    return Result<socket_t>::Ok(sock);
}

void set_nonblocking(socket_t sock) {
#ifdef _WIN32
    u_long mode = 1;
    ioctlsocket(sock, FIONBIO, &mode);
#else
    int flags = fcntl(sock, F_GETFL, 0);
    fcntl(sock, F_SETFL, flags | O_NONBLOCK);
#endif
}

void enable_keepalive(socket_t sock) {
    int on = 1;
    setsockopt(sock, SOL_SOCKET, SO_KEEPALIVE, reinterpret_cast<const char*>(&on), sizeof(on));
    int keepidle = 60;
    int keepintvl = 15;
    int keepcnt = 4;
#ifdef TCP_KEEPIDLE
    setsockopt(sock, IPPROTO_TCP, TCP_KEEPIDLE, reinterpret_cast<const char*>(&keepidle), sizeof(keepidle));
#endif
#ifdef TCP_KEEPINTVL
    setsockopt(sock, IPPROTO_TCP, TCP_KEEPINTVL, reinterpret_cast<const char*>(&keepintvl), sizeof(keepintvl));
#endif
#ifdef TCP_KEEPCNT
    setsockopt(sock, IPPROTO_TCP, TCP_KEEPCNT, reinterpret_cast<const char*>(&keepcnt), sizeof(keepcnt));
#endif
    (void)keepidle;
    (void)keepintvl;
    (void)keepcnt;
}

int poll_socket(socket_t sock, short events, int timeout_ms) {
#ifdef _WIN32
    WSAPOLLFD pfd;
    pfd.fd = sock;
    pfd.events = events;
    pfd.revents = 0;
    int ret = WSAPoll(&pfd, 1, timeout_ms);
    return (ret > 0) ? pfd.revents : 0;
#else
    struct pollfd pfd;
    pfd.fd = sock;
    pfd.events = events;
    pfd.revents = 0;
    int ret = poll(&pfd, 1, timeout_ms);
    return (ret > 0) ? pfd.revents : 0;
#endif
}

void close_socket(socket_t sock) {
#ifdef _WIN32
    closesocket(sock);
#else
    close(sock);
#endif
}

} // namespace platform
