#include "socket_util.hpp"

#include <sys/socket.h>
#include <netinet/in.h>
#include <arpa/inet.h>
#include <netdb.h>
#include <fcntl.h>
#include <poll.h>
#include <unistd.h>
#include <cerrno>
#include <cstring>

namespace platform {

static bool resolve_ipv4(const std::string& host, in_addr& out) {
    if (inet_pton(AF_INET, host.c_str(), &out) == 1) return true;

    struct addrinfo hints;
    std::memset(&hints, 0, sizeof(hints));
    hints.ai_family = AF_INET;
    hints.ai_socktype = SOCK_STREAM;
    struct addrinfo* res = nullptr;
    if (getaddrinfo(host.c_str(), nullptr, &hints, &res) != 0 || !res) return false;
    out = reinterpret_cast<struct sockaddr_in*>(res->ai_addr)->sin_addr;
    freeaddrinfo(res);
    return true;
}

Result<socket_t> connect_tcp(const std::string& host, int port, int timeout_ms) {
    struct sockaddr_in addr;
    std::memset(&addr, 0, sizeof(addr));
    addr.sin_family = AF_INET;
    addr.sin_port = htons(static_cast<uint16_t>(port));
    if (!resolve_ipv4(host, addr.sin_addr)) {
        return Result<socket_t>::Err("Failed to resolve host: " + host);
    }

    socket_t sock = socket(AF_INET, SOCK_STREAM, 0);
    if (sock < 0) {
        return Result<socket_t>::Err("Failed to create socket");
    }
    set_nonblocking(sock);

    int ret = connect(sock, reinterpret_cast<struct sockaddr*>(&addr), sizeof(addr));
    if (ret < 0 && errno != EINPROGRESS) {
        std::string err = strerror(errno);
        close_socket(sock);
        return Result<socket_t>::Err("Failed to connect: " + err);
    }

    if (ret < 0) {
        if (poll_socket(sock, POLLOUT, timeout_ms) == 0) {
            close_socket(sock);
            return Result<socket_t>::Err("Connection timed out: " + host);
        }
        int sock_err = 0;
        socklen_t err_len = sizeof(sock_err);
        getsockopt(sock, SOL_SOCKET, SO_ERROR, &sock_err, &err_len);
        if (sock_err != 0) {
            close_socket(sock);
            return Result<socket_t>::Err("Connection failed: " + std::string(strerror(sock_err)));
        }
    }
    return Result<socket_t>::Ok(sock);
}

void set_nonblocking(socket_t sock) {
    int flags = fcntl(sock, F_GETFL, 0);
    fcntl(sock, F_SETFL, flags | O_NONBLOCK);
}

int poll_socket(socket_t sock, short events, int timeout_ms) {
    struct pollfd pfd;
    pfd.fd = sock;
    pfd.events = events;
    pfd.revents = 0;
    int ret = poll(&pfd, 1, timeout_ms);
    return (ret > 0) ? pfd.revents : 0;
}

void close_socket(socket_t sock) {
    if (sock != JOBRUNNER_INVALID_SOCKET) close(sock);
}

} // namespace platform
