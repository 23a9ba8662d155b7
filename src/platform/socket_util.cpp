#include "socket_util.hpp"
#include <cerrno>
#include <sys/socket.h>
#include <fcntl.h>
#include <unistd.h>

namespace platform {

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

int wait_connected(socket_t sock, int timeout_ms) {
    if (poll_socket(sock, POLLOUT, timeout_ms) == 0) return ETIMEDOUT;

    int sock_err = 0;
    socklen_t err_len = sizeof(sock_err);
    if (getsockopt(sock, SOL_SOCKET, SO_ERROR, &sock_err, &err_len) != 0) return errno;
    return sock_err;
}

void close_socket(socket_t sock) {
    close(sock);
}

} // namespace platform
