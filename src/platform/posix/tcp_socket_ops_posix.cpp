#include "telexpect/platform/posix/tcp_socket_ops_posix.h"

#include <cerrno>
#include <cstring>

#include <fcntl.h>
#include <netdb.h>
#include <netinet/in.h>
#include <netinet/tcp.h>
#include <poll.h>
#include <sys/socket.h>
#include <sys/types.h>
#include <time.h>
#include <unistd.h>

namespace telexpect::net {

static int poll_one(int fd, short events, int timeout_ms)
{
    struct pollfd pfd {};
    pfd.fd = fd;
    pfd.events = events;

    for (;;) {
        const int pr = ::poll(&pfd, 1, timeout_ms < 0 ? -1 : timeout_ms);
        if (pr < 0 && errno == EINTR) {
            continue;
        }
        if (pr > 0 && (pfd.revents & (POLLERR | POLLHUP | POLLNVAL)) != 0 &&
            (pfd.revents & events) == 0) {
            // Let the subsequent recv/send/getsockopt report the actual error.
            return 1;
        }
        return pr;
    }
}

class PosixTcpSocketOps final : public ITcpSocketOps {
public:
    PosixTcpSocketOps()
    {
        _hints.ai_family = AF_UNSPEC;
        _hints.ai_socktype = SOCK_STREAM;
        _hints.ai_protocol = IPPROTO_TCP;
    }

    int socket(int domain, int type, int protocol) override
    {
        return ::socket(domain, type, protocol);
    }

    int close(int fd) override
    {
        if (fd < 0) {
            return 0;
        }
        return ::close(fd);
    }

    int connect(int fd, const struct sockaddr* addr, SockLen addrlen) override
    {
        return ::connect(fd, addr, static_cast<socklen_t>(addrlen));
    }

    int set_nonblocking(int fd) override
    {
        const int flags = ::fcntl(fd, F_GETFL, 0);
        if (flags < 0) return -1;
        return ::fcntl(fd, F_SETFL, flags | O_NONBLOCK);
    }

    int poll_readable(int fd, int timeout_ms) override
    {
        return poll_one(fd, POLLIN, timeout_ms);
    }

    int poll_writable(int fd, int timeout_ms) override
    {
        return poll_one(fd, POLLOUT, timeout_ms);
    }

    SSize send(int fd, const void* buf, std::size_t len) override
    {
        return ::send(fd, buf, len, MSG_DONTWAIT | MSG_NOSIGNAL);
    }

    SSize recv(int fd, void* buf, std::size_t len) override
    {
        return ::recv(fd, buf, len, MSG_DONTWAIT);
    }

    int get_so_error(int fd) override
    {
        int err = 0;
        socklen_t len = sizeof(err);
        if (::getsockopt(fd, SOL_SOCKET, SO_ERROR, &err, &len) != 0) {
            return errno;
        }
        return err;
    }

    void apply_stream_socket_options(int fd, bool nodelay, bool keepalive) override
    {
        if (fd < 0) return;
        if (nodelay) {
            int v = 1;
            (void)::setsockopt(fd, IPPROTO_TCP, TCP_NODELAY, &v, sizeof(v));
        }
        if (keepalive) {
            int v = 1;
            (void)::setsockopt(fd, SOL_SOCKET, SO_KEEPALIVE, &v, sizeof(v));
        }
    }

    int getaddrinfo(const char* host, const char* port, const void* hints, AddrInfo** out) override
    {
        struct addrinfo* res = nullptr;
        const int gai = ::getaddrinfo(host, port, static_cast<const struct addrinfo*>(hints), &res);
        if (gai == 0) {
            *out = reinterpret_cast<AddrInfo*>(res);
        } else {
            *out = nullptr;
        }
        return gai;
    }

    const void* tcp_stream_addrinfo_hints() const noexcept override
    {
        return &_hints;
    }

    void freeaddrinfo(AddrInfo* ai) override
    {
        if (ai) {
            ::freeaddrinfo(reinterpret_cast<struct addrinfo*>(ai));
        }
    }

    AddrInfo* addrinfo_next(AddrInfo* ai) override
    {
        if (!ai) return nullptr;
        return reinterpret_cast<AddrInfo*>(reinterpret_cast<struct addrinfo*>(ai)->ai_next);
    }

    int addrinfo_family(AddrInfo* ai) override
    {
        if (!ai) return 0;
        return reinterpret_cast<const struct addrinfo*>(ai)->ai_family;
    }

    int addrinfo_socktype(AddrInfo* ai) override
    {
        if (!ai) return 0;
        return reinterpret_cast<const struct addrinfo*>(ai)->ai_socktype;
    }

    int addrinfo_protocol(AddrInfo* ai) override
    {
        if (!ai) return 0;
        return reinterpret_cast<const struct addrinfo*>(ai)->ai_protocol;
    }

    const struct sockaddr* addrinfo_addr(AddrInfo* ai, SockLen* out_len) override
    {
        if (!ai) return nullptr;
        const struct addrinfo* a = reinterpret_cast<const struct addrinfo*>(ai);
        if (out_len) {
            *out_len = static_cast<SockLen>(a->ai_addrlen);
        }
        return a->ai_addr;
    }

    std::uint64_t now_ms() override
    {
        struct timespec ts {};
        ::clock_gettime(CLOCK_MONOTONIC, &ts);
        return static_cast<std::uint64_t>(ts.tv_sec) * 1000ULL +
               static_cast<std::uint64_t>(ts.tv_nsec) / 1000000ULL;
    }

    int last_errno() override
    {
        return errno;
    }

    const char* err_string(int errno_val) override
    {
        return std::strerror(errno_val);
    }

    bool is_would_block(int errno_val) const noexcept override
    {
        return errno_val == EWOULDBLOCK || errno_val == EAGAIN;
    }

    bool is_in_progress(int errno_val) const noexcept override
    {
        return errno_val == EINPROGRESS || errno_val == EALREADY;
    }

    bool is_peer_gone(int errno_val) const noexcept override
    {
        return errno_val == ECONNRESET || errno_val == ENOTCONN || errno_val == EPIPE;
    }

    int err_timed_out() const noexcept override { return ETIMEDOUT; }
    int err_conn_refused() const noexcept override { return ECONNREFUSED; }
    int err_host_unreach() const noexcept override { return EHOSTUNREACH; }

private:
    struct addrinfo _hints {};
};

// Global instance for POSIX platform
static PosixTcpSocketOps g_posix_socket_ops;

ITcpSocketOps& get_posix_socket_ops()
{
    return g_posix_socket_ops;
}

} // namespace telexpect::net
