#include "telexpect/net/tcp_stream.h"

#include "telexpect/core/logging.h"

#include <algorithm>
#include <limits>
#include <string_view>
#include <utility>

namespace telexpect::net {

static constexpr const char* TAG = "tcp";

static constexpr std::uint16_t TELNET_DEFAULT_PORT = 23;
static constexpr std::size_t RX_BUF_SIZE = 4096;

static bool starts_with(std::string_view s, std::string_view p)
{
    return s.size() >= p.size() && s.substr(0, p.size()) == p;
}

static bool parse_bool(std::string_view v, bool def)
{
    if (v == "1" || v == "true" || v == "yes" || v == "on") return true;
    if (v == "0" || v == "false" || v == "no" || v == "off") return false;
    return def;
}

static int parse_int(std::string_view v, int def)
{
    if (v.empty()) return def;
    int sign = 1;
    std::size_t i = 0;
    if (v[0] == '-') { sign = -1; i = 1; }
    int out = 0;
    for (; i < v.size(); ++i) {
        if (v[i] < '0' || v[i] > '9') return def;
        const int d = (v[i] - '0');
        if (out > (std::numeric_limits<int>::max() - d) / 10) return def;
        out = out * 10 + d;
    }
    return out * sign;
}

TcpStream::TcpStream(ITcpSocketOps& socket_ops)
    : _socket_ops(socket_ops)
{
}

TcpStream::~TcpStream()
{
    (void)close();
}

void TcpStream::set_error_from_errno(int e)
{
    _last_errno = e;
    _state = State::Error;
}

bool TcpStream::parse_url(const std::string& url,
                          std::string& outHost,
                          std::uint16_t& outPort,
                          Options& outOpt)
{
    // Expect: telnet://host[:port][?k=v&k=v] or tcp://host:port[?k=v&k=v]
    std::string_view s(url);

    bool portRequired = true;
    if (starts_with(s, "telnet://")) {
        s.remove_prefix(9);
        portRequired = false;
    } else if (starts_with(s, "tcp://")) {
        s.remove_prefix(6);
    } else {
        return false;
    }

    // split query
    std::string_view authority = s;
    std::string_view query;
    if (auto qpos = s.find('?'); qpos != std::string_view::npos) {
        authority = s.substr(0, qpos);
        query = s.substr(qpos + 1);
    }

    if (authority.empty()) return false;

    // authority: host[:port] or [ipv6][:port]
    std::string host;
    std::string_view portPart;

    if (authority[0] == '[') {
        auto rb = authority.find(']');
        if (rb == std::string_view::npos) return false;
        host.assign(authority.substr(1, rb - 1));
        if (rb + 1 < authority.size()) {
            if (authority[rb + 1] != ':') return false;
            portPart = authority.substr(rb + 2);
            if (portPart.empty()) return false;
        }
    } else {
        auto colon = authority.rfind(':');
        if (colon == std::string_view::npos) {
            host.assign(authority);
        } else {
            host.assign(authority.substr(0, colon));
            portPart = authority.substr(colon + 1);
            if (portPart.empty()) return false;
        }
    }

    if (host.empty()) return false;

    int p = TELNET_DEFAULT_PORT;
    if (!portPart.empty()) {
        p = parse_int(portPart, -1);
    } else if (portRequired) {
        return false;
    }
    if (p <= 0 || p > 65535) return false;

    // options absent from the query keep the caller's values
    Options opt = outOpt;

    while (!query.empty()) {
        auto amp = query.find('&');
        std::string_view kv = (amp == std::string_view::npos) ? query : query.substr(0, amp);
        query = (amp == std::string_view::npos) ? std::string_view{} : query.substr(amp + 1);

        if (kv.empty()) continue;
        auto eq = kv.find('=');
        std::string_view k = (eq == std::string_view::npos) ? kv : kv.substr(0, eq);
        std::string_view v = (eq == std::string_view::npos) ? std::string_view{} : kv.substr(eq + 1);

        if (k == "connect_timeout_ms") opt.connect_timeout_ms = std::max(0, parse_int(v, opt.connect_timeout_ms));
        else if (k == "nodelay") opt.nodelay = parse_bool(v, opt.nodelay);
        else if (k == "keepalive") opt.keepalive = parse_bool(v, opt.keepalive);
        // unknown keys are ignored (forward compatible)
    }

    outHost = std::move(host);
    outPort = static_cast<std::uint16_t>(p);
    outOpt = opt;
    return true;
}

Status TcpStream::open(const std::string& host, std::uint16_t port, const Options& opt)
{
    (void)close();

    _state = State::Idle;
    _last_errno = 0;
    _host = host;
    _port = port;
    _opt = opt;
    _rx.assign(RX_BUF_SIZE, 0);
    _rx_pos = 0;
    _rx_len = 0;

    if (_host.empty() || _port == 0) {
        return Status::InvalidRequest;
    }

    AddrInfo* res = nullptr;
    const std::string portStr = std::to_string(_port);
    const int gai = _socket_ops.getaddrinfo(_host.c_str(), portStr.c_str(),
                                            _socket_ops.tcp_stream_addrinfo_hints(), &res);
    if (gai != 0 || !res) {
        // gai doesn't set errno reliably
        TX_LOGW(TAG, "cannot resolve %s (gai=%d)", _host.c_str(), gai);
        set_error_from_errno(_socket_ops.err_host_unreach());
        if (res) _socket_ops.freeaddrinfo(res);
        return Status::TransportError;
    }

    int lastErr = 0;

    for (auto* ai = res; ai; ai = _socket_ops.addrinfo_next(ai)) {
        const int fd = _socket_ops.socket(_socket_ops.addrinfo_family(ai),
                                          _socket_ops.addrinfo_socktype(ai),
                                          _socket_ops.addrinfo_protocol(ai));
        if (fd < 0) {
            lastErr = _socket_ops.last_errno();
            continue;
        }

        _fd = fd;
        _socket_ops.apply_stream_socket_options(_fd, _opt.nodelay, _opt.keepalive);
        if (_socket_ops.set_nonblocking(_fd) != 0) {
            lastErr = _socket_ops.last_errno();
            (void)_socket_ops.close(_fd);
            _fd = -1;
            continue;
        }

        SockLen addrlen = 0;
        const struct sockaddr* addr = _socket_ops.addrinfo_addr(ai, &addrlen);
        const std::uint64_t start = _socket_ops.now_ms();
        const int cr = _socket_ops.connect(_fd, addr, addrlen);
        if (cr == 0) {
            _state = State::Connected;
            break;
        }

        const int connect_err = _socket_ops.last_errno();
        if (_socket_ops.is_in_progress(connect_err) || _socket_ops.is_would_block(connect_err)) {
            if (wait_connected(start) == Status::Ok) {
                break;
            }
            lastErr = _last_errno;
        } else {
            lastErr = connect_err;
        }

        (void)_socket_ops.close(_fd);
        _fd = -1;
    }

    _socket_ops.freeaddrinfo(res);

    if (_fd < 0) {
        set_error_from_errno(lastErr != 0 ? lastErr : _socket_ops.err_conn_refused());
        TX_LOGW(TAG, "cannot connect to %s on port %u: %s",
                _host.c_str(), static_cast<unsigned>(_port), _socket_ops.err_string(_last_errno));
        return Status::TransportError;
    }

    _state = State::Connected;
    TX_LOGD(TAG, "connected to %s:%u", _host.c_str(), static_cast<unsigned>(_port));
    return Status::Ok;
}

Status TcpStream::wait_connected(std::uint64_t start_ms)
{
    for (;;) {
        int remaining = -1;
        if (_opt.connect_timeout_ms > 0) {
            const std::uint64_t elapsed = _socket_ops.now_ms() - start_ms;
            if (elapsed >= static_cast<std::uint64_t>(_opt.connect_timeout_ms)) {
                set_error_from_errno(_socket_ops.err_timed_out());
                return Status::Timeout;
            }
            remaining = _opt.connect_timeout_ms - static_cast<int>(elapsed);
        }

        const int pr = _socket_ops.poll_writable(_fd, remaining);
        if (pr < 0) {
            set_error_from_errno(_socket_ops.last_errno());
            return Status::TransportError;
        }
        if (pr == 0) {
            continue; // re-check the deadline
        }

        const int err = _socket_ops.get_so_error(_fd);
        if (err != 0) {
            set_error_from_errno(err);
            return Status::TransportError;
        }
        _state = State::Connected;
        return Status::Ok;
    }
}

bool TcpStream::is_open() const noexcept
{
    return _fd >= 0 && (_state == State::Connected || _state == State::PeerClosed);
}

ReadResult TcpStream::fill_rx(int timeout_ms)
{
    const int pr = _socket_ops.poll_readable(_fd, timeout_ms);
    if (pr == 0) {
        return ReadResult::TimedOut;
    }
    if (pr < 0) {
        set_error_from_errno(_socket_ops.last_errno());
        return ReadResult::Error;
    }

    const SSize n = _socket_ops.recv(_fd, _rx.data(), _rx.size());
    if (n > 0) {
        _rx_pos = 0;
        _rx_len = static_cast<std::size_t>(n);
        return ReadResult::Byte;
    }
    if (n == 0) {
        _state = State::PeerClosed;
        return ReadResult::Closed;
    }

    const int err = _socket_ops.last_errno();
    if (_socket_ops.is_would_block(err)) {
        // spurious wakeup; caller treats it like an idle read
        return ReadResult::TimedOut;
    }
    if (_socket_ops.is_peer_gone(err)) {
        TX_LOGW(TAG, "TCP peer closed/reset connection (%s, errno=%d); treating as EOF",
                _socket_ops.err_string(err), err);
        _state = State::PeerClosed;
        return ReadResult::Closed;
    }
    set_error_from_errno(err);
    return ReadResult::Error;
}

ReadResult TcpStream::read_byte(std::uint8_t& out, int timeout_ms)
{
    if (_rx_pos < _rx_len) {
        out = _rx[_rx_pos++];
        return ReadResult::Byte;
    }

    if (_fd < 0 || _state == State::Closed || _state == State::Idle) {
        return ReadResult::Closed;
    }
    if (_state == State::PeerClosed) {
        return ReadResult::Closed;
    }
    if (_state == State::Error) {
        return ReadResult::Error;
    }

    const ReadResult r = fill_rx(timeout_ms);
    if (r != ReadResult::Byte) {
        return r;
    }
    out = _rx[_rx_pos++];
    return ReadResult::Byte;
}

Status TcpStream::write_all(const std::uint8_t* data, std::size_t len)
{
    if (!is_open()) {
        return Status::NotConnected;
    }
    if (len == 0) {
        return Status::Ok;
    }
    if (!data) {
        return Status::InvalidRequest;
    }

    const std::uint64_t start = _socket_ops.now_ms();
    std::size_t off = 0;
    while (off < len) {
        const SSize n = _socket_ops.send(_fd, data + off, len - off);
        if (n > 0) {
            off += static_cast<std::size_t>(n);
            continue;
        }

        const int err = (n < 0) ? _socket_ops.last_errno() : 0;
        if (n < 0 && !_socket_ops.is_would_block(err)) {
            if (_socket_ops.is_peer_gone(err)) {
                _state = State::PeerClosed;
                _last_errno = err;
            } else {
                set_error_from_errno(err);
            }
            TX_LOGW(TAG, "write failed after %u/%u bytes: %s",
                    static_cast<unsigned>(off), static_cast<unsigned>(len), _socket_ops.err_string(err));
            return Status::TransportError;
        }

        // backpressure: wait for room within the write deadline
        int remaining = -1;
        if (_opt.write_timeout_ms > 0) {
            const std::uint64_t elapsed = _socket_ops.now_ms() - start;
            if (elapsed >= static_cast<std::uint64_t>(_opt.write_timeout_ms)) {
                _last_errno = _socket_ops.err_timed_out();
                return Status::TransportError;
            }
            remaining = _opt.write_timeout_ms - static_cast<int>(elapsed);
        }
        if (_socket_ops.poll_writable(_fd, remaining) < 0) {
            set_error_from_errno(_socket_ops.last_errno());
            return Status::TransportError;
        }
    }

    return Status::Ok;
}

Status TcpStream::close()
{
    Status st = Status::Ok;
    if (_fd >= 0) {
        if (_socket_ops.close(_fd) != 0) {
            _last_errno = _socket_ops.last_errno();
            TX_LOGW(TAG, "error while closing socket: %s", _socket_ops.err_string(_last_errno));
            st = Status::TransportError;
        }
        _fd = -1;
        _state = State::Closed;
    }
    _rx_pos = 0;
    _rx_len = 0;
    return st;
}

} // namespace telexpect::net
