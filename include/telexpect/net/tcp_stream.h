#pragma once

#include "telexpect/net/byte_stream.h"
#include "telexpect/net/tcp_socket_ops.h"

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace telexpect::net {

// Blocking TCP byte stream built on ITcpSocketOps.
// The socket itself is nonblocking; deadlines are enforced with poll.
class TcpStream final : public IByteStream {
public:
    struct Options {
        int connect_timeout_ms = 10000;
        int write_timeout_ms = 10000;
        bool nodelay = true;
        bool keepalive = false;
    };

    enum class State {
        Idle,
        Connected,
        PeerClosed,
        Error,
        Closed
    };

    explicit TcpStream(ITcpSocketOps& socket_ops);
    ~TcpStream() override;

    TcpStream(const TcpStream&) = delete;
    TcpStream& operator=(const TcpStream&) = delete;

    // telnet://host[:port][?opt=val&...] or tcp://host:port[?opt=val&...]
    // Recognised options: connect_timeout_ms, nodelay, keepalive.
    static bool parse_url(const std::string& url,
                          std::string& outHost,
                          std::uint16_t& outPort,
                          Options& outOpt);

    Status open(const std::string& host, std::uint16_t port, const Options& opt);

    bool is_open() const noexcept override;
    ReadResult read_byte(std::uint8_t& out, int timeout_ms) override;
    Status write_all(const std::uint8_t* data, std::size_t len) override;
    Status close() override;
    std::uint64_t now_ms() override { return _socket_ops.now_ms(); }

    State state() const noexcept { return _state; }
    int last_errno() const noexcept { return _last_errno; }
    const std::string& host() const noexcept { return _host; }
    std::uint16_t port() const noexcept { return _port; }

private:
    void set_error_from_errno(int e);
    Status wait_connected(std::uint64_t start_ms);
    ReadResult fill_rx(int timeout_ms);

    ITcpSocketOps& _socket_ops;
    int _fd = -1;

    State _state = State::Idle;

    std::string _host;
    std::uint16_t _port = 0;
    Options _opt{};

    // receive buffer: bytes [_rx_pos, _rx_len) are unread
    std::vector<std::uint8_t> _rx;
    std::size_t _rx_pos = 0;
    std::size_t _rx_len = 0;

    int _last_errno = 0;
};

} // namespace telexpect::net
