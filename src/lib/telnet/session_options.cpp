#include "telexpect/telnet/session_options.h"

#include "telexpect/net/tcp_stream.h"

#include <utility>

namespace telexpect::telnet {

bool apply_target_url(std::string_view url, SessionOptions& opt)
{
    net::TcpStream::Options topt{};
    topt.connect_timeout_ms = opt.connect_timeout_ms;
    topt.nodelay = opt.tcp_nodelay;
    topt.keepalive = opt.tcp_keepalive;

    std::string host;
    std::uint16_t port = 0;
    if (!net::TcpStream::parse_url(std::string(url), host, port, topt)) {
        return false;
    }

    opt.host = std::move(host);
    opt.port = port;
    opt.connect_timeout_ms = topt.connect_timeout_ms;
    opt.tcp_nodelay = topt.nodelay;
    opt.tcp_keepalive = topt.keepalive;
    return true;
}

} // namespace telexpect::telnet
