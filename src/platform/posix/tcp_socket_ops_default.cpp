#include "telexpect/platform/tcp_socket_ops.h"

#include "telexpect/platform/posix/tcp_socket_ops_posix.h"

namespace telexpect::platform {

telexpect::net::ITcpSocketOps& default_tcp_socket_ops()
{
    return telexpect::net::get_posix_socket_ops();
}

} // namespace telexpect::platform
