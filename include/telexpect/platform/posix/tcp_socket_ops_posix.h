#pragma once

#include "telexpect/net/tcp_socket_ops.h"

namespace telexpect::net {

// Get the POSIX socket operations implementation.
ITcpSocketOps& get_posix_socket_ops();

} // namespace telexpect::net
