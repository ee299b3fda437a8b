#pragma once

#include "telexpect/net/tcp_socket_ops.h"

namespace telexpect::platform {

// Return the platform's default TCP socket operations implementation.
// Implemented in platform-specific .cpp.
telexpect::net::ITcpSocketOps& default_tcp_socket_ops();

} // namespace telexpect::platform
