#pragma once

#include "telexpect/core/status.h"

#include <cstddef>
#include <cstdint>

namespace telexpect::net {

enum class ReadResult : std::uint8_t {
    Byte,       // one byte was delivered
    TimedOut,   // nothing arrived within the read timeout
    Closed,     // peer closed the stream, or it was never open
    Error,      // transport failure
};

// Blocking duplex byte stream used by a telnet session.
//
// A session owns exactly one stream. Implementations need not be
// thread-safe; the session serializes every call.
class IByteStream {
public:
    virtual ~IByteStream() = default;

    virtual bool is_open() const noexcept = 0;

    // Wait at most timeout_ms for a single byte.
    virtual ReadResult read_byte(std::uint8_t& out, int timeout_ms) = 0;

    // Write every byte or fail with TransportError / NotConnected.
    virtual Status write_all(const std::uint8_t* data, std::size_t len) = 0;

    // Safe to call repeatedly; only the first call releases the transport.
    virtual Status close() = 0;

    // Monotonic clock used for command deadlines.
    virtual std::uint64_t now_ms() = 0;
};

} // namespace telexpect::net
