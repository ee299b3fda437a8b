#pragma once

#include "telexpect/core/status.h"
#include "telexpect/net/byte_stream.h"
#include "telexpect/telnet/byte_source.h"
#include "telexpect/telnet/transcript.h"

#include <cstdint>
#include <string>

namespace telexpect::telnet {

// Refuse-everything telnet option negotiator.
//
// The session never claims support for any option: DO/DONT get WONT,
// WILL/WONT get DONT. Replies go straight to the stream and into the
// transcript.
class ControlNegotiator {
public:
    ControlNegotiator(net::IByteStream& stream, ByteSource& source, Transcript& transcript)
        : _stream(stream)
        , _source(source)
        , _transcript(transcript)
    {
    }

    // Consume and answer the sequence that follows an IAC already read
    // by the caller. ProtocolViolation for anything but DO/DONT/WILL/WONT.
    Status handle_command();

    // Idle reads inside a control sequence are retried until deadline_ms
    // (stream clock) instead of ending it. Past the deadline: Timeout.
    void keep_waiting_until(std::uint64_t deadline_ms)
    {
        _retryIdle = true;
        _deadline = deadline_ms;
    }

    // One-shot NAWS handshake (RFC 1073).
    Status request_window_size(std::uint16_t width, std::uint16_t height);

    // Description of the last failure, empty after success.
    const std::string& error() const noexcept { return _error; }

private:
    Status send_bytes(const std::uint8_t* data, std::size_t len);
    Status reply(std::uint8_t cmd, std::uint8_t opt);
    Status read_control_byte(std::uint8_t& out);
    net::ReadResult next(std::uint8_t& out);

    net::IByteStream& _stream;
    ByteSource& _source;
    Transcript& _transcript;
    std::string _error;

    bool _retryIdle{false};
    std::uint64_t _deadline{0};
};

} // namespace telexpect::telnet
