#pragma once

#include "telexpect/net/byte_stream.h"
#include "telexpect/telnet/transcript.h"

#include <cstdint>

namespace telexpect::telnet {

// Single-byte reader used by the prompt-wait loop and the negotiator.
// Every byte that comes off the wire is recorded in the transcript.
class ByteSource {
public:
    ByteSource(net::IByteStream& stream, Transcript& transcript, int read_timeout_ms)
        : _stream(stream)
        , _transcript(transcript)
        , _read_timeout_ms(read_timeout_ms)
    {
    }

    net::ReadResult next_byte(std::uint8_t& out);

    int read_timeout_ms() const noexcept { return _read_timeout_ms; }

private:
    net::IByteStream& _stream;
    Transcript& _transcript;
    int _read_timeout_ms;
};

} // namespace telexpect::telnet
