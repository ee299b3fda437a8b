#include "telexpect/telnet/byte_source.h"

namespace telexpect::telnet {

net::ReadResult ByteSource::next_byte(std::uint8_t& out)
{
    const net::ReadResult r = _stream.read_byte(out, _read_timeout_ms);
    if (r == net::ReadResult::Byte) {
        _transcript.append(out);
    }
    return r;
}

} // namespace telexpect::telnet
