#include "telexpect/telnet/negotiator.h"

#include "telexpect/core/logging.h"
#include "telexpect/telnet/telnet_codes.h"

#include <vector>

namespace telexpect::telnet {

static constexpr const char* TAG = "telnet";

using namespace codes;

// NAWS values are 16-bit big-endian; a 255 data byte must be doubled.
static void push_naws_u16(std::vector<std::uint8_t>& out, std::uint16_t v)
{
    const std::uint8_t hi = static_cast<std::uint8_t>(v >> 8);
    const std::uint8_t lo = static_cast<std::uint8_t>(v & 0xFF);
    out.push_back(hi);
    if (hi == IAC) out.push_back(IAC);
    out.push_back(lo);
    if (lo == IAC) out.push_back(IAC);
}

Status ControlNegotiator::send_bytes(const std::uint8_t* data, std::size_t len)
{
    _transcript.append(data, len);
    const Status st = _stream.write_all(data, len);
    if (st != Status::Ok) {
        _error = "error writing control reply to socket";
    }
    return st;
}

Status ControlNegotiator::reply(std::uint8_t cmd, std::uint8_t opt)
{
    const std::uint8_t out[] = {IAC, cmd, opt};
    TX_LOGV(TAG, "reply IAC %u %u", static_cast<unsigned>(cmd), static_cast<unsigned>(opt));
    return send_bytes(out, sizeof(out));
}

net::ReadResult ControlNegotiator::next(std::uint8_t& out)
{
    for (;;) {
        const net::ReadResult r = _source.next_byte(out);
        if (r != net::ReadResult::TimedOut || !_retryIdle || _stream.now_ms() >= _deadline) {
            return r;
        }
    }
}

Status ControlNegotiator::read_control_byte(std::uint8_t& out)
{
    const net::ReadResult r = next(out);
    if (r == net::ReadResult::Byte) {
        return Status::Ok;
    }
    if (r == net::ReadResult::TimedOut && _retryIdle) {
        _error = "control sequence not completed before the deadline";
        return Status::Timeout;
    }
    _error = "truncated control sequence";
    return Status::ProtocolViolation;
}

Status ControlNegotiator::handle_command()
{
    _error.clear();

    std::uint8_t cmd = 0;
    if (Status st = read_control_byte(cmd); st != Status::Ok) {
        return st;
    }

    if (cmd == DO || cmd == DONT || cmd == WILL || cmd == WONT) {
        std::uint8_t opt = 0;
        if (Status st = read_control_byte(opt); st != Status::Ok) {
            return st;
        }
        const std::uint8_t answer = (cmd == DO || cmd == DONT) ? WONT : DONT;
        return reply(answer, opt);
    }

    // IAC IAC lands here too: an escaped 255 is not expected from a console.
    _error = "unknown control character " + std::to_string(static_cast<unsigned>(cmd));
    TX_LOGW(TAG, "%s", _error.c_str());
    return Status::ProtocolViolation;
}

Status ControlNegotiator::request_window_size(std::uint16_t width, std::uint16_t height)
{
    _error.clear();

    const std::uint8_t offer[] = {IAC, WILL, TELOPT_NAWS};
    if (Status st = send_bytes(offer, sizeof(offer)); st != Status::Ok) {
        return st;
    }

    std::uint8_t c = 0;
    if (next(c) != net::ReadResult::Byte) {
        _error = "no answer to window size offer";
        return Status::Timeout;
    }
    if (c != IAC) {
        _error = "unknown control character " + std::to_string(static_cast<unsigned>(c));
        return Status::ProtocolViolation;
    }

    if (Status st = read_control_byte(c); st != Status::Ok) {
        return st;
    }
    if (c == DONT || c == WONT) {
        _error = "server refuses to use NAWS";
        TX_LOGW(TAG, "%s", _error.c_str());
        return Status::Refused;
    }
    if (c != DO && c != WILL) {
        _error = "unknown control character " + std::to_string(static_cast<unsigned>(c));
        return Status::ProtocolViolation;
    }

    // The peer repeats the option; it carries no extra information here.
    std::uint8_t opt = 0;
    if (Status st = read_control_byte(opt); st != Status::Ok) {
        return st;
    }
    if (opt != TELOPT_NAWS) {
        _error = "unexpected option " + std::to_string(static_cast<unsigned>(opt)) + " in NAWS answer";
        return Status::ProtocolViolation;
    }

    std::vector<std::uint8_t> sub;
    sub.reserve(13);
    sub.push_back(IAC);
    sub.push_back(SB);
    sub.push_back(TELOPT_NAWS);
    push_naws_u16(sub, width);
    push_naws_u16(sub, height);
    sub.push_back(IAC);
    sub.push_back(SE);

    TX_LOGD(TAG, "window size %ux%u", static_cast<unsigned>(width), static_cast<unsigned>(height));
    return send_bytes(sub.data(), sub.size());
}

} // namespace telexpect::telnet
