#include "telexpect/telnet/session.h"

#include "telexpect/core/logging.h"
#include "telexpect/net/tcp_stream.h"
#include "telexpect/telnet/buffer_formatter.h"
#include "telexpect/telnet/byte_source.h"
#include "telexpect/telnet/login_sequencer.h"
#include "telexpect/telnet/negotiator.h"
#include "telexpect/telnet/telnet_codes.h"

#include <algorithm>
#include <cmath>
#include <utility>

namespace telexpect::telnet {

static constexpr const char* TAG = "session";

// Marks the session busy for the duration of one send or wait.
class Session::ActiveGuard {
public:
    explicit ActiveGuard(std::atomic<bool>& flag)
        : _flag(flag)
        , _acquired(!flag.exchange(true))
    {
    }

    ~ActiveGuard()
    {
        if (_acquired) {
            _flag.store(false);
        }
    }

    ActiveGuard(const ActiveGuard&) = delete;
    ActiveGuard& operator=(const ActiveGuard&) = delete;

    bool acquired() const noexcept { return _acquired; }

private:
    std::atomic<bool>& _flag;
    bool _acquired;
};

Session::Session(SessionOptions opt)
    : _opt(std::move(opt))
    , _pager(_opt.pager_markers)
{
}

Session::~Session()
{
    (void)close_stream();
}

Status Session::fail(Status st, std::string message)
{
    _last_error = std::move(message);
    TX_LOGW(TAG, "%s: %s", to_string(st), _last_error.c_str());
    return st;
}

bool Session::is_open() const noexcept
{
    return _stream && _stream->is_open();
}

Status Session::connect(net::ITcpSocketOps& socketOps)
{
    _last_error.clear();

    auto tcp = std::make_unique<net::TcpStream>(socketOps);
    net::TcpStream::Options topt{};
    topt.connect_timeout_ms = _opt.connect_timeout_ms;
    topt.write_timeout_ms = _opt.command_timeout_ms;
    topt.nodelay = _opt.tcp_nodelay;
    topt.keepalive = _opt.tcp_keepalive;

    const Status st = tcp->open(_opt.host, _opt.port, topt);
    if (st != Status::Ok) {
        return fail(st, "cannot connect to " + _opt.host + " on port " + std::to_string(_opt.port));
    }

    TX_LOGI(TAG, "connected to %s:%u", _opt.host.c_str(), static_cast<unsigned>(_opt.port));
    return attach(std::move(tcp));
}

Status Session::attach(std::unique_ptr<net::IByteStream> stream)
{
    if (!stream || !stream->is_open()) {
        return fail(Status::NotConnected, "stream is not open");
    }

    ActiveGuard guard(_active);
    if (!guard.acquired()) {
        return fail(Status::Busy, "another operation is active on this session");
    }

    if (_stream) {
        (void)_stream->close();
    }
    _stream = std::move(stream);
    _buffer.clear();
    _last_error.clear();

    if (!_prompt.empty()) {
        return wait_locked(_prompt, false);
    }
    return Status::Ok;
}

Status Session::disconnect()
{
    ActiveGuard guard(_active);
    if (!guard.acquired()) {
        return fail(Status::Busy, "cannot disconnect while another operation is active");
    }
    return close_stream();
}

Status Session::close_stream()
{
    if (!_stream) {
        return Status::Ok;
    }

    const Status st = _stream->close();
    _stream.reset();
    if (st != Status::Ok) {
        return fail(st, "error while closing telnet socket");
    }
    TX_LOGD(TAG, "disconnected");
    return Status::Ok;
}

// ----------------------------
// Command Sender
// ----------------------------

Status Session::write_bytes(std::string_view bytes)
{
    _transcript.append(bytes);
    const Status st = _stream->write_all(reinterpret_cast<const std::uint8_t*>(bytes.data()), bytes.size());
    if (st != Status::Ok) {
        return fail(st == Status::NotConnected ? st : Status::TransportError, "error writing to socket");
    }
    return Status::Ok;
}

Status Session::send_locked(std::string_view text, bool appendEol, bool continuation)
{
    if (!is_open()) {
        return fail(Status::NotConnected,
                    "telnet connection closed; connect before sending");
    }

    if (!continuation) {
        _buffer.clear();
    }

    if (!appendEol) {
        return write_bytes(text);
    }

    std::string line;
    line.reserve(text.size() + _opt.eol.size());
    line.append(text.data(), text.size());
    line.append(_opt.eol);
    return write_bytes(line);
}

Status Session::send(std::string_view text, bool appendEol, bool continuation)
{
    ActiveGuard guard(_active);
    if (!guard.acquired()) {
        return fail(Status::Busy, "another operation is active on this session");
    }
    _last_error.clear();
    return send_locked(text, appendEol, continuation);
}

// ----------------------------
// Prompt-Wait Engine
// ----------------------------

Status Session::wait_locked(const PromptPattern& pattern, bool continuation)
{
    if (!is_open()) {
        return fail(Status::NotConnected, "telnet connection closed");
    }

    if (!continuation) {
        _buffer.clear();
    }

    ByteSource source(*_stream, _transcript, _opt.read_timeout_ms);
    ControlNegotiator negotiator(*_stream, source, _transcript);

    const std::uint64_t start = _stream->now_ms();
    const std::uint64_t timeout = static_cast<std::uint64_t>(std::max(0, _opt.command_timeout_ms));
    if (!_opt.idle_timeout_is_eof) {
        negotiator.keep_waiting_until(start + timeout);
    }

    for (;;) {
        if (_stream->now_ms() - start > timeout) {
            std::string msg = "couldn't find the requested prompt '" + pattern.source() +
                              "' within " + std::to_string(timeout) + " ms; received: " + _buffer;
            _buffer.clear();
            return fail(Status::Timeout, std::move(msg));
        }

        std::uint8_t c = 0;
        const net::ReadResult r = source.next_byte(c);
        if (r != net::ReadResult::Byte) {
            if (r == net::ReadResult::TimedOut && !_opt.idle_timeout_is_eof) {
                continue;
            }
            if (pattern.empty()) {
                return Status::Ok;
            }
            std::string msg = "couldn't find the requested prompt '" + pattern.source() +
                              "', it was not in the data returned from server: " + _buffer;
            _buffer.clear();
            return fail(r == net::ReadResult::Error ? Status::TransportError : Status::PatternNotFound,
                        std::move(msg));
        }

        if (c == codes::IAC && _opt.control_negotiation) {
            const Status st = negotiator.handle_command();
            if (st != Status::Ok) {
                std::string msg = negotiator.error() + "; received: " + _buffer;
                _buffer.clear();
                return fail(st, std::move(msg));
            }
            continue;
        }

        _buffer.push_back(static_cast<char>(c));

        if (_pager.completes_marker(_buffer)) {
            TX_LOGD(TAG, "pagination marker, sending continuation");
            const Status st = send_locked(_opt.pager_continue, false, true);
            if (st != Status::Ok) {
                _buffer.clear();
                return st;
            }
        }

        if (!pattern.empty() && pattern.matches_tail(_buffer, _opt.match_window)) {
            return Status::Ok;
        }
    }
}

Status Session::wait_for(const PromptPattern& pattern, bool continuation)
{
    ActiveGuard guard(_active);
    if (!guard.acquired()) {
        return fail(Status::Busy, "another wait is already active on this session");
    }
    _last_error.clear();
    return wait_locked(pattern, continuation);
}

Status Session::wait_prompt()
{
    return wait_for(_prompt);
}

Status Session::exec(std::string_view command,
                     std::string& out,
                     bool appendEol,
                     const PromptPattern* promptOverride)
{
    out.clear();

    if (Status st = send(command, appendEol); st != Status::Ok) {
        return st;
    }
    if (Status st = wait_for(promptOverride ? *promptOverride : _prompt); st != Status::Ok) {
        return st;
    }

    out = formatted_buffer();
    return Status::Ok;
}

Status Session::login(std::string_view username,
                      std::string_view password,
                      std::string_view deviceType,
                      const LoginProfileRegistry& profiles)
{
    LoginSequencer sequencer(profiles);
    std::string cause;
    const Status st = sequencer.run(*this, username, password, deviceType, &cause);
    if (st == Status::LoginFailed) {
        TX_LOGD(TAG, "login cause: %s", cause.c_str());
        _last_error = "Login failed.";
    } else if (st != Status::Ok) {
        _last_error = cause;
    }
    return st;
}

Status Session::set_window_size(std::uint16_t width, std::uint16_t height)
{
    ActiveGuard guard(_active);
    if (!guard.acquired()) {
        return fail(Status::Busy, "another operation is active on this session");
    }
    _last_error.clear();

    if (!is_open()) {
        return fail(Status::NotConnected, "telnet connection closed");
    }

    ByteSource source(*_stream, _transcript, _opt.read_timeout_ms);
    ControlNegotiator negotiator(*_stream, source, _transcript);
    if (!_opt.idle_timeout_is_eof) {
        negotiator.keep_waiting_until(_stream->now_ms() +
                                      static_cast<std::uint64_t>(std::max(0, _opt.command_timeout_ms)));
    }
    const Status st = negotiator.request_window_size(width, height);
    if (st != Status::Ok) {
        return fail(st, negotiator.error());
    }
    return Status::Ok;
}

// ----------------------------
// Configuration
// ----------------------------

void Session::set_prompt(std::string_view text)
{
    _prompt = PromptPattern::literal(text);
}

Status Session::set_regex_prompt(std::string_view expr)
{
    std::string err;
    PromptPattern p;
    if (!PromptPattern::from_regex(expr, p, &err)) {
        return fail(Status::InvalidRequest, "invalid prompt regex '" + std::string(expr) + "': " + err);
    }
    _prompt = std::move(p);
    return Status::Ok;
}

void Session::set_command_timeout_ms(int ms)
{
    _opt.command_timeout_ms = std::max(0, ms);
}

void Session::set_read_timeout_ms(int ms)
{
    _opt.read_timeout_ms = std::max(0, ms);
}

void Session::set_stream_timeout(double seconds)
{
    if (!(seconds > 0.0)) {
        _opt.read_timeout_ms = 0;
        return;
    }
    _opt.read_timeout_ms = static_cast<int>(std::lround(seconds * 1000.0));
}

void Session::set_pager_markers(std::vector<std::string> markers)
{
    _opt.pager_markers = std::move(markers);
    _pager = PaginationDetector(_opt.pager_markers);
}

std::string Session::formatted_buffer() const
{
    return format_buffer(_buffer, _opt.strip_prompt);
}

} // namespace telexpect::telnet
