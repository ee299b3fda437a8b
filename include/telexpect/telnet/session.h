#pragma once

#include "telexpect/core/status.h"
#include "telexpect/net/byte_stream.h"
#include "telexpect/net/tcp_socket_ops.h"
#include "telexpect/telnet/login_profile.h"
#include "telexpect/telnet/pagination.h"
#include "telexpect/telnet/prompt_pattern.h"
#include "telexpect/telnet/session_options.h"
#include "telexpect/telnet/transcript.h"

#include <atomic>
#include <cstdint>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

namespace telexpect::telnet {

// Synchronous "send command, wait for prompt, return output" telnet client.
//
// A Session owns its stream and is meant for a single caller. Only one
// send or wait may run at a time; an overlapping call returns
// Status::Busy instead of touching the stream.
//
// Typical use:
//   Session s(opts);
//   s.connect(platform::default_tcp_socket_ops());
//   s.login("admin", "secret", "ios", registry);
//   std::string out;
//   s.exec("show version", out);
class Session {
public:
    explicit Session(SessionOptions opt = {});
    ~Session();

    Session(const Session&) = delete;
    Session& operator=(const Session&) = delete;

    // Resolve opt.host and connect over TCP. When a prompt is already
    // set, also waits for it.
    Status connect(net::ITcpSocketOps& socketOps);

    // Take ownership of an already open stream.
    Status attach(std::unique_ptr<net::IByteStream> stream);

    // Closes the stream once; later calls are no-ops. Busy while a send
    // or wait is running.
    Status disconnect();

    bool is_open() const noexcept;

    // Command Sender. Clears the command buffer unless continuation.
    Status send(std::string_view text, bool appendEol = true, bool continuation = false);

    // Prompt-Wait Engine. On Ok the settled output is in buffer().
    // An empty pattern waits for the peer to go quiet or hang up.
    Status wait_for(const PromptPattern& pattern, bool continuation = false);

    // wait_for() with the current prompt.
    Status wait_prompt();

    // send + wait + format. promptOverride replaces the session prompt
    // for this call only.
    Status exec(std::string_view command,
                std::string& out,
                bool appendEol = true,
                const PromptPattern* promptOverride = nullptr);

    // Runs the login sequence for deviceType. On success the session
    // prompt is the profile's shell prompt.
    Status login(std::string_view username,
                 std::string_view password,
                 std::string_view deviceType,
                 const LoginProfileRegistry& profiles);

    Status set_window_size(std::uint16_t width = 80, std::uint16_t height = 40);

    // --- configuration ---
    void set_prompt(std::string_view text);
    Status set_regex_prompt(std::string_view expr);
    const PromptPattern& prompt() const noexcept { return _prompt; }

    void set_command_timeout_ms(int ms);
    void set_read_timeout_ms(int ms);
    void set_stream_timeout(double seconds);

    void set_linux_eol() { _opt.eol = "\n"; }
    void set_windows_eol() { _opt.eol = "\r\n"; }

    void set_strip_prompt(bool strip) { _opt.strip_prompt = strip; }
    void set_control_negotiation(bool enabled) { _opt.control_negotiation = enabled; }
    void set_idle_timeout_is_eof(bool eof) { _opt.idle_timeout_is_eof = eof; }
    void set_match_window(std::size_t bytes) { _opt.match_window = bytes; }
    void set_pager_markers(std::vector<std::string> markers);

    const SessionOptions& options() const noexcept { return _opt; }

    // --- buffers ---
    const std::string& buffer() const noexcept { return _buffer; }
    std::string formatted_buffer() const;
    void clear_buffer() noexcept { _buffer.clear(); }

    const Transcript& transcript() const noexcept { return _transcript; }
    std::string transcript_text() const { return _transcript.to_display_text(); }

    // Context for the last failed operation (pattern, timeout, partial
    // output). Empty after success.
    const std::string& last_error() const noexcept { return _last_error; }

private:
    class ActiveGuard;

    Status write_bytes(std::string_view bytes);
    Status send_locked(std::string_view text, bool appendEol, bool continuation);
    Status wait_locked(const PromptPattern& pattern, bool continuation);
    Status fail(Status st, std::string message);
    Status close_stream();

    SessionOptions _opt;
    PromptPattern _prompt;
    PaginationDetector _pager;

    std::unique_ptr<net::IByteStream> _stream;

    std::string _buffer;
    Transcript _transcript;
    std::string _last_error;

    std::atomic<bool> _active{false};
};

} // namespace telexpect::telnet
