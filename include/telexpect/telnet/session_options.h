#pragma once

#include "telexpect/telnet/pagination.h"

#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace telexpect::telnet {

struct SessionOptions {
    std::string   host{"127.0.0.1"};
    std::uint16_t port{23};
    int           connect_timeout_ms{10000};
    bool          tcp_nodelay{true};
    bool          tcp_keepalive{false};

    // Overall deadline for one wait; guards against a peer that drips
    // bytes forever.
    int           command_timeout_ms{10000};

    // Deadline for each single-byte read; guards against a stalled peer.
    int           read_timeout_ms{1000};

    std::string   eol{"\r\n"};
    bool          strip_prompt{true};
    bool          control_negotiation{true};

    // An idle read counts as end of stream. With no pattern requested
    // that settles the wait; with a pattern it fails it. When false an
    // idle read just keeps waiting until the command deadline, also in
    // the middle of a control sequence or a window size answer.
    bool          idle_timeout_is_eof{true};

    // Upper bound on the trailing bytes a regex prompt is run over
    // (0 = the whole current line, however long).
    std::size_t   match_window{256};

    std::vector<std::string> pager_markers{default_pager_markers()};

    // Keystroke sent when a pager marker shows up.
    std::string   pager_continue{" "};
};

// Point opt at a telnet://host[:port] or tcp://host:port URL. Query
// options (connect_timeout_ms, nodelay, keepalive) override opt's values.
// Returns false and leaves opt untouched on a malformed URL.
bool apply_target_url(std::string_view url, SessionOptions& opt);

} // namespace telexpect::telnet
