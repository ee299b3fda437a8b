#include "telexpect/telnet/buffer_formatter.h"

namespace telexpect::telnet {

static void replace_all(std::string& s, std::string_view from, std::string_view to)
{
    std::size_t pos = 0;
    while ((pos = s.find(from.data(), pos, from.size())) != std::string::npos) {
        s.replace(pos, from.size(), to.data(), to.size());
        pos += to.size();
    }
}

static bool is_trim_char(char c)
{
    return c == ' ' || c == '\t' || c == '\n' || c == '\r' || c == '\0' || c == '\x0B';
}

std::string normalize_line_endings(std::string_view text)
{
    // Applied in sequence, so "\r\n\r" collapses to a single "\n".
    std::string out(text);
    replace_all(out, "\n\r", "\n");
    replace_all(out, "\r\n", "\n");
    replace_all(out, "\r", "\n");
    return out;
}

std::string format_buffer(std::string_view buffer, bool strip_prompt)
{
    std::string buf = normalize_line_endings(buffer);

    if (strip_prompt) {
        const std::size_t lastNl = buf.rfind('\n');
        if (lastNl == std::string::npos) {
            buf.clear();
        } else {
            buf.erase(lastNl);
        }
    }

    std::size_t b = 0;
    while (b < buf.size() && is_trim_char(buf[b])) ++b;
    std::size_t e = buf.size();
    while (e > b && is_trim_char(buf[e - 1])) --e;
    return buf.substr(b, e - b);
}

} // namespace telexpect::telnet
