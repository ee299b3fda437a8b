#include "telexpect/telnet/transcript.h"

namespace telexpect::telnet {

void Transcript::append(const std::uint8_t* data, std::size_t len)
{
    if (!data || len == 0) return;
    _bytes.append(reinterpret_cast<const char*>(data), len);
}

// Length of the well-formed UTF-8 sequence starting at s[i], or 0.
static std::size_t utf8_sequence_length(const std::string& s, std::size_t i)
{
    const auto b0 = static_cast<unsigned char>(s[i]);
    if (b0 < 0x80) return 1;

    std::size_t len = 0;
    unsigned char lo = 0x80;
    unsigned char hi = 0xBF;
    if (b0 >= 0xC2 && b0 <= 0xDF) {
        len = 2;
    } else if (b0 >= 0xE0 && b0 <= 0xEF) {
        len = 3;
        if (b0 == 0xE0) lo = 0xA0;  // overlong
        if (b0 == 0xED) hi = 0x9F;  // surrogates
    } else if (b0 >= 0xF0 && b0 <= 0xF4) {
        len = 4;
        if (b0 == 0xF0) lo = 0x90;
        if (b0 == 0xF4) hi = 0x8F;
    } else {
        return 0;
    }

    if (i + len > s.size()) return 0;

    for (std::size_t k = 1; k < len; ++k) {
        const auto b = static_cast<unsigned char>(s[i + k]);
        const unsigned char klo = (k == 1) ? lo : 0x80;
        const unsigned char khi = (k == 1) ? hi : 0xBF;
        if (b < klo || b > khi) return 0;
    }
    return len;
}

std::string Transcript::to_display_text() const
{
    std::string out;
    out.reserve(_bytes.size());

    std::size_t i = 0;
    while (i < _bytes.size()) {
        const std::size_t n = utf8_sequence_length(_bytes, i);
        if (n == 0) {
            out.push_back('?');
            ++i;
            continue;
        }
        out.append(_bytes, i, n);
        i += n;
    }
    return out;
}

} // namespace telexpect::telnet
