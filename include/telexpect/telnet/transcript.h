#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>

namespace telexpect::telnet {

// Append-only record of every byte sent or received on a session.
// Nothing is ever removed, so size() only grows.
class Transcript {
public:
    void append(std::uint8_t b) { _bytes.push_back(static_cast<char>(b)); }
    void append(const std::uint8_t* data, std::size_t len);
    void append(std::string_view s) { _bytes.append(s.data(), s.size()); }

    std::size_t size() const noexcept { return _bytes.size(); }
    bool empty() const noexcept { return _bytes.empty(); }

    // Raw wire bytes, control sequences included.
    const std::string& raw() const noexcept { return _bytes; }

    // Display rendering: invalid UTF-8 sequences become '?'.
    // Not meant for re-parsing.
    std::string to_display_text() const;

private:
    std::string _bytes;
};

} // namespace telexpect::telnet
