#pragma once

#include <cstdint>

// Telnet control bytes (RFC 854 / RFC 1073). Shared by every session.
namespace telexpect::telnet::codes {

inline constexpr std::uint8_t IAC  = 255;
inline constexpr std::uint8_t DONT = 254;
inline constexpr std::uint8_t DO   = 253;
inline constexpr std::uint8_t WONT = 252;
inline constexpr std::uint8_t WILL = 251;
inline constexpr std::uint8_t SB   = 250;
inline constexpr std::uint8_t SE   = 240;

inline constexpr std::uint8_t NUL  = 0;
inline constexpr std::uint8_t DC1  = 17;

inline constexpr std::uint8_t TELOPT_NAWS = 31;

} // namespace telexpect::telnet::codes
