#pragma once

#include <cstdint>

namespace telexpect {

// Result of every session, transport and login operation.
//
// Callers branch on the category (see the is_* helpers) rather than on
// message text; human readable context lives in Session::last_error().
enum class Status : std::uint8_t
{
    Ok = 0,
    NotConnected,       // session never opened, or already closed
    TransportError,     // resolve / connect / write / close failure
    ProtocolViolation,  // unknown or truncated control sequence
    Refused,            // peer declined an option we asked for
    Timeout,            // overall command deadline exceeded
    PatternNotFound,    // stream ended before the prompt appeared
    LoginFailed,
    InvalidRequest,     // bad regex, unknown device type, bad argument
    Busy,               // another wait is already active on the session
};

const char* to_string(Status s) noexcept;

inline bool is_transport_error(Status s) noexcept
{
    return s == Status::NotConnected || s == Status::TransportError;
}

inline bool is_protocol_violation(Status s) noexcept
{
    return s == Status::ProtocolViolation || s == Status::Refused;
}

inline bool is_timeout(Status s) noexcept
{
    return s == Status::Timeout || s == Status::PatternNotFound;
}

} // namespace telexpect
