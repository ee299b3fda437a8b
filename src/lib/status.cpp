#include "telexpect/core/status.h"

namespace telexpect {

const char* to_string(Status s) noexcept
{
    switch (s) {
    case Status::Ok:                return "Ok";
    case Status::NotConnected:      return "NotConnected";
    case Status::TransportError:    return "TransportError";
    case Status::ProtocolViolation: return "ProtocolViolation";
    case Status::Refused:           return "Refused";
    case Status::Timeout:           return "Timeout";
    case Status::PatternNotFound:   return "PatternNotFound";
    case Status::LoginFailed:       return "LoginFailed";
    case Status::InvalidRequest:    return "InvalidRequest";
    case Status::Busy:              return "Busy";
    }
    return "Unknown";
}

} // namespace telexpect
