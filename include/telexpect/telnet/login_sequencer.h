#pragma once

#include "telexpect/core/status.h"
#include "telexpect/telnet/login_profile.h"

#include <string>
#include <string_view>

namespace telexpect::telnet {

class Session;

// Plaintext username/password login driven by a device profile:
//   wait username prompt -> send username (skipped if username is empty)
//   wait password prompt -> send password
//   wait shell prompt
// Any failing step yields Status::LoginFailed; nothing is rolled back.
class LoginSequencer {
public:
    explicit LoginSequencer(const LoginProfileRegistry& profiles)
        : _profiles(profiles)
    {
    }

    // cause (optional) receives the underlying failure for logging.
    Status run(Session& session,
               std::string_view username,
               std::string_view password,
               std::string_view deviceType,
               std::string* cause = nullptr) const;

private:
    const LoginProfileRegistry& _profiles;
};

} // namespace telexpect::telnet
