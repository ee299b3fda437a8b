#pragma once

#include "telexpect/telnet/login_profile.h"
#include "telexpect/telnet/session_options.h"

#include <string>
#include <vector>

namespace telexpect::config {

// Default login target used by the CLI.
struct TargetConfig {
    std::string deviceType{"linux"};
    std::string username;
    std::string password;
};

struct ProfileConfig {
    std::string                    deviceType;
    telnet::DeviceLoginProfile     profile;
};

struct TelexpectConfig {
    telnet::SessionOptions     session;
    TargetConfig               target;
    std::vector<ProfileConfig> profiles;   // added to / overriding the built-ins
};

// Built-in profiles plus those from cfg (cfg wins on conflicts).
telnet::LoginProfileRegistry build_profile_registry(const TelexpectConfig& cfg);

class ConfigStore {
public:
    virtual ~ConfigStore() = default;

    virtual TelexpectConfig load() = 0;
    virtual void save(const TelexpectConfig& cfg) = 0;
};

} // namespace telexpect::config
