#include "telexpect/telnet/login_profile.h"

#include <algorithm>
#include <utility>

namespace telexpect::telnet {

LoginProfileRegistry LoginProfileRegistry::with_builtin_profiles()
{
    LoginProfileRegistry reg;
    // General Linux/UNIX
    reg.register_profile("linux",   {"login:",    "Password:", "\\$"});
    // Cisco IOS, IOS-XE, IOS-XR
    reg.register_profile("ios",     {"Username:", "Password:", "[>#]"});
    // Juniper Junos OS
    reg.register_profile("junos",   {"login:",    "Password:", "[%>#]"});
    // AlaxalA, HITACHI
    reg.register_profile("alaxala", {"login:",    "Password:", "[>#]"});
    reg.register_profile("dlink",   {"ame:",      "ord:",      "[>|#]"});
    // Extreme routers and switches
    reg.register_profile("xos",     {"login:",    "password:", "\\.[0-9]{1,3} > "});
    // BDCOM PON switches
    reg.register_profile("bdcom",   {"login:",    "password:", "[ > ]"});
    reg.register_profile("cdata",   {"ame:",      "ord:",      "OLT(.*?)[>#]"});
    return reg;
}

bool LoginProfileRegistry::register_profile(std::string deviceType, DeviceLoginProfile profile)
{
    if (deviceType.empty()) {
        return false;
    }

    auto it = _profiles.find(deviceType);
    if (it != _profiles.end()) {
        // already registered
        return false;
    }

    _profiles.emplace(std::move(deviceType), std::move(profile));
    return true;
}

void LoginProfileRegistry::set_profile(std::string deviceType, DeviceLoginProfile profile)
{
    if (deviceType.empty()) {
        return;
    }
    _profiles[std::move(deviceType)] = std::move(profile);
}

const DeviceLoginProfile* LoginProfileRegistry::find(std::string_view deviceType) const
{
    auto it = _profiles.find(std::string(deviceType));
    if (it == _profiles.end()) {
        return nullptr;
    }
    return &it->second;
}

std::vector<std::string> LoginProfileRegistry::device_types() const
{
    std::vector<std::string> out;
    out.reserve(_profiles.size());
    for (const auto& kv : _profiles) {
        out.push_back(kv.first);
    }
    std::sort(out.begin(), out.end());
    return out;
}

} // namespace telexpect::telnet
