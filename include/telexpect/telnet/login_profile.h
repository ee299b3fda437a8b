#pragma once

#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace telexpect::telnet {

// Prompts a device prints during a plaintext login.
// usernamePrompt / passwordPrompt are literal text; finalPromptPattern
// is a regular expression for the shell prompt.
struct DeviceLoginProfile {
    std::string usernamePrompt;
    std::string passwordPrompt;
    std::string finalPromptPattern;
};

class LoginProfileRegistry {
public:
    // Registry preloaded with linux, ios, junos, alaxala, dlink, xos,
    // bdcom and cdata.
    static LoginProfileRegistry with_builtin_profiles();

    // Fails when deviceType is empty or already registered.
    bool register_profile(std::string deviceType, DeviceLoginProfile profile);

    // Adds or replaces.
    void set_profile(std::string deviceType, DeviceLoginProfile profile);

    // Returns nullptr if the device type is not registered.
    const DeviceLoginProfile* find(std::string_view deviceType) const;

    std::vector<std::string> device_types() const;

private:
    std::unordered_map<std::string, DeviceLoginProfile> _profiles;
};

} // namespace telexpect::telnet
