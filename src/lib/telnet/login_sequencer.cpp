#include "telexpect/telnet/login_sequencer.h"

#include "telexpect/core/logging.h"
#include "telexpect/telnet/session.h"

namespace telexpect::telnet {

static constexpr const char* TAG = "login";

Status LoginSequencer::run(Session& session,
                           std::string_view username,
                           std::string_view password,
                           std::string_view deviceType,
                           std::string* cause) const
{
    const DeviceLoginProfile* profile = _profiles.find(deviceType);
    if (!profile) {
        if (cause) {
            *cause = "unknown device type '" + std::string(deviceType) + "'";
        }
        TX_LOGE(TAG, "unknown device type '%.*s'",
                static_cast<int>(deviceType.size()), deviceType.data());
        return Status::InvalidRequest;
    }

    auto failed = [&](const char* step, Status st) {
        if (cause) {
            *cause = std::string(step) + ": " + to_string(st) + " (" + session.last_error() + ")";
        }
        TX_LOGW(TAG, "login to %.*s device failed at %s: %s",
                static_cast<int>(deviceType.size()), deviceType.data(), step, to_string(st));
        return Status::LoginFailed;
    };

    if (!username.empty()) {
        session.set_prompt(profile->usernamePrompt);
        if (Status st = session.wait_prompt(); st != Status::Ok) {
            return failed("username prompt", st);
        }
        if (Status st = session.send(username); st != Status::Ok) {
            return failed("send username", st);
        }
    }

    session.set_prompt(profile->passwordPrompt);
    if (Status st = session.wait_prompt(); st != Status::Ok) {
        return failed("password prompt", st);
    }
    if (Status st = session.send(password); st != Status::Ok) {
        return failed("send password", st);
    }

    if (Status st = session.set_regex_prompt(profile->finalPromptPattern); st != Status::Ok) {
        return failed("shell prompt pattern", st);
    }
    if (Status st = session.wait_prompt(); st != Status::Ok) {
        return failed("shell prompt", st);
    }

    TX_LOGI(TAG, "logged in (%.*s)", static_cast<int>(deviceType.size()), deviceType.data());
    return Status::Ok;
}

} // namespace telexpect::telnet
