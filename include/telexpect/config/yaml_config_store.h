#pragma once

#include <string>
#include <string_view>

#include "telexpect/config/telexpect_config.h"

namespace telexpect::config {

class YamlConfigStore : public ConfigStore {
public:
    explicit YamlConfigStore(std::string path);

    // Missing or unreadable file: logs and returns defaults.
    TelexpectConfig load() override;

    // Throws std::runtime_error when the file cannot be written.
    void save(const TelexpectConfig& cfg) override;

    // Throws YAML::Exception on malformed input.
    static TelexpectConfig parse(std::string_view yamlText);
    static std::string emit(const TelexpectConfig& cfg);

    const std::string& path() const noexcept { return _path; }

private:
    std::string _path; // e.g. "telexpect.yaml"
};

} // namespace telexpect::config
