#include "telexpect/config/yaml_config_store.h"
#include "telexpect/core/logging.h"

#include <fstream>
#include <sstream>
#include <stdexcept>
#include <utility>
#include <vector>

#include <yaml-cpp/yaml.h>

namespace telexpect::config {

static constexpr const char* TAG = "config";

// ---------- tiny helpers ----------

template<typename T>
static T get_or(const YAML::Node& obj, const char* key, T def)
{
    auto n = obj[key];
    return n ? n.as<T>() : def;
}

static std::string parse_eol(const std::string& s, const std::string& def)
{
    if (s == "lf" || s == "LF" || s == "linux")     return "\n";
    if (s == "crlf" || s == "CRLF" || s == "windows") return "\r\n";
    return def;
}

static std::string eol_to_string(const std::string& eol)
{
    return eol == "\n" ? "lf" : "crlf";
}

// ---------- from_yaml helpers ----------

static void from_yaml(const YAML::Node& node, telnet::SessionOptions& out)
{
    out.host                = get_or<std::string>(node, "host", out.host);
    out.port                = get_or<std::uint16_t>(node, "port", out.port);
    out.connect_timeout_ms  = get_or<int>(node, "connect_timeout_ms", out.connect_timeout_ms);
    out.tcp_nodelay         = get_or<bool>(node, "tcp_nodelay", out.tcp_nodelay);
    out.tcp_keepalive       = get_or<bool>(node, "tcp_keepalive", out.tcp_keepalive);
    out.command_timeout_ms  = get_or<int>(node, "command_timeout_ms", out.command_timeout_ms);
    out.read_timeout_ms     = get_or<int>(node, "read_timeout_ms", out.read_timeout_ms);
    out.eol                 = parse_eol(get_or<std::string>(node, "eol", ""), out.eol);
    out.strip_prompt        = get_or<bool>(node, "strip_prompt", out.strip_prompt);
    out.control_negotiation = get_or<bool>(node, "control_negotiation", out.control_negotiation);
    out.idle_timeout_is_eof = get_or<bool>(node, "idle_timeout_is_eof", out.idle_timeout_is_eof);
    out.match_window        = get_or<std::size_t>(node, "match_window", out.match_window);
    out.pager_continue      = get_or<std::string>(node, "pager_continue", out.pager_continue);

    // url wins over host/port and may carry connect options
    if (auto url = node["url"]) {
        const std::string u = url.as<std::string>();
        if (!telnet::apply_target_url(u, out)) {
            TX_LOGW(TAG, "ignoring malformed session url '%s'", u.c_str());
        }
    }

    if (auto markers = node["pager_markers"]; markers && markers.IsSequence()) {
        out.pager_markers.clear();
        for (const auto& m : markers) {
            out.pager_markers.push_back(m.as<std::string>());
        }
    }
}

static void from_yaml(const YAML::Node& node, TargetConfig& out)
{
    out.deviceType = get_or<std::string>(node, "device_type", out.deviceType);
    out.username   = get_or<std::string>(node, "username", "");
    out.password   = get_or<std::string>(node, "password", "");
}

static void from_yaml(const YAML::Node& node, ProfileConfig& out)
{
    out.deviceType                 = get_or<std::string>(node, "device_type", "");
    out.profile.usernamePrompt     = get_or<std::string>(node, "username_prompt", "login:");
    out.profile.passwordPrompt     = get_or<std::string>(node, "password_prompt", "Password:");
    out.profile.finalPromptPattern = get_or<std::string>(node, "final_prompt", "[>#$]");
}

static void from_yaml(const YAML::Node& root, TelexpectConfig& cfg)
{
    if (auto n = root["session"]) {
        from_yaml(n, cfg.session);
    }

    if (auto n = root["target"]) {
        from_yaml(n, cfg.target);
    }

    if (auto profiles = root["profiles"]; profiles && profiles.IsSequence()) {
        cfg.profiles.clear();
        for (const auto& pn : profiles) {
            ProfileConfig pc{};
            from_yaml(pn, pc);
            if (pc.deviceType.empty()) {
                TX_LOGW(TAG, "ignoring login profile without device_type");
                continue;
            }
            cfg.profiles.push_back(std::move(pc));
        }
    }
}

// ---------- to_yaml ----------

static void to_yaml(YAML::Emitter& out, const TelexpectConfig& cfg)
{
    const auto& s = cfg.session;

    out << YAML::BeginMap;

    // session:
    out << YAML::Key << "session" << YAML::Value << YAML::BeginMap;
    out << YAML::Key << "host"                << YAML::Value << s.host;
    out << YAML::Key << "port"                << YAML::Value << s.port;
    out << YAML::Key << "connect_timeout_ms"  << YAML::Value << s.connect_timeout_ms;
    out << YAML::Key << "tcp_nodelay"         << YAML::Value << s.tcp_nodelay;
    out << YAML::Key << "tcp_keepalive"       << YAML::Value << s.tcp_keepalive;
    out << YAML::Key << "command_timeout_ms"  << YAML::Value << s.command_timeout_ms;
    out << YAML::Key << "read_timeout_ms"     << YAML::Value << s.read_timeout_ms;
    out << YAML::Key << "eol"                 << YAML::Value << eol_to_string(s.eol);
    out << YAML::Key << "strip_prompt"        << YAML::Value << s.strip_prompt;
    out << YAML::Key << "control_negotiation" << YAML::Value << s.control_negotiation;
    out << YAML::Key << "idle_timeout_is_eof" << YAML::Value << s.idle_timeout_is_eof;
    out << YAML::Key << "match_window"        << YAML::Value << s.match_window;
    out << YAML::Key << "pager_continue"      << YAML::Value << s.pager_continue;
    out << YAML::Key << "pager_markers"       << YAML::Value << YAML::BeginSeq;
    for (const auto& m : s.pager_markers) {
        out << m;
    }
    out << YAML::EndSeq;
    out << YAML::EndMap;

    // target:
    out << YAML::Key << "target" << YAML::Value << YAML::BeginMap;
    out << YAML::Key << "device_type" << YAML::Value << cfg.target.deviceType;
    out << YAML::Key << "username"    << YAML::Value << cfg.target.username;
    out << YAML::Key << "password"    << YAML::Value << cfg.target.password;
    out << YAML::EndMap;

    // profiles:
    out << YAML::Key << "profiles" << YAML::Value << YAML::BeginSeq;
    for (const auto& p : cfg.profiles) {
        out << YAML::BeginMap;
        out << YAML::Key << "device_type"     << YAML::Value << p.deviceType;
        out << YAML::Key << "username_prompt" << YAML::Value << p.profile.usernamePrompt;
        out << YAML::Key << "password_prompt" << YAML::Value << p.profile.passwordPrompt;
        out << YAML::Key << "final_prompt"    << YAML::Value << p.profile.finalPromptPattern;
        out << YAML::EndMap;
    }
    out << YAML::EndSeq;

    out << YAML::EndMap; // root
}

// ---------- public ----------

telnet::LoginProfileRegistry build_profile_registry(const TelexpectConfig& cfg)
{
    auto reg = telnet::LoginProfileRegistry::with_builtin_profiles();
    for (const auto& p : cfg.profiles) {
        reg.set_profile(p.deviceType, p.profile);
    }
    return reg;
}

YamlConfigStore::YamlConfigStore(std::string path)
    : _path(std::move(path))
{
}

TelexpectConfig YamlConfigStore::parse(std::string_view yamlText)
{
    TelexpectConfig cfg{};
    const YAML::Node root = YAML::Load(std::string(yamlText));
    if (root && root.IsMap()) {
        from_yaml(root, cfg);
    }
    return cfg;
}

std::string YamlConfigStore::emit(const TelexpectConfig& cfg)
{
    YAML::Emitter out;
    to_yaml(out, cfg);
    return std::string(out.c_str(), out.size());
}

TelexpectConfig YamlConfigStore::load()
{
    std::ifstream in(_path, std::ios::binary);
    if (!in) {
        TX_LOGW(TAG, "Config '%s' not found; using defaults", _path.c_str());
        return TelexpectConfig{};
    }

    std::ostringstream ss;
    ss << in.rdbuf();

    try {
        return parse(ss.str());
    } catch (const std::exception& ex) {
        TX_LOGE(TAG, "Failed to load config '%s': %s", _path.c_str(), ex.what());
    }
    return TelexpectConfig{};
}

void YamlConfigStore::save(const TelexpectConfig& cfg)
{
    const std::string text = emit(cfg);

    std::ofstream out(_path, std::ios::binary | std::ios::trunc);
    if (!out) {
        throw std::runtime_error("cannot open '" + _path + "' for writing");
    }
    out.write(text.data(), static_cast<std::streamsize>(text.size()));
    out.flush();
    if (!out) {
        throw std::runtime_error("short write while saving config");
    }
}

} // namespace telexpect::config
