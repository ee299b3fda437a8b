#include "doctest.h"

#include "telexpect/config/telexpect_config.h"
#include "telexpect/config/yaml_config_store.h"

#include <cstdio>
#include <fstream>
#include <string>
#include <utility>

using telexpect::config::ProfileConfig;
using telexpect::config::TelexpectConfig;
using telexpect::config::YamlConfigStore;
using telexpect::config::build_profile_registry;

namespace {

const char* kSampleYaml = R"(
session:
  host: 192.0.2.10
  port: 2323
  connect_timeout_ms: 3000
  command_timeout_ms: 20000
  read_timeout_ms: 500
  eol: lf
  strip_prompt: false
  control_negotiation: false
  idle_timeout_is_eof: false
  match_window: 1024
  pager_markers:
    - "-- more --"
    - "<space>"
target:
  device_type: ios
  username: admin
  password: secret
profiles:
  - device_type: vyos
    username_prompt: "login:"
    password_prompt: "Password:"
    final_prompt: "[$#] $"
  - device_type: linux
    username_prompt: "user:"
    password_prompt: "pass:"
    final_prompt: "% "
  - username_prompt: "orphan:"
)";

struct TempFile {
    std::string path;
    explicit TempFile(std::string p) : path(std::move(p)) { std::remove(path.c_str()); }
    ~TempFile() { std::remove(path.c_str()); }
};

} // namespace

TEST_CASE("YAML config: full document")
{
    const TelexpectConfig cfg = YamlConfigStore::parse(kSampleYaml);

    CHECK(cfg.session.host == "192.0.2.10");
    CHECK(cfg.session.port == 2323);
    CHECK(cfg.session.connect_timeout_ms == 3000);
    CHECK(cfg.session.command_timeout_ms == 20000);
    CHECK(cfg.session.read_timeout_ms == 500);
    CHECK(cfg.session.eol == "\n");
    CHECK_FALSE(cfg.session.strip_prompt);
    CHECK_FALSE(cfg.session.control_negotiation);
    CHECK_FALSE(cfg.session.idle_timeout_is_eof);
    CHECK(cfg.session.match_window == 1024);
    REQUIRE(cfg.session.pager_markers.size() == 2);
    CHECK(cfg.session.pager_markers[1] == "<space>");
    CHECK(cfg.session.pager_continue == " ");

    CHECK(cfg.target.deviceType == "ios");
    CHECK(cfg.target.username == "admin");
    CHECK(cfg.target.password == "secret");

    // The entry without device_type is dropped.
    REQUIRE(cfg.profiles.size() == 2);
    CHECK(cfg.profiles[0].deviceType == "vyos");
    CHECK(cfg.profiles[0].profile.finalPromptPattern == "[$#] $");
}

TEST_CASE("YAML config: missing keys keep their defaults")
{
    const TelexpectConfig cfg = YamlConfigStore::parse("session:\n  host: sw1\n");
    const TelexpectConfig def{};

    CHECK(cfg.session.host == "sw1");
    CHECK(cfg.session.port == def.session.port);
    CHECK(cfg.session.eol == "\r\n");
    CHECK(cfg.session.pager_markers == def.session.pager_markers);
    CHECK(cfg.target.deviceType == "linux");
    CHECK(cfg.profiles.empty());

    const TelexpectConfig empty = YamlConfigStore::parse("");
    CHECK(empty.session.host == def.session.host);
}

TEST_CASE("YAML config: session url sets the target")
{
    const TelexpectConfig cfg = YamlConfigStore::parse(
        "session:\n"
        "  host: ignored\n"
        "  url: telnet://edge-rtr:2001?connect_timeout_ms=4000&keepalive=1\n");

    CHECK(cfg.session.host == "edge-rtr");
    CHECK(cfg.session.port == 2001);
    CHECK(cfg.session.connect_timeout_ms == 4000);
    CHECK(cfg.session.tcp_keepalive);

    const TelexpectConfig bad = YamlConfigStore::parse(
        "session:\n"
        "  host: fallback\n"
        "  url: gopher://x\n");
    CHECK(bad.session.host == "fallback");
}

TEST_CASE("YAML config: emitted text parses back to the same values")
{
    TelexpectConfig cfg = YamlConfigStore::parse(kSampleYaml);
    cfg.session.pager_continue = "q";
    cfg.session.tcp_keepalive = true;

    const TelexpectConfig back = YamlConfigStore::parse(YamlConfigStore::emit(cfg));

    CHECK(back.session.host == cfg.session.host);
    CHECK(back.session.port == cfg.session.port);
    CHECK(back.session.eol == cfg.session.eol);
    CHECK(back.session.idle_timeout_is_eof == cfg.session.idle_timeout_is_eof);
    CHECK(back.session.pager_markers == cfg.session.pager_markers);
    CHECK(back.session.pager_continue == "q");
    CHECK(back.session.tcp_keepalive);
    CHECK(back.target.password == cfg.target.password);
    REQUIRE(back.profiles.size() == cfg.profiles.size());
    CHECK(back.profiles[1].profile.usernamePrompt == "user:");
}

TEST_CASE("YAML config: save and load through a file")
{
    TempFile tmp("telexpect_test_config.yaml");

    TelexpectConfig cfg{};
    cfg.session.host = "core-sw";
    cfg.target.deviceType = "junos";

    YamlConfigStore store(tmp.path);
    store.save(cfg);

    const TelexpectConfig loaded = store.load();
    CHECK(loaded.session.host == "core-sw");
    CHECK(loaded.target.deviceType == "junos");
}

TEST_CASE("YAML config: unreadable or malformed file falls back to defaults")
{
    YamlConfigStore missing("does/not/exist/telexpect.yaml");
    CHECK(missing.load().session.host == "127.0.0.1");

    TempFile tmp("telexpect_test_bad.yaml");
    {
        std::ofstream out(tmp.path);
        out << "session: [unterminated\n";
    }
    YamlConfigStore bad(tmp.path);
    CHECK(bad.load().session.port == 23);
}

TEST_CASE("YAML config: profiles extend and override the built-ins")
{
    const TelexpectConfig cfg = YamlConfigStore::parse(kSampleYaml);
    const auto reg = build_profile_registry(cfg);

    REQUIRE(reg.find("vyos") != nullptr);
    REQUIRE(reg.find("linux") != nullptr);
    CHECK(reg.find("linux")->usernamePrompt == "user:");
    REQUIRE(reg.find("ios") != nullptr);
    CHECK(reg.find("ios")->usernamePrompt == "Username:");
}
