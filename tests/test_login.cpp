#include "doctest.h"

#include "fake_stream.h"

#include "telexpect/telnet/login_profile.h"
#include "telexpect/telnet/login_sequencer.h"
#include "telexpect/telnet/session.h"

#include <string>
#include <vector>

namespace telexpect::tests {

using namespace telexpect::telnet;

TEST_CASE("built-in login profiles")
{
    const auto reg = LoginProfileRegistry::with_builtin_profiles();

    const std::vector<std::string> expected = {
        "alaxala", "bdcom", "cdata", "dlink", "ios", "junos", "linux", "xos"};
    CHECK(reg.device_types() == expected);

    const auto* ios = reg.find("ios");
    REQUIRE(ios != nullptr);
    CHECK(ios->usernamePrompt == "Username:");
    CHECK(ios->passwordPrompt == "Password:");
    CHECK(ios->finalPromptPattern == "[>#]");

    const auto* dlink = reg.find("dlink");
    REQUIRE(dlink != nullptr);
    CHECK(dlink->usernamePrompt == "ame:");
    CHECK(dlink->passwordPrompt == "ord:");

    CHECK(reg.find("vms") == nullptr);
}

TEST_CASE("every built-in shell prompt compiles")
{
    const auto reg = LoginProfileRegistry::with_builtin_profiles();
    for (const auto& type : reg.device_types()) {
        PromptPattern p;
        CHECK_MESSAGE(PromptPattern::from_regex(reg.find(type)->finalPromptPattern, p), type);
    }
}

TEST_CASE("registry: register refuses duplicates, set replaces")
{
    auto reg = LoginProfileRegistry::with_builtin_profiles();

    CHECK_FALSE(reg.register_profile("linux", {"a", "b", "c"}));
    CHECK_FALSE(reg.register_profile("", {"a", "b", "c"}));
    CHECK(reg.register_profile("vyos", {"login:", "Password:", "[$#] "}));
    CHECK(reg.find("vyos") != nullptr);

    reg.set_profile("linux", {"user:", "pass:", "% "});
    CHECK(reg.find("linux")->usernamePrompt == "user:");
}

TEST_CASE("ios login waits for each prompt before answering it")
{
    auto peer = std::make_shared<ScriptState>();
    peer->feed("\r\nUser Access Verification\r\n\r\nUsername:");
    peer->on_write("admin\r\n", "\r\nPassword:");
    peer->on_write("secret\r\n", "\r\nrouter#");

    Session s;
    REQUIRE(s.attach(make_stream(peer)) == Status::Ok);

    const auto reg = LoginProfileRegistry::with_builtin_profiles();
    CHECK(s.login("admin", "secret", "ios", reg) == Status::Ok);

    CHECK(peer->written == "admin\r\nsecret\r\n");
    CHECK(s.transcript().raw() ==
          "\r\nUser Access Verification\r\n\r\nUsername:admin\r\n"
          "\r\nPassword:secret\r\n"
          "\r\nrouter#");

    // The shell prompt stays in effect for later commands.
    CHECK(s.prompt().source() == "[>#]");
    peer->on_write("show clock\r\n", "show clock\r\n*10:00:00 UTC\r\nrouter#");
    std::string out;
    CHECK(s.exec("show clock", out) == Status::Ok);
    CHECK(out == "show clock\n*10:00:00 UTC");
}

TEST_CASE("empty username skips the username step")
{
    auto peer = std::make_shared<ScriptState>();
    peer->feed("Password: ");
    peer->on_write("pw\r\n", "\r\nuser@host:~$");

    Session s;
    REQUIRE(s.attach(make_stream(peer)) == Status::Ok);

    const auto reg = LoginProfileRegistry::with_builtin_profiles();
    CHECK(s.login("", "pw", "linux", reg) == Status::Ok);
    CHECK(peer->written == "pw\r\n");
}

TEST_CASE("login prompts are matched as plain text")
{
    // cdata matches on "ame:" / "ord:" and an OLT shell prompt
    auto peer = std::make_shared<ScriptState>();
    peer->feed(">>User name:");
    peer->on_write("root\r\n", "\r\n>>User password:");
    peer->on_write("admin\r\n", "\r\nOLT-A#");

    Session s;
    REQUIRE(s.attach(make_stream(peer)) == Status::Ok);

    const auto reg = LoginProfileRegistry::with_builtin_profiles();
    CHECK(s.login("root", "admin", "cdata", reg) == Status::Ok);
}

TEST_CASE("unknown device type is rejected before any I/O")
{
    auto peer = std::make_shared<ScriptState>();
    peer->feed("login: ");

    Session s;
    REQUIRE(s.attach(make_stream(peer)) == Status::Ok);

    const auto reg = LoginProfileRegistry::with_builtin_profiles();
    CHECK(s.login("u", "p", "toaster", reg) == Status::InvalidRequest);
    CHECK(s.last_error().find("toaster") != std::string::npos);
    CHECK(peer->writeCalls == 0);
    CHECK(peer->incoming.size() == 7);
}

TEST_CASE("peer hanging up during login is LoginFailed")
{
    auto peer = std::make_shared<ScriptState>();
    peer->feed("login: ");
    peer->closeWhenDrained = true;

    Session s;
    REQUIRE(s.attach(make_stream(peer)) == Status::Ok);

    const auto reg = LoginProfileRegistry::with_builtin_profiles();
    CHECK(s.login("root", "bad", "linux", reg) == Status::LoginFailed);
    CHECK(s.last_error() == "Login failed.");
    CHECK(peer->written == "root\r\n");
}

TEST_CASE("rejected password is LoginFailed")
{
    auto peer = std::make_shared<ScriptState>();
    peer->feed("login: ");
    peer->on_write("root\r\n", "Password: ");
    peer->on_write("bad\r\n", "\r\nLogin incorrect\r\nlogin: ");

    Session s;
    REQUIRE(s.attach(make_stream(peer)) == Status::Ok);

    const auto reg = LoginProfileRegistry::with_builtin_profiles();
    CHECK(s.login("root", "bad", "linux", reg) == Status::LoginFailed);
    CHECK(s.buffer().empty());
}

TEST_CASE("LoginSequencer reports the failing step")
{
    auto peer = std::make_shared<ScriptState>();
    peer->feed("Username: ");

    Session s;
    REQUIRE(s.attach(make_stream(peer)) == Status::Ok);

    const auto reg = LoginProfileRegistry::with_builtin_profiles();
    LoginSequencer seq(reg);
    std::string cause;
    CHECK(seq.run(s, "admin", "pw", "ios", &cause) == Status::LoginFailed);
    CHECK(cause.find("password prompt") != std::string::npos);
}

} // namespace telexpect::tests
