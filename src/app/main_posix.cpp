#include <cstdint>
#include <cstdio>
#include <cstdlib>
#include <iostream>
#include <string>
#include <string_view>
#include <vector>

#include "telexpect/config/yaml_config_store.h"
#include "telexpect/core/logging.h"
#include "telexpect/platform/tcp_socket_ops.h"
#include "telexpect/telnet/session.h"

using namespace telexpect;

static const char* TAG = "telexpect";

namespace {

struct CliArgs {
    std::string configPath{"telexpect.yaml"};
    std::string host;
    int port{-1};
    std::string deviceType;
    std::string username;
    std::string password;
    bool haveUser{false};
    bool havePass{false};
    bool printTranscript{false};
    std::uint16_t winWidth{0};
    std::uint16_t winHeight{0};
    std::vector<std::string> commands;
};

void usage(const char* argv0)
{
    std::fprintf(stderr,
                 "usage: %s [-c config] [-H host|telnet://host[:port][?opts]] [-p port] [-d device_type]\n"
                 "          [-u username] [-P password] [-w WIDTHxHEIGHT] [-T] command...\n",
                 argv0);
}

bool parse_window(std::string_view s, std::uint16_t& w, std::uint16_t& h)
{
    const auto x = s.find('x');
    if (x == std::string_view::npos) return false;
    const int wi = std::atoi(std::string(s.substr(0, x)).c_str());
    const int hi = std::atoi(std::string(s.substr(x + 1)).c_str());
    if (wi <= 0 || wi > 0xFFFF || hi <= 0 || hi > 0xFFFF) return false;
    w = static_cast<std::uint16_t>(wi);
    h = static_cast<std::uint16_t>(hi);
    return true;
}

bool parse_args(int argc, char** argv, CliArgs& out)
{
    for (int i = 1; i < argc; ++i) {
        const std::string_view a(argv[i]);
        auto value = [&](std::string& dst) {
            if (i + 1 >= argc) return false;
            dst = argv[++i];
            return true;
        };

        std::string v;
        if (a == "-c") {
            if (!value(out.configPath)) return false;
        } else if (a == "-H") {
            if (!value(out.host)) return false;
        } else if (a == "-p") {
            if (!value(v)) return false;
            out.port = std::atoi(v.c_str());
            if (out.port <= 0 || out.port > 65535) return false;
        } else if (a == "-d") {
            if (!value(out.deviceType)) return false;
        } else if (a == "-u") {
            if (!value(out.username)) return false;
            out.haveUser = true;
        } else if (a == "-P") {
            if (!value(out.password)) return false;
            out.havePass = true;
        } else if (a == "-w") {
            if (!value(v) || !parse_window(v, out.winWidth, out.winHeight)) return false;
        } else if (a == "-T") {
            out.printTranscript = true;
        } else if (a == "--") {
            for (++i; i < argc; ++i) out.commands.emplace_back(argv[i]);
        } else if (!a.empty() && a[0] == '-') {
            return false;
        } else {
            out.commands.emplace_back(a);
        }
    }
    return true;
}

int report(const telnet::Session& session, const char* what, Status st)
{
    std::fprintf(stderr, "%s: %s", what, to_string(st));
    if (!session.last_error().empty()) {
        std::fprintf(stderr, " (%s)", session.last_error().c_str());
    }
    std::fprintf(stderr, "\n");
    return 1;
}

} // namespace

int main(int argc, char** argv)
{
    CliArgs args;
    if (!parse_args(argc, argv, args)) {
        usage(argv[0]);
        return 2;
    }

    config::YamlConfigStore store(args.configPath);
    config::TelexpectConfig cfg = store.load();

    if (args.host.find("://") != std::string::npos) {
        if (!telnet::apply_target_url(args.host, cfg.session)) {
            std::fprintf(stderr, "malformed target url '%s'\n", args.host.c_str());
            usage(argv[0]);
            return 2;
        }
    } else if (!args.host.empty()) {
        cfg.session.host = args.host;
    }
    if (args.port > 0) cfg.session.port = static_cast<std::uint16_t>(args.port);
    if (!args.deviceType.empty()) cfg.target.deviceType = args.deviceType;
    if (args.haveUser) cfg.target.username = args.username;
    if (args.havePass) cfg.target.password = args.password;

    const auto profiles = config::build_profile_registry(cfg);

    TX_LOGI(TAG, "connecting to %s:%u", cfg.session.host.c_str(), static_cast<unsigned>(cfg.session.port));

    telnet::Session session(cfg.session);
    int rc = 0;

    if (Status st = session.connect(platform::default_tcp_socket_ops()); st != Status::Ok) {
        return report(session, "connect", st);
    }

    if (args.winWidth > 0) {
        if (Status st = session.set_window_size(args.winWidth, args.winHeight); st != Status::Ok) {
            rc = report(session, "window size", st);
        }
    }

    const bool wantLogin = rc == 0 &&
        (!cfg.target.username.empty() || !cfg.target.password.empty());
    if (wantLogin) {
        const Status st = session.login(cfg.target.username, cfg.target.password,
                                        cfg.target.deviceType, profiles);
        if (st != Status::Ok) {
            rc = report(session, "login", st);
        }
    }

    for (const auto& cmd : args.commands) {
        if (rc != 0) break;

        std::string out;
        const Status st = session.exec(cmd, out);
        if (st != Status::Ok) {
            rc = report(session, cmd.c_str(), st);
            break;
        }
        std::cout << out << "\n";
    }

    if (args.printTranscript) {
        std::cout << "----- transcript -----\n" << session.transcript_text() << "\n";
    }

    if (Status st = session.disconnect(); st != Status::Ok && rc == 0) {
        rc = report(session, "disconnect", st);
    }

    TX_LOGI(TAG, "telexpect exiting (%d).", rc);
    return rc;
}
