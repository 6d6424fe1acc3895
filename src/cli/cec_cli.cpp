#include "cec_cli.hpp"
#include "theme.hpp"
#include <core/constants.hpp>
#include <core/log.hpp>
#include <core/shell_quote.hpp>
#include <ssh/session.hpp>
#include <fmt/format.h>

CliArgs parse_cli_args(const std::vector<std::string>& args) {
    CliArgs parsed;
    parsed.command_args = args;

    auto& rest = parsed.command_args;
    for (size_t i = 0; i < rest.size(); i++) {
        if (rest[i] != "--config" && rest[i] != "-c") continue;

        if (i + 1 >= rest.size()) {
            parsed.config_flag_missing_value = true;
            return parsed;
        }
        if (!rest[i + 1].empty()) {
            parsed.config_path = rest[i + 1];
        }
        rest.erase(rest.begin() + i, rest.begin() + i + 2);
        break;
    }
    return parsed;
}

CecSshCli::CecSshCli(SearchEnvironment env, std::ostream& out, std::ostream& err)
    : env_(std::move(env)), out_(out), err_(err),
      factory_([](const ConnectionConfig& cfg) -> std::shared_ptr<SshSession> {
          return std::make_shared<SessionManager>(make_session_target(cfg));
      }),
      sink_(stdout_sink()) {}

void CecSshCli::print_usage() {
    out_ << "Usage: cec-ssh [--config <path>] <cec-ctl arguments...>\n"
         << "Example: cec-ssh -d /dev/cec1 -M\n"
         << theme::dim(fmt::format("Without --config, {} is looked up in the current "
                                   "directory, then in each PATH directory.", CONFIG_FILE_NAME))
         << "\n";
}

int CecSshCli::report_config_error(const ConfigResolution& res) {
    switch (res.kind) {
        case ConfigErrorKind::ExplicitNotFound:
            err_ << theme::fail(res.error);
            return EXIT_CONFIG_MISSING;
        case ConfigErrorKind::NotFound:
            err_ << theme::fail(res.error + ". Tried:");
            for (const auto& p : res.tried) {
                err_ << theme::item(p.string());
            }
            err_ << theme::step("Pass --config <path> to point at a config file.");
            return EXIT_CONFIG_NOT_FOUND;
        case ConfigErrorKind::ParseError:
            err_ << theme::fail(fmt::format("Failed to read/parse {}: {}",
                                            res.path.string(), res.error));
            return EXIT_CONFIG_INVALID;
        case ConfigErrorKind::None:
            break;
    }
    return EXIT_OK;
}

int CecSshCli::run(const std::vector<std::string>& args) {
    CliArgs parsed = parse_cli_args(args);

    if (parsed.config_flag_missing_value) {
        err_ << theme::fail("--config requires a path argument.");
        return EXIT_CONFIG_FLAG;
    }
    if (parsed.command_args.empty()) {
        print_usage();
        return EXIT_USAGE;
    }

    std::optional<fs::path> explicit_path;
    if (parsed.config_path) explicit_path = fs::path(*parsed.config_path);

    ConfigResolver resolver(env_);
    ConfigResolution res = resolver.resolve(explicit_path);
    if (res.is_err()) {
        cecssh_log("Config resolution failed: " + res.error);
        return report_config_error(res);
    }

    std::string remote = build_remote_command(parsed.command_args);
    cecssh_log(fmt::format("Remote command for {}@{}:{}: {}",
                           res.config.username, res.config.host, res.config.port, remote));

    SessionOrchestrator orchestrator(factory_(res.config), remote, opts_, sink_);
    RunOutcome outcome = orchestrator.run();

    switch (outcome.exit_code) {
        case EXIT_OK:
            break;
        case EXIT_CONNECT_FAILED:
            err_ << theme::fail("SSH connection failed: " + outcome.error);
            break;
        case EXIT_SHELL_FAILED:
            err_ << theme::fail("Could not open remote shell: " + outcome.error);
            break;
        case EXIT_DISPATCH_FAILED:
            err_ << theme::fail("Failed to send command to remote: " + outcome.error);
            break;
        default:
            err_ << theme::fail(outcome.error);
            break;
    }
    return outcome.exit_code;
}
