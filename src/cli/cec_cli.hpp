#pragma once

#include <functional>
#include <iostream>
#include <memory>
#include <optional>
#include <string>
#include <vector>
#include <core/config.hpp>
#include <session/orchestrator.hpp>
#include <ssh/transport.hpp>

// Result of splitting argv into the --config flag and cec-ctl arguments.
struct CliArgs {
    std::optional<std::string> config_path;
    std::vector<std::string> command_args;
    bool config_flag_missing_value = false;
};

// The first --config / -c anywhere consumes exactly one following argument.
// Everything else passes through to cec-ctl in order. An empty value counts
// as "not given".
CliArgs parse_cli_args(const std::vector<std::string>& args);

// Top-level wiring: args -> config -> remote command -> orchestrator -> exit code.
class CecSshCli {
public:
    using SessionFactory = std::function<std::shared_ptr<SshSession>(const ConnectionConfig&)>;

    CecSshCli(SearchEnvironment env, std::ostream& out, std::ostream& err);

    // Swap the transport (defaults to libssh2 SessionManager).
    void set_session_factory(SessionFactory factory) { factory_ = std::move(factory); }
    void set_orchestrator_options(const OrchestratorOptions& opts) { opts_ = opts; }
    void set_output_sink(OutputSink sink) { sink_ = std::move(sink); }

    // args excludes the program name. Returns the process exit code.
    int run(const std::vector<std::string>& args);

private:
    SearchEnvironment env_;
    std::ostream& out_;
    std::ostream& err_;
    SessionFactory factory_;
    OrchestratorOptions opts_;
    OutputSink sink_;

    void print_usage();
    int report_config_error(const ConfigResolution& res);
};
