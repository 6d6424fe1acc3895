#pragma once

#include <string>
#include <vector>

// Quote one argument for a POSIX shell. Arguments without shell-significant
// characters pass through untouched; everything else is single-quoted, with
// embedded single quotes written as '"'"'. Empty becomes ''.
std::string quote_for_shell(const std::string& arg);

// "exec cec-ctl <quoted args...>". exec makes the remote shell hand its
// PTY and signals straight to cec-ctl.
std::string build_remote_command(const std::vector<std::string>& args);

// The single line written to the channel: "stty -echo; <remote_command>".
// No trailing newline.
std::string build_dispatch_line(const std::string& remote_command);
