#include "shell_quote.hpp"
#include "constants.hpp"
#include <algorithm>
#include <cctype>

static bool is_shell_significant(char c) {
    switch (c) {
        case '"': case '\'': case '\\': case '$': case '`':
        case '*': case '?': case '[': case ']':
        case '(': case ')': case '<': case '>':
        case '|': case '&': case ';':
            return true;
        default:
            return std::isspace(static_cast<unsigned char>(c)) != 0;
    }
}

std::string quote_for_shell(const std::string& arg) {
    if (arg.empty()) return "''";

    if (std::none_of(arg.begin(), arg.end(), is_shell_significant)) {
        return arg;
    }

    std::string out = "'";
    for (char c : arg) {
        if (c == '\'') {
            out += "'\"'\"'";
        } else {
            out += c;
        }
    }
    out += "'";
    return out;
}

std::string build_remote_command(const std::vector<std::string>& args) {
    std::string cmd = std::string("exec ") + REMOTE_PROGRAM;
    for (const auto& a : args) {
        cmd += ' ';
        cmd += quote_for_shell(a);
    }
    return cmd;
}

std::string build_dispatch_line(const std::string& remote_command) {
    return ECHO_OFF_PREFIX + remote_command;
}
