#pragma once

#include <string>
#include <optional>
#include <vector>
#include <filesystem>

// Result type for operations that can fail
template <typename T>
struct Result {
    bool success;
    T value;
    std::string error;

    static Result<T> Ok(T val) {
        return {true, std::move(val), ""};
    }

    static Result<T> Err(const std::string& err) {
        return {false, T{}, err};
    }

    bool is_ok() const { return success; }
    bool is_err() const { return !success; }
};

// Specialization for void
template <>
struct Result<void> {
    bool success;
    std::string error;

    static Result<void> Ok() {
        return {true, ""};
    }

    static Result<void> Err(const std::string& err) {
        return {false, err};
    }

    bool is_ok() const { return success; }
    bool is_err() const { return !success; }
};

// SSH operation result. exit_code is 0 on success; error carries the
// failure message.
struct SSHResult {
    int exit_code;
    std::string error;

    bool failed() const { return exit_code != 0; }
};

// Connection parameters loaded from cec-ssh_config.json
struct ConnectionConfig {
    std::string host;
    int port = 22;
    std::string username;
    std::string password;
    int connect_timeout = 0;                     // seconds, 0 = wait forever
};

// Why config resolution failed
enum class ConfigErrorKind {
    None,
    ExplicitNotFound,   // --config path does not exist
    NotFound,           // nothing in cwd or PATH
    ParseError,         // file found but unreadable / invalid
};

struct ConfigResolution {
    ConfigErrorKind kind = ConfigErrorKind::None;
    ConnectionConfig config;
    std::filesystem::path path;                  // file that was loaded (or the explicit path)
    std::vector<std::filesystem::path> tried;    // search order, only filled on NotFound
    std::string error;

    bool is_ok() const { return kind == ConfigErrorKind::None; }
    bool is_err() const { return kind != ConfigErrorKind::None; }
};
