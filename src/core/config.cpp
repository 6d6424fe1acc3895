#include "config.hpp"
#include "constants.hpp"
#include "log.hpp"
#include "utils.hpp"
#include <platform/platform.hpp>
#include <yaml-cpp/yaml.h>
#include <fmt/format.h>
#include <map>
#include <system_error>

namespace fs = std::filesystem;

SearchEnvironment current_search_environment() {
    SearchEnvironment env;
    std::error_code ec;
    env.cwd = fs::current_path(ec);
    if (ec) env.cwd = fs::path(".");
    env.search_path = platform::get_env(PATH_ENV_VAR);
    return env;
}

bool config_file_exists(const fs::path& p) {
    std::error_code ec;
    bool exists = fs::is_regular_file(p, ec);
    if (ec) return false;
    return exists;
}

ConfigResolver::ConfigResolver(SearchEnvironment env) : env_(std::move(env)) {}

std::optional<fs::path> ConfigResolver::find_config(std::vector<fs::path>& tried) const {
    // 1) Current working directory
    fs::path cur = env_.cwd / CONFIG_FILE_NAME;
    tried.push_back(cur);
    if (config_file_exists(cur)) return cur;

    // 2) Each PATH directory, in listed order
    if (!env_.search_path) return std::nullopt;

    for (const auto& dir : platform::search_path_entries(*env_.search_path)) {
        fs::path candidate;
        try {
            candidate = fs::path(dir) / CONFIG_FILE_NAME;
        } catch (const std::exception& e) {
            // Unrepresentable entry: skip it, keep searching
            cecssh_log_ignored(fmt::format("Probing PATH entry '{}'", dir), e.what());
            continue;
        }
        tried.push_back(candidate);
        if (config_file_exists(candidate)) return candidate;
    }

    return std::nullopt;
}

ConfigResolution ConfigResolver::resolve(const std::optional<fs::path>& explicit_path) const {
    ConfigResolution res;

    if (explicit_path) {
        res.path = *explicit_path;
        if (!config_file_exists(res.path)) {
            res.kind = ConfigErrorKind::ExplicitNotFound;
            res.error = "Config file does not exist: " + res.path.string();
            return res;
        }
    } else {
        auto found = find_config(res.tried);
        if (!found) {
            res.kind = ConfigErrorKind::NotFound;
            res.error = fmt::format("Config file {} not found", CONFIG_FILE_NAME);
            return res;
        }
        res.path = *found;
        res.tried.clear();
    }

    cecssh_log("Loading config from " + res.path.string());
    auto loaded = load_file(res.path);
    if (loaded.is_err()) {
        res.kind = ConfigErrorKind::ParseError;
        res.error = loaded.error;
        return res;
    }

    res.config = loaded.value;
    return res;
}

// Index a mapping by lower-cased key. Later duplicates win.
static std::map<std::string, YAML::Node> fold_keys(const YAML::Node& root) {
    std::map<std::string, YAML::Node> fields;
    for (const auto& kv : root) {
        fields[to_lower(kv.first.as<std::string>())] = kv.second;
    }
    return fields;
}

// yaml-cpp tags quoted scalars "!" and plain ones "?". JSON strings are
// always quoted; numbers, booleans and null never are.
static bool is_quoted(const YAML::Node& node) {
    return node.IsScalar() && node.Tag() == "!";
}

static Result<std::string> required_string(const std::map<std::string, YAML::Node>& fields,
                                           const std::string& key, bool allow_empty) {
    auto it = fields.find(key);
    if (it == fields.end() || it->second.IsNull()) {
        return Result<std::string>::Err(fmt::format("missing required field '{}'", key));
    }
    if (!is_quoted(it->second)) {
        return Result<std::string>::Err(fmt::format("field '{}' must be a string", key));
    }
    std::string value = it->second.as<std::string>();
    // Passwords are taken verbatim, names are not
    if (!allow_empty) trim(value);
    if (!allow_empty && value.empty()) {
        return Result<std::string>::Err(fmt::format("field '{}' must not be empty", key));
    }
    return Result<std::string>::Ok(value);
}

static Result<int> optional_int(const std::map<std::string, YAML::Node>& fields,
                                const std::string& key, int fallback, int min, int max) {
    auto it = fields.find(key);
    if (it == fields.end() || it->second.IsNull()) {
        return Result<int>::Ok(fallback);
    }
    if (!it->second.IsScalar() || is_quoted(it->second)) {
        return Result<int>::Err(fmt::format("field '{}' must be an integer", key));
    }
    int value = safe_stoi(it->second.Scalar(), min - 1);
    if (value < min || value > max) {
        return Result<int>::Err(fmt::format("field '{}' must be an integer in [{}, {}], got '{}'",
                                            key, min, max, it->second.Scalar()));
    }
    return Result<int>::Ok(value);
}

Result<ConnectionConfig> ConfigResolver::load_file(const fs::path& path) {
    try {
        YAML::Node root = YAML::LoadFile(path.string());
        if (!root.IsMap()) {
            return Result<ConnectionConfig>::Err(
                fmt::format("{}: expected an object at the top level", path.string()));
        }

        auto fields = fold_keys(root);
        ConnectionConfig cfg;

        auto host = required_string(fields, "host", false);
        if (host.is_err()) return Result<ConnectionConfig>::Err(host.error);
        cfg.host = host.value;

        auto user = required_string(fields, "username", false);
        if (user.is_err()) return Result<ConnectionConfig>::Err(user.error);
        cfg.username = user.value;

        auto password = required_string(fields, "password", true);
        if (password.is_err()) return Result<ConnectionConfig>::Err(password.error);
        cfg.password = password.value;

        auto port = optional_int(fields, "port", 22, 1, 65535);
        if (port.is_err()) return Result<ConnectionConfig>::Err(port.error);
        cfg.port = port.value;

        auto timeout = optional_int(fields, "connect_timeout", 0, 0, 86400);
        if (timeout.is_err()) return Result<ConnectionConfig>::Err(timeout.error);
        cfg.connect_timeout = timeout.value;

        return Result<ConnectionConfig>::Ok(cfg);
    } catch (const YAML::Exception& e) {
        return Result<ConnectionConfig>::Err(e.what());
    }
}
