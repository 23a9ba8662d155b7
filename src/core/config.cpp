#include "config.hpp"
#include "constants.hpp"
#include "utils.hpp"
#include <platform/platform.hpp>
#include <yaml-cpp/yaml.h>
#include <fmt/format.h>
#include <fstream>
#include <sstream>

namespace fs = std::filesystem;

bool global_config_exists() {
    return fs::exists(get_global_config_path());
}

fs::path get_global_config_dir() {
    return platform::home_dir() / ".portscope";
}

fs::path get_global_config_path() {
    return get_global_config_dir() / "config.yaml";
}

// Read an optional scalar string; empty values are treated as absent.
static std::optional<std::string> optional_string(const YAML::Node& node, const char* key) {
    if (!node[key] || !node[key].IsScalar()) return std::nullopt;
    auto value = node[key].as<std::string>();
    if (value.empty()) return std::nullopt;
    return value;
}

Result<Config> Config::parse(const std::string& yaml_text) {
    YAML::Node root;
    try {
        root = YAML::Load(yaml_text);
    } catch (const YAML::Exception& e) {
        return Result<Config>::Err(fmt::format("Invalid YAML: {}", e.what()));
    }

    YAML::Node remote = root["remote"];
    if (!remote || !remote.IsMap()) {
        return Result<Config>::Err("Missing 'remote' section");
    }

    Config config;
    RemoteConfig& r = config.remote_;

    try {
        auto host = optional_string(remote, "host");
        auto user = optional_string(remote, "user");
        if (!host) return Result<Config>::Err("Missing remote.host");
        if (!user) return Result<Config>::Err("Missing remote.user");
        r.host = *host;
        r.user = *user;

        r.port = remote["port"] ? remote["port"].as<int>() : DEFAULT_SSH_PORT;
        if (!is_valid_port(r.port)) {
            return Result<Config>::Err(fmt::format("remote.port out of range: {}", r.port));
        }

        r.password = optional_string(remote, "password");
        if (auto key = optional_string(remote, "ssh_key")) {
            r.ssh_key_path = platform::expand_user(*key).string();
        }

        r.timeout = remote["timeout"] ? remote["timeout"].as<int>() : SSH_CONNECT_TIMEOUT_SECS;
        r.command_timeout = remote["command_timeout"]
                                ? remote["command_timeout"].as<int>()
                                : SSH_CMD_TIMEOUT_SECS;
        if (r.timeout <= 0 || r.command_timeout <= 0) {
            return Result<Config>::Err("Timeouts must be positive");
        }

        if (auto path = optional_string(remote, "deploy_path")) {
            r.deploy_path = *path;
        }
    } catch (const YAML::Exception& e) {
        return Result<Config>::Err(fmt::format("Invalid value in config: {}", e.what()));
    }

    return Result<Config>::Ok(config);
}

Result<Config> Config::load(const fs::path& path) {
    std::ifstream in(path);
    if (!in) {
        return Result<Config>::Err("Cannot read config: " + path.string());
    }
    std::stringstream buf;
    buf << in.rdbuf();

    auto result = parse(buf.str());
    if (result.is_err()) {
        return Result<Config>::Err(path.string() + ": " + result.error);
    }
    return result;
}

Result<Config> Config::load_global() {
    if (!global_config_exists()) {
        return Result<Config>::Err("No config found at " + get_global_config_path().string());
    }
    return load(get_global_config_path());
}
