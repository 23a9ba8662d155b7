#pragma once

#include <string>
#include <filesystem>
#include "types.hpp"

namespace fs = std::filesystem;

class Config {
public:
    // Load from an explicit YAML file.
    static Result<Config> load(const fs::path& path);

    // Parse YAML text (used by load and by tests).
    static Result<Config> parse(const std::string& yaml_text);

    // Load ~/.portscope/config.yaml
    static Result<Config> load_global();

    const RemoteConfig& remote() const { return remote_; }

    Config() = default;

private:
    RemoteConfig remote_;
};

// Helper to check if the global config exists
bool global_config_exists();

// Get paths
fs::path get_global_config_dir();
fs::path get_global_config_path();
