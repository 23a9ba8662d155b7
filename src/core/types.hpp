#pragma once

#include <string>
#include <optional>
#include <vector>
#include <map>
#include <functional>
#include <cstdint>

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

// SSH command execution result
struct SSHResult {
    int exit_code;
    std::string stdout_data;
    std::string stderr_data;

    bool success() const { return exit_code == 0; }
    bool failed() const { return exit_code != 0; }
};

// Service/container name -> reachable URLs ("http://host:port").
using EndpointMap = std::map<std::string, std::vector<std::string>>;

// Configuration structures
struct RemoteConfig {
    std::string host;
    std::string user;
    int port = 22;
    std::optional<std::string> password;
    std::optional<std::string> ssh_key_path;
    int timeout = 30;               // connect timeout (seconds)
    int command_timeout = 120;      // per remote command (seconds)
    std::string deploy_path = "~";  // working directory for discovery
};

// Status callback for operations
using StatusCallback = std::function<void(const std::string&)>;
