#pragma once

#include <string>
#include <vector>
#include <core/types.hpp>
#include <core/cancel_token.hpp>
#include "command_executor.hpp"

// One way of finding exposed ports: a remote command plus the parser for
// its output.
struct DiscoveryStrategy {
    std::string name;
    std::string (*command)(const std::string& working_dir);
    EndpointMap (*parse)(const std::string& output, const std::string& host);
};

// Tries, in order: compose ps JSON, docker ps table, the compose file, and
// docker-proxy listeners. Returns the first non-empty map. An empty result
// means "no exposed ports detected", not an error.
class PortDiscovery {
public:
    explicit PortDiscovery(StatusCallback log = nullptr);

    EndpointMap discover(RemoteShell* shell, const std::string& working_dir,
                         const std::string& host, const CancelToken& cancel) const;

    // Same, with the host taken from the shell.
    EndpointMap discover(RemoteShell* shell, const std::string& working_dir,
                         const CancelToken& cancel) const;

    static const std::vector<DiscoveryStrategy>& strategies();

    // Remote commands, each run from working_dir
    static std::string compose_ps_command(const std::string& working_dir);
    static std::string docker_ps_command(const std::string& working_dir);
    static std::string compose_file_command(const std::string& working_dir);
    static std::string listener_command(const std::string& working_dir);

private:
    StatusCallback log_;
    CommandExecutor executor_;
};
