#include "port_discovery.hpp"
#include "output_parsers.hpp"
#include <core/constants.hpp>
#include <core/log.hpp>
#include <core/utils.hpp>
#include <fmt/format.h>

static std::string in_dir(const std::string& working_dir, const std::string& cmd) {
    return fmt::format("cd {} && {}", shell_quote(working_dir), cmd);
}

std::string PortDiscovery::compose_ps_command(const std::string& working_dir) {
    return in_dir(working_dir,
        "(docker compose ps --format json || docker-compose ps --format json) 2>/dev/null");
}

std::string PortDiscovery::docker_ps_command(const std::string& working_dir) {
    return in_dir(working_dir,
        "docker ps --format 'table {{.Names}}\\t{{.Ports}}' --no-trunc");
}

std::string PortDiscovery::compose_file_command(const std::string& working_dir) {
    return in_dir(working_dir,
        "(cat docker-compose.yml 2>/dev/null || cat docker-compose.yaml 2>/dev/null)");
}

std::string PortDiscovery::listener_command(const std::string& working_dir) {
    return in_dir(working_dir,
        "netstat -tlnp 2>/dev/null | grep docker-proxy | awk '{print $4}' "
        "| sed 's/.*://' | sort -nu");
}

const std::vector<DiscoveryStrategy>& PortDiscovery::strategies() {
    static const std::vector<DiscoveryStrategy> list = {
        {"compose ps json", &PortDiscovery::compose_ps_command,   &parse_compose_ps_json},
        {"docker ps table", &PortDiscovery::docker_ps_command,    &parse_docker_ps_table},
        {"compose file",    &PortDiscovery::compose_file_command, &parse_compose_file},
        {"listener dump",   &PortDiscovery::listener_command,     &parse_listener_ports},
    };
    return list;
}

PortDiscovery::PortDiscovery(StatusCallback log)
    : log_(log ? std::move(log) : default_log_sink()), executor_(log_) {
}

EndpointMap PortDiscovery::discover(RemoteShell* shell, const std::string& working_dir,
                                    const std::string& host, const CancelToken& cancel) const {
    for (const auto& strategy : strategies()) {
        CommandResult result = executor_.run(shell, strategy.command(working_dir), cancel);
        if (!result.has_output()) continue;

        EndpointMap found = strategy.parse(result.output, host);
        if (!found.empty()) {
            log_(fmt::format("Port discovery: '{}' found {} service(s)",
                             strategy.name, found.size()));
            return found;
        }
    }

    log_("Port discovery: no exposed ports detected");
    return {};
}

EndpointMap PortDiscovery::discover(RemoteShell* shell, const std::string& working_dir,
                                    const CancelToken& cancel) const {
    std::string host = (shell && !shell->host().empty()) ? shell->host() : DEFAULT_HOST;
    return discover(shell, working_dir, host, cancel);
}
