#include "portscope_cli.hpp"
#include "service_table.hpp"
#include "theme.hpp"
#include <core/config.hpp>
#include <core/constants.hpp>
#include <core/log.hpp>
#include <core/utils.hpp>
#include <discovery/output_parsers.hpp>
#include <platform/platform.hpp>
#include <discovery/port_discovery.hpp>
#include <ssh/connection.hpp>
#include <ssh/session.hpp>
#include <fmt/format.h>
#include <fstream>
#include <iostream>
#include <sstream>

Result<CliOptions> parse_cli_options(const std::vector<std::string>& args) {
    CliOptions opts;

    for (size_t i = 0; i < args.size(); i++) {
        const std::string& arg = args[i];

        if (arg == "--verbose" || arg == "-v") {
            opts.verbose = true;
        } else if (arg == "--config" || arg == "--host" || arg == "--user" || arg == "--port") {
            if (i + 1 >= args.size()) {
                return Result<CliOptions>::Err("Missing value for " + arg);
            }
            std::optional<std::string> value = args[++i];
            if (arg == "--config") {
                opts.config_path = *value;
            } else if (arg == "--host") {
                opts.host = *value;
            } else if (arg == "--user") {
                opts.user = *value;
            } else {
                auto port = parse_port(*value);
                if (!port) return Result<CliOptions>::Err("Invalid port: " + *value);
                opts.port = *port;
            }
        } else if (!arg.empty() && arg[0] == '-') {
            return Result<CliOptions>::Err("Unknown option: " + arg);
        } else if (opts.deploy_path.empty()) {
            opts.deploy_path = arg;
        } else {
            return Result<CliOptions>::Err("Unexpected argument: " + arg);
        }
    }

    return Result<CliOptions>::Ok(opts);
}

std::optional<EndpointMap> parse_captured_output(const std::string& kind,
                                                 const std::string& text,
                                                 const std::string& host) {
    if (kind == "json")      return parse_compose_ps_json(text, host);
    if (kind == "table")     return parse_docker_ps_table(text, host);
    if (kind == "compose")   return parse_compose_file(text, host);
    if (kind == "listeners") return parse_listener_ports(text, host);
    return std::nullopt;
}

PortscopeCLI::PortscopeCLI() = default;

int PortscopeCLI::run_discover(const CliOptions& options) {
    auto config_result = options.config_path
                             ? Config::load(platform::expand_user(*options.config_path))
                             : Config::load_global();
    if (config_result.is_err()) {
        std::cout << theme::fail(config_result.error);
        return 1;
    }

    RemoteConfig remote = config_result.value.remote();
    if (options.host) remote.host = *options.host;
    if (options.user) remote.user = *options.user;
    if (options.port) remote.port = *options.port;
    if (!options.deploy_path.empty()) remote.deploy_path = options.deploy_path;

    StatusCallback log = options.verbose ? verbose_log_sink() : default_log_sink();

    SessionManager session(SessionTarget::from_config(remote));
    auto connected = session.establish(log);
    if (connected.failed()) {
        std::cout << theme::fail("Connection failed: " + connected.stderr_data);
        return 1;
    }

    std::cout << theme::step(fmt::format("Discovering exposed ports in {} on {}",
                                         remote.deploy_path, remote.host));

    SSHConnection shell(session, remote.command_timeout);
    PortDiscovery discovery(log);
    EndpointMap services = discovery.discover(&shell, remote.deploy_path, cancel_);
    session.close();

    if (cancel_.cancelled()) {
        std::cout << theme::info("Cancelled; results may be incomplete.");
    }
    std::cout << format_service_table(services) << "\n";
    return 0;
}

int PortscopeCLI::run_parse(const std::string& kind, const std::string& file,
                            const std::string& host) {
    std::ifstream in(file);
    if (!in) {
        std::cout << theme::fail("Cannot read " + file);
        return 1;
    }
    std::stringstream buf;
    buf << in.rdbuf();

    auto services = parse_captured_output(kind, buf.str(), host);
    if (!services) {
        std::cout << theme::fail("Unknown output kind: " + kind);
        std::cout << theme::step("Expected one of: json, table, compose, listeners");
        return 1;
    }

    std::cout << format_service_table(*services) << "\n";
    return 0;
}
