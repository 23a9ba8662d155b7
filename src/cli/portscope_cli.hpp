#pragma once

#include <optional>
#include <string>
#include <vector>
#include <core/types.hpp>
#include <core/cancel_token.hpp>

struct CliOptions {
    std::string deploy_path;                 // empty = config value
    std::optional<std::string> config_path;  // empty = ~/.portscope/config.yaml
    std::optional<std::string> host;
    std::optional<std::string> user;
    std::optional<int> port;
    bool verbose = false;
};

// Parse "[deploy_path] [--config F] [--host H] [--user U] [--port N] [--verbose]".
Result<CliOptions> parse_cli_options(const std::vector<std::string>& args);

// Offline parser selection for `portscope parse <kind> <file>`.
// Returns nullopt for an unknown kind.
std::optional<EndpointMap> parse_captured_output(const std::string& kind,
                                                 const std::string& text,
                                                 const std::string& host);

class PortscopeCLI {
public:
    PortscopeCLI();

    // Connect, discover, print the table. Returns the process exit code.
    int run_discover(const CliOptions& options);

    // Parse captured output from a local file and print the table.
    int run_parse(const std::string& kind, const std::string& file, const std::string& host);

    const CancelToken& cancel_token() const { return cancel_; }

private:
    CancelToken cancel_;
};
