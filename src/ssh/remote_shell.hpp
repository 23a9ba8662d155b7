#pragma once

#include <string>
#include <core/types.hpp>
#include <core/cancel_token.hpp>

// Anything that can run a shell command on the deployment host.
// SSHConnection is the real implementation; tests substitute fakes.
class RemoteShell {
public:
    virtual ~RemoteShell() = default;

    virtual bool is_connected() const = 0;

    // Host name the deployed services are reachable on.
    virtual std::string host() const = 0;

    // Run one command to completion (or until cancelled) and return its
    // exit code, stdout and stderr. May throw on transport failures.
    virtual SSHResult exec(const std::string& command, const CancelToken& cancel) = 0;
};
