#pragma once

#include <string>
#include <core/types.hpp>
#include <core/cancel_token.hpp>
#include <ssh/remote_shell.hpp>

// Outcome of one remote invocation. A failure to execute at all is
// exit_code == -1 with error set and output empty.
struct CommandResult {
    int exit_code = -1;
    std::string output;
    std::string error;
    double elapsed_seconds = 0.0;

    bool success() const { return exit_code == 0; }
    bool has_output() const { return success() && !output.empty(); }
};

// Runs single commands against an already-connected RemoteShell.
// run() never throws; every failure is folded into the CommandResult.
class CommandExecutor {
public:
    // log defaults to the debug log file when null
    explicit CommandExecutor(StatusCallback log = nullptr);

    CommandResult run(RemoteShell* shell, const std::string& command,
                      const CancelToken& cancel) const;

private:
    // A sink that throws must not escape run()
    void emit(const std::string& msg) const;

    StatusCallback log_;
};
