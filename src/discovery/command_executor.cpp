#include "command_executor.hpp"
#include <core/log.hpp>
#include <fmt/format.h>
#include <chrono>
#include <exception>

namespace {

double seconds_since(std::chrono::steady_clock::time_point start) {
    return std::chrono::duration<double>(std::chrono::steady_clock::now() - start).count();
}

} // namespace

CommandExecutor::CommandExecutor(StatusCallback log)
    : log_(log ? std::move(log) : default_log_sink()) {
}

void CommandExecutor::emit(const std::string& msg) const {
    try {
        log_(msg);
    } catch (const std::exception&) {
    }
}

CommandResult CommandExecutor::run(RemoteShell* shell, const std::string& command,
                                   const CancelToken& cancel) const {
    emit(fmt::format("Executing remote command: {}", command));

    auto start = std::chrono::steady_clock::now();
    std::string failure;

    try {
        if (!shell || !shell->is_connected()) {
            failure = "SSH connection not established";
        } else {
            SSHResult r = shell->exec(command, cancel);

            CommandResult result;
            result.exit_code = r.exit_code;
            result.error = std::move(r.stderr_data);
            result.elapsed_seconds = seconds_since(start);
            if (result.exit_code >= 0) {
                result.output = std::move(r.stdout_data);
            }

            emit(fmt::format("Remote command completed in {:.1f}s, exit code: {}",
                             result.elapsed_seconds, result.exit_code));
            if (result.exit_code != 0) {
                emit(fmt::format("Remote stderr: {}", result.error));
            }
            return result;
        }
    } catch (const std::exception& e) {
        failure = e.what();
    } catch (...) {
        failure = "unknown error during remote execution";
    }

    CommandResult result;
    result.exit_code = -1;
    result.error = failure;
    result.elapsed_seconds = seconds_since(start);
    emit(fmt::format("Remote command failed in {:.1f}s: {}", result.elapsed_seconds, failure));
    return result;
}
