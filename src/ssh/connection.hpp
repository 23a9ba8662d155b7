#pragma once

#include <memory>
#include <mutex>
#include <string>
#include <core/types.hpp>
#include "remote_shell.hpp"

// libssh2 forward declarations
typedef struct _LIBSSH2_SESSION LIBSSH2_SESSION;
typedef struct _LIBSSH2_CHANNEL LIBSSH2_CHANNEL;

class SessionManager;

// Runs each command on a fresh exec channel (no PTY), so stdout, stderr and
// the exit status come back separately and binary-clean.
class SSHConnection : public RemoteShell {
public:
    SSHConnection(SessionManager& session, int timeout_secs);

    bool is_connected() const override;
    std::string host() const override;
    SSHResult exec(const std::string& command, const CancelToken& cancel) override;

private:
    SessionManager& session_;
    int timeout_secs_;

    LIBSSH2_CHANNEL* open_channel(LIBSSH2_SESSION* session, std::mutex& io,
                                  const CancelToken& cancel);
    void free_channel(LIBSSH2_CHANNEL* ch, std::mutex& io);
};
