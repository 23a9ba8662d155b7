#pragma once

#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <core/types.hpp>
#include <platform/socket_util.hpp>

// libssh2 forward declarations
typedef struct _LIBSSH2_SESSION LIBSSH2_SESSION;

struct SessionTarget {
    std::string host;
    std::string user;
    int port = 22;
    std::string password;
    int timeout = 30;
    std::optional<std::string> ssh_key_path;

    static SessionTarget from_config(const RemoteConfig& remote);
};

// Owns the TCP socket and the authenticated libssh2 session.
// Exec channels are opened per command by SSHConnection.
class SessionManager {
public:
    explicit SessionManager(const SessionTarget& target);
    ~SessionManager();

    SessionManager(const SessionManager&) = delete;
    SessionManager& operator=(const SessionManager&) = delete;

    SSHResult establish(StatusCallback callback = nullptr);
    void close();
    bool is_active() const;

    LIBSSH2_SESSION* get_raw_session() { return session_; }
    const SessionTarget& target() const { return target_; }
    std::shared_ptr<std::mutex> io_mutex() { return io_mutex_; }

private:
    SessionTarget target_;
    LIBSSH2_SESSION* session_;
    socket_t sock_;
    bool active_;
    std::shared_ptr<std::mutex> io_mutex_;

    SSHResult connect_socket(StatusCallback callback);
    SSHResult ssh_userauth(StatusCallback callback);
    void teardown(const char* reason);
};
