#include "session.hpp"
#include <core/constants.hpp>
#include <platform/platform.hpp>
#include <libssh2.h>
#include <fmt/format.h>
#include <sys/socket.h>
#include <netinet/in.h>
#include <netdb.h>
#include <cstring>
#include <cerrno>

SessionTarget SessionTarget::from_config(const RemoteConfig& remote) {
    SessionTarget t;
    t.host = remote.host;
    t.user = remote.user;
    t.port = remote.port;
    t.password = remote.password.value_or("");
    t.timeout = remote.timeout;
    t.ssh_key_path = remote.ssh_key_path;
    return t;
}

// Password handed to the keyboard-interactive callback via the session abstract pointer
struct KbdAuthData {
    std::string password;
};

// libssh2 keyboard-interactive callback: answer every prompt with the password
static void kbd_callback(const char* /*name*/, int /*name_len*/,
                          const char* /*instruction*/, int /*instruction_len*/,
                          int num_prompts,
                          const LIBSSH2_USERAUTH_KBDINT_PROMPT* /*prompts*/,
                          LIBSSH2_USERAUTH_KBDINT_RESPONSE* responses,
                          void** abstract) {
    auto* data = static_cast<KbdAuthData*>(*abstract);
    for (int i = 0; i < num_prompts; i++) {
        responses[i].text = strdup(data->password.c_str());
        responses[i].length = static_cast<unsigned int>(data->password.length());
    }
}

SessionManager::SessionManager(const SessionTarget& target)
    : target_(target), session_(nullptr), sock_(PORTSCOPE_INVALID_SOCKET), active_(false),
      io_mutex_(std::make_shared<std::mutex>()) {
}

SessionManager::~SessionManager() {
    close();
}

SSHResult SessionManager::connect_socket(StatusCallback callback) {
    if (callback) {
        callback(fmt::format("Connecting to {}:{}...", target_.host, target_.port));
    }

    struct addrinfo hints;
    std::memset(&hints, 0, sizeof(hints));
    hints.ai_family = AF_UNSPEC;
    hints.ai_socktype = SOCK_STREAM;

    struct addrinfo* res = nullptr;
    std::string port_str = std::to_string(target_.port);
    if (getaddrinfo(target_.host.c_str(), port_str.c_str(), &hints, &res) != 0 || !res) {
        return SSHResult{-1, "", "Failed to resolve host: " + target_.host};
    }

    sock_ = socket(res->ai_family, res->ai_socktype, res->ai_protocol);
    if (sock_ == PORTSCOPE_INVALID_SOCKET) {
        freeaddrinfo(res);
        return SSHResult{-1, "", "Failed to create socket"};
    }

    // Non-blocking for libssh2
    platform::set_nonblocking(sock_);

    int ret = connect(sock_, res->ai_addr, static_cast<socklen_t>(res->ai_addrlen));
    freeaddrinfo(res);
    if (ret < 0 && errno != EINPROGRESS) {
        std::string err = strerror(errno);
        platform::close_socket(sock_);
        sock_ = PORTSCOPE_INVALID_SOCKET;
        return SSHResult{-1, "", "Failed to connect: " + err};
    }

    // Wait for non-blocking connect to complete
    if (ret < 0) {
        int err = platform::wait_connected(sock_, target_.timeout * 1000);
        if (err != 0) {
            platform::close_socket(sock_);
            sock_ = PORTSCOPE_INVALID_SOCKET;
            if (err == ETIMEDOUT) {
                return SSHResult{-1, "", "Connection timed out: " + target_.host};
            }
            return SSHResult{-1, "", "Connection failed: " + std::string(strerror(err))};
        }
    }

    // TCP keepalive so a silent remote doesn't hang discovery forever
    int tcp_keepalive = 1;
    setsockopt(sock_, SOL_SOCKET, SO_KEEPALIVE,
               &tcp_keepalive, sizeof(tcp_keepalive));

    return SSHResult{0, "", ""};
}

SSHResult SessionManager::establish(StatusCallback callback) {
    if (active_) return SSHResult{0, "", ""};

    if (libssh2_init(0) != 0) {
        return SSHResult{-1, "", "Failed to initialize libssh2"};
    }

    auto sock_result = connect_socket(callback);
    if (sock_result.failed()) return sock_result;

    if (callback) callback("TCP connected, starting SSH handshake...");

    session_ = libssh2_session_init_ex(nullptr, nullptr, nullptr, nullptr);
    if (!session_) {
        teardown("Session init failed");
        return SSHResult{-1, "", "Failed to create SSH session"};
    }

    libssh2_session_set_blocking(session_, 0);

    int ret;
    while ((ret = libssh2_session_handshake(session_, sock_)) == LIBSSH2_ERROR_EAGAIN) {
        platform::sleep_ms(100);
    }
    if (ret != 0) {
        teardown("Handshake failed");
        return SSHResult{-1, "", "SSH handshake failed"};
    }

    // SSH keepalive every 30s
    libssh2_keepalive_config(session_, 1, 30);

    if (callback) callback("SSH handshake complete, authenticating...");

    auto auth_result = ssh_userauth(callback);
    if (auth_result.failed()) {
        teardown("Authentication failed");
        return auth_result;
    }

    active_ = true;
    if (callback) callback(fmt::format("Connected to {}@{}", target_.user, target_.host));
    return SSHResult{0, "", ""};
}

SSHResult SessionManager::ssh_userauth(StatusCallback callback) {
    int ret;

    char* auth_list = nullptr;
    while ((auth_list = libssh2_userauth_list(session_, target_.user.c_str(),
                                              static_cast<unsigned int>(target_.user.length()))) == nullptr) {
        if (libssh2_session_last_errno(session_) != LIBSSH2_ERROR_EAGAIN) {
            break;
        }
        platform::sleep_ms(100);
    }
    // A NULL list with no error means "none" auth already succeeded
    if (!auth_list && libssh2_userauth_authenticated(session_)) {
        return SSHResult{0, "", ""};
    }

    std::string methods = auth_list ? auth_list : "";
    if (callback && !methods.empty()) {
        callback("Auth methods: " + methods);
    }

    if (target_.ssh_key_path && methods.find("publickey") != std::string::npos) {
        if (callback) callback("Using public key " + *target_.ssh_key_path);
        std::string pub = *target_.ssh_key_path + ".pub";
        const char* passphrase = target_.password.empty() ? nullptr : target_.password.c_str();
        while ((ret = libssh2_userauth_publickey_fromfile(session_, target_.user.c_str(),
                pub.c_str(), target_.ssh_key_path->c_str(), passphrase)) == LIBSSH2_ERROR_EAGAIN) {
            platform::sleep_ms(100);
        }
        if (ret == 0) {
            if (callback) callback("Authentication successful");
            return SSHResult{0, "", ""};
        }
        if (callback) callback("Public key rejected, trying password...");
    }

    if (target_.password.empty()) {
        return SSHResult{-1, "", "Authentication failed (no usable key and no password)"};
    }

    if (methods.find("keyboard-interactive") != std::string::npos) {
        if (callback) callback("Using keyboard-interactive auth...");

        KbdAuthData kbd_data{target_.password};
        *libssh2_session_abstract(session_) = &kbd_data;

        while ((ret = libssh2_userauth_keyboard_interactive(session_,
                target_.user.c_str(), kbd_callback)) == LIBSSH2_ERROR_EAGAIN) {
            platform::sleep_ms(100);
        }
        *libssh2_session_abstract(session_) = nullptr;

        if (ret == 0) {
            if (callback) callback("Authentication successful");
            return SSHResult{0, "", ""};
        }
        if (callback) callback("Keyboard-interactive failed, trying password...");
    }

    if (methods.empty() || methods.find("password") != std::string::npos) {
        if (callback) callback("Using password auth...");

        while ((ret = libssh2_userauth_password(session_,
                target_.user.c_str(), target_.password.c_str())) == LIBSSH2_ERROR_EAGAIN) {
            platform::sleep_ms(100);
        }
        if (ret == 0) {
            if (callback) callback("Authentication successful");
            return SSHResult{0, "", ""};
        }
    }

    return SSHResult{-1, "", "Authentication failed (check user, key or password)"};
}

void SessionManager::teardown(const char* reason) {
    if (session_) {
        libssh2_session_disconnect(session_, reason);
        libssh2_session_free(session_);
        session_ = nullptr;
    }
    if (sock_ != PORTSCOPE_INVALID_SOCKET) {
        platform::close_socket(sock_);
        sock_ = PORTSCOPE_INVALID_SOCKET;
    }
}

void SessionManager::close() {
    active_ = false;
    std::lock_guard<std::mutex> lock(*io_mutex_);
    teardown("Normal disconnection");
}

bool SessionManager::is_active() const {
    return active_;
}
