#include "connection.hpp"
#include "session.hpp"
#include <core/constants.hpp>
#include <libssh2.h>
#include <fmt/format.h>
#include <chrono>
#include <thread>

namespace {

void backoff() {
    std::this_thread::sleep_for(std::chrono::milliseconds(SSH_POLL_INTERVAL_MS));
}

SSHResult cancelled_result() {
    return SSHResult{-1, "", "Command cancelled"};
}

} // namespace

SSHConnection::SSHConnection(SessionManager& session, int timeout_secs)
    : session_(session), timeout_secs_(timeout_secs) {
}

bool SSHConnection::is_connected() const {
    return session_.is_active();
}

std::string SSHConnection::host() const {
    const auto& h = session_.target().host;
    return h.empty() ? DEFAULT_HOST : h;
}

LIBSSH2_CHANNEL* SSHConnection::open_channel(LIBSSH2_SESSION* session, std::mutex& io,
                                             const CancelToken& cancel) {
    auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(SSH_CHANNEL_OPEN_SECS);
    while (std::chrono::steady_clock::now() < deadline && !cancel.cancelled()) {
        LIBSSH2_CHANNEL* ch;
        {
            std::lock_guard<std::mutex> lock(io);
            ch = libssh2_channel_open_session(session);
            if (!ch && libssh2_session_last_errno(session) != LIBSSH2_ERROR_EAGAIN) {
                return nullptr;
            }
        }
        if (ch) return ch;
        backoff();
    }
    return nullptr;
}

void SSHConnection::free_channel(LIBSSH2_CHANNEL* ch, std::mutex& io) {
    int rc;
    do {
        {
            std::lock_guard<std::mutex> lock(io);
            rc = libssh2_channel_close(ch);
        }
        if (rc == LIBSSH2_ERROR_EAGAIN) backoff();
    } while (rc == LIBSSH2_ERROR_EAGAIN);
    std::lock_guard<std::mutex> lock(io);
    libssh2_channel_free(ch);
}

SSHResult SSHConnection::exec(const std::string& command, const CancelToken& cancel) {
    LIBSSH2_SESSION* session = session_.get_raw_session();
    if (!session_.is_active() || !session) {
        return SSHResult{-1, "", "No session available"};
    }
    if (cancel.cancelled()) return cancelled_result();

    auto io_ptr = session_.io_mutex();
    std::mutex& io = *io_ptr;

    LIBSSH2_CHANNEL* ch = open_channel(session, io, cancel);
    if (!ch) {
        if (cancel.cancelled()) return cancelled_result();
        return SSHResult{-1, "", "Failed to open exec channel"};
    }

    int rc;
    do {
        {
            std::lock_guard<std::mutex> lock(io);
            rc = libssh2_channel_exec(ch, command.c_str());
        }
        if (rc == LIBSSH2_ERROR_EAGAIN) backoff();
    } while (rc == LIBSSH2_ERROR_EAGAIN && !cancel.cancelled());
    if (rc != 0) {
        free_channel(ch, io);
        if (cancel.cancelled()) return cancelled_result();
        return SSHResult{-1, "", "Failed to exec command on channel"};
    }

    // Drain stdout and stderr until EOF. Partial output is dropped on timeout
    // or cancellation
    std::string out;
    std::string err;
    char buf[SSH_READ_BUF_SIZE];
    int effective_timeout = (timeout_secs_ > 0) ? timeout_secs_ : SSH_CMD_TIMEOUT_SECS;
    auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(effective_timeout);

    while (true) {
        if (cancel.cancelled()) {
            free_channel(ch, io);
            return cancelled_result();
        }
        if (std::chrono::steady_clock::now() >= deadline) {
            free_channel(ch, io);
            return SSHResult{-1, "", fmt::format("Command timed out after {}s", effective_timeout)};
        }

        ssize_t n_out;
        ssize_t n_err;
        bool eof;
        {
            std::lock_guard<std::mutex> lock(io);
            n_out = libssh2_channel_read(ch, buf, sizeof(buf));
            if (n_out > 0) out.append(buf, static_cast<size_t>(n_out));
            n_err = libssh2_channel_read_stderr(ch, buf, sizeof(buf));
            if (n_err > 0) err.append(buf, static_cast<size_t>(n_err));
            eof = libssh2_channel_eof(ch) != 0;
        }

        bool out_failed = n_out < 0 && n_out != LIBSSH2_ERROR_EAGAIN;
        bool err_failed = n_err < 0 && n_err != LIBSSH2_ERROR_EAGAIN;
        if (out_failed || err_failed) {
            free_channel(ch, io);
            return SSHResult{-1, "", "SSH channel read error"};
        }
        if (eof && n_out <= 0 && n_err <= 0) break;
        if (n_out <= 0 && n_err <= 0) backoff();
    }

    // Close before reading the exit status; the server sends it with the close
    do {
        {
            std::lock_guard<std::mutex> lock(io);
            rc = libssh2_channel_close(ch);
        }
        if (rc == LIBSSH2_ERROR_EAGAIN) backoff();
    } while (rc == LIBSSH2_ERROR_EAGAIN);

    if (rc == 0) {
        int wc;
        do {
            {
                std::lock_guard<std::mutex> lock(io);
                wc = libssh2_channel_wait_closed(ch);
            }
            if (wc == LIBSSH2_ERROR_EAGAIN) backoff();
        } while (wc == LIBSSH2_ERROR_EAGAIN);
    }

    int exit_status = -1;
    {
        std::lock_guard<std::mutex> lock(io);
        if (rc == 0) exit_status = libssh2_channel_get_exit_status(ch);
        libssh2_channel_free(ch);
    }

    return SSHResult{exit_status, out, err};
}
