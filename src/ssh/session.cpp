#include "session.hpp"
#include <core/constants.hpp>
#include <platform/platform.hpp>
#include <platform/socket_util.hpp>
#include <libssh2.h>
#include <cstring>
#include <cerrno>
#include <chrono>
#include <thread>

// Data passed to keyboard-interactive callback via session abstract pointer
struct KbdAuthData {
    std::string password;
    StatusCallback callback;
};

// libssh2 keyboard-interactive callback: every prompt gets the password
static void kbd_callback(const char* /*name*/, int /*name_len*/,
                          const char* /*instruction*/, int /*instruction_len*/,
                          int num_prompts,
                          const LIBSSH2_USERAUTH_KBDINT_PROMPT* /*prompts*/,
                          LIBSSH2_USERAUTH_KBDINT_RESPONSE* responses,
                          void** abstract) {
    KbdAuthData* data = static_cast<KbdAuthData*>(*abstract);

    for (int i = 0; i < num_prompts; i++) {
        if (data->callback) data->callback("Sending password...");
        responses[i].text = strdup(data->password.c_str());
        responses[i].length = data->password.length();
    }
}

SessionManager::SessionManager(const SessionTarget& target)
    : target_(target), session_(nullptr), sock_(JOBRUNNER_INVALID_SOCKET), active_(false),
      io_mutex_(std::make_shared<std::mutex>()) {
}

SessionManager::~SessionManager() {
    close();
}

CommandResult SessionManager::establish(StatusCallback callback) {
    return establish_connection(callback);
}

void SessionManager::teardown(const char* reason) {
    if (session_) {
        libssh2_session_disconnect(session_, reason);
        libssh2_session_free(session_);
        session_ = nullptr;
    }
    platform::close_socket(sock_);
    sock_ = JOBRUNNER_INVALID_SOCKET;
}

CommandResult SessionManager::establish_connection(StatusCallback callback) {
    if (callback) {
        callback("Connecting to " + target_.host + "...");
    }

    int rc = libssh2_init(0);
    if (rc != 0) {
        return CommandResult{-1, "", "Failed to initialize libssh2"};
    }

    auto sock = platform::connect_tcp(target_.host,
                                      target_.port > 0 ? target_.port : SSH_DEFAULT_PORT,
                                      target_.timeout * 1000);
    if (sock.is_err()) {
        return CommandResult{-1, "", sock.error};
    }
    sock_ = sock.value;

    if (callback) callback("TCP connected, starting SSH handshake...");

    session_ = libssh2_session_init_ex(nullptr, nullptr, nullptr, nullptr);
    if (!session_) {
        teardown("no session");
        return CommandResult{-1, "", "Failed to create SSH session"};
    }

    libssh2_session_set_blocking(session_, 0);

    int ret;
    while ((ret = libssh2_session_handshake(session_, sock_)) == LIBSSH2_ERROR_EAGAIN) {
        platform::sleep_ms(100);
    }
    if (ret != 0) {
        teardown("Handshake failed");
        return CommandResult{-1, "", "SSH handshake failed"};
    }

    // Enable SSH keepalive (send every 30s)
    libssh2_keepalive_config(session_, 1, 30);

    if (callback) callback("SSH handshake complete, authenticating...");

    auto auth_result = ssh_userauth(callback);
    if (auth_result.failed()) {
        teardown("Authentication failed");
        return auth_result;
    }

    active_ = true;
    target_str_ = target_.user + "@" + target_.host;

    if (callback) {
        callback("Connected to " + target_.host);
    }

    return CommandResult{0, "", ""};
}

CommandResult SessionManager::ssh_userauth(StatusCallback callback) {
    int ret;

    // Check what auth methods the server supports
    char* auth_list = nullptr;
    while ((auth_list = libssh2_userauth_list(session_, target_.user.c_str(),
                                              static_cast<unsigned int>(target_.user.length()))) == nullptr) {
        if (libssh2_session_last_errno(session_) != LIBSSH2_ERROR_EAGAIN) {
            break;
        }
        platform::sleep_ms(100);
    }

    std::string methods = auth_list ? auth_list : "";
    if (callback && !methods.empty()) {
        callback("Auth methods: " + methods);
    }

    // Public key first: batch submission runs unattended
    if (target_.ssh_key_path && methods.find("publickey") != std::string::npos) {
        if (callback) callback("Using public key " + *target_.ssh_key_path + "...");

        while ((ret = libssh2_userauth_publickey_fromfile_ex(
                    session_, target_.user.c_str(),
                    static_cast<unsigned int>(target_.user.length()),
                    nullptr, target_.ssh_key_path->c_str(),
                    target_.password.empty() ? nullptr : target_.password.c_str()))
               == LIBSSH2_ERROR_EAGAIN) {
            platform::sleep_ms(100);
        }
        if (ret == 0) {
            if (callback) callback("Authentication successful");
            return CommandResult{0, "", ""};
        }
        if (callback) callback("Public key rejected, trying password...");
    }

    if (!target_.password.empty() && methods.find("keyboard-interactive") != std::string::npos) {
        KbdAuthData kbd_data;
        kbd_data.password = target_.password;
        kbd_data.callback = callback;

        *libssh2_session_abstract(session_) = &kbd_data;

        while ((ret = libssh2_userauth_keyboard_interactive(session_,
                target_.user.c_str(), kbd_callback)) == LIBSSH2_ERROR_EAGAIN) {
            platform::sleep_ms(100);
        }
        *libssh2_session_abstract(session_) = nullptr;

        if (ret == 0) {
            if (callback) callback("Authentication successful");
            return CommandResult{0, "", ""};
        }
    }

    if (!target_.password.empty() &&
        (methods.empty() || methods.find("password") != std::string::npos)) {
        while ((ret = libssh2_userauth_password(session_,
                target_.user.c_str(), target_.password.c_str())) == LIBSSH2_ERROR_EAGAIN) {
            platform::sleep_ms(100);
        }

        if (ret == 0) {
            if (callback) callback("Authentication successful");
            return CommandResult{0, "", ""};
        }
    }

    return CommandResult{-1, "", "Authentication failed (check ssh_key_path/password)"};
}

CommandResult SessionManager::exec(const std::string& command, int timeout_secs) {
    if (!session_ || !active_) {
        return CommandResult{-1, "", "No session available"};
    }

    LIBSSH2_CHANNEL* exec_ch = nullptr;
    auto open_deadline = std::chrono::steady_clock::now() + std::chrono::seconds(30);
    while (std::chrono::steady_clock::now() < open_deadline) {
        {
            std::lock_guard<std::mutex> lock(*io_mutex_);
            exec_ch = libssh2_channel_open_session(session_);
            if (!exec_ch && libssh2_session_last_errno(session_) != LIBSSH2_ERROR_EAGAIN) {
                return CommandResult{-1, "", "Failed to open exec channel"};
            }
        }
        if (exec_ch) break;
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
    }
    if (!exec_ch) {
        return CommandResult{-1, "", "Timed out opening exec channel"};
    }

    int rc = LIBSSH2_ERROR_EAGAIN;
    auto exec_deadline = std::chrono::steady_clock::now() + std::chrono::seconds(30);
    while (std::chrono::steady_clock::now() < exec_deadline) {
        {
            std::lock_guard<std::mutex> lock(*io_mutex_);
            rc = libssh2_channel_exec(exec_ch, command.c_str());
        }
        if (rc != LIBSSH2_ERROR_EAGAIN) break;
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
    }
    if (rc != 0) {
        std::lock_guard<std::mutex> lock(*io_mutex_);
        libssh2_channel_free(exec_ch);
        return CommandResult{-1, "", "Failed to exec command on channel"};
    }

    // Read stdout and stderr until the channel reports EOF
    std::string output;
    std::string stderr_data;
    char buf[SSH_READ_BUF_SIZE];
    int effective_timeout = (timeout_secs > 0) ? timeout_secs : SSH_CMD_TIMEOUT_SECS;
    auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(effective_timeout);
    bool timed_out = true;

    while (std::chrono::steady_clock::now() < deadline) {
        ssize_t n;
        ssize_t e;
        {
            std::lock_guard<std::mutex> lock(*io_mutex_);
            n = libssh2_channel_read(exec_ch, buf, sizeof(buf));
            if (n > 0) output.append(buf, static_cast<size_t>(n));
            e = libssh2_channel_read_stderr(exec_ch, buf, sizeof(buf));
            if (e > 0) stderr_data.append(buf, static_cast<size_t>(e));
        }
        if (n > 0 || e > 0) continue;
        if ((n < 0 && n != LIBSSH2_ERROR_EAGAIN) || (e < 0 && e != LIBSSH2_ERROR_EAGAIN)) {
            timed_out = false;
            break;  // read error
        }

        bool eof;
        {
            std::lock_guard<std::mutex> lock(*io_mutex_);
            eof = libssh2_channel_eof(exec_ch);
        }
        if (eof) {
            timed_out = false;
            break;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
    }

    int exit_status = -1;
    do {
        std::lock_guard<std::mutex> lock(*io_mutex_);
        rc = libssh2_channel_close(exec_ch);
    } while (rc == LIBSSH2_ERROR_EAGAIN &&
             (std::this_thread::sleep_for(std::chrono::milliseconds(10)), true));
    if (rc == 0) {
        std::lock_guard<std::mutex> lock(*io_mutex_);
        exit_status = libssh2_channel_get_exit_status(exec_ch);
    }

    {
        std::lock_guard<std::mutex> lock(*io_mutex_);
        libssh2_channel_free(exec_ch);
    }

    if (timed_out) {
        return CommandResult{-1, output,
                             "Command timed out after " + std::to_string(effective_timeout) + "s"};
    }
    return CommandResult{exit_status, output, stderr_data};
}

void SessionManager::close() {
    // Mark inactive first so concurrent operations bail out early
    active_ = false;

    if (session_) {
        {
            std::lock_guard<std::mutex> lock(*io_mutex_);
            libssh2_session_disconnect(session_, "Normal disconnection");
        }
        {
            std::lock_guard<std::mutex> lock(*io_mutex_);
            libssh2_session_free(session_);
        }
        session_ = nullptr;
    }

    if (sock_ >= 0) {
        platform::close_socket(sock_);
        sock_ = JOBRUNNER_INVALID_SOCKET;
    }
}

bool SessionManager::is_active() const {
    return active_;
}

bool SessionManager::check_alive() {
    std::lock_guard<std::mutex> lock(*io_mutex_);
    if (!active_ || !session_ || sock_ < 0) return false;

    int seconds_to_next = 0;
    int ret = libssh2_keepalive_send(session_, &seconds_to_next);
    if (ret != 0 && ret != LIBSSH2_ERROR_EAGAIN) {
        active_ = false;
        return false;
    }

    int revents = platform::poll_socket(sock_, POLLIN, 0);
    if (revents & (POLLERR | POLLHUP | POLLNVAL)) {
        active_ = false;
        return false;
    }

    return true;
}
