#pragma once

#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <core/types.hpp>

// libssh2 forward declarations
typedef struct _LIBSSH2_SESSION LIBSSH2_SESSION;
typedef struct _LIBSSH2_CHANNEL LIBSSH2_CHANNEL;

struct SessionTarget {
    std::string host;
    std::string user;
    std::string password;
    int port = 22;
    int timeout = 30;
    std::optional<std::string> ssh_key_path;
};

// One authenticated SSH session. Every exec() opens its own exec channel
// (no PTY), so stdout, stderr and the exit status come back unmangled.
class SessionManager {
public:
    explicit SessionManager(const SessionTarget& target);
    ~SessionManager();

    SessionManager(const SessionManager&) = delete;
    SessionManager& operator=(const SessionManager&) = delete;

    CommandResult establish(StatusCallback callback = nullptr);
    void close();
    bool is_active() const;
    bool check_alive();

    // Run a command on a fresh exec channel. timeout_secs = 0 uses the default.
    CommandResult exec(const std::string& command, int timeout_secs = 0);

    const std::string& get_target() const { return target_str_; }

private:
    SessionTarget target_;
    LIBSSH2_SESSION* session_;
    int sock_;
    bool active_;
    std::string target_str_;
    std::shared_ptr<std::mutex> io_mutex_;

    CommandResult establish_connection(StatusCallback callback);
    CommandResult ssh_userauth(StatusCallback callback);
    void teardown(const char* reason);
};
