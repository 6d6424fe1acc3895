#pragma once

#include <memory>
#include <mutex>
#include <string>
#include <core/types.hpp>
#include "transport.hpp"

// libssh2 forward declarations
typedef struct _LIBSSH2_SESSION LIBSSH2_SESSION;

class ShellChannel;

struct SessionTarget {
    std::string host;
    int port = 22;
    std::string user;
    std::string password;
    int timeout = 0;            // seconds for TCP connect + handshake, 0 = no bound
};

SessionTarget make_session_target(const ConnectionConfig& config);

// libssh2-backed SshSession. Non-blocking session; every libssh2 call is
// made under io_mutex_, which is shared with the shell channel.
class SessionManager : public SshSession {
public:
    explicit SessionManager(const SessionTarget& target);
    ~SessionManager() override;

    SSHResult connect() override;
    Result<std::shared_ptr<ShellStream>> open_shell(const std::string& term,
                                                    int cols, int rows) override;
    bool is_connected() override;
    void disconnect() override;

    SessionManager(const SessionManager&) = delete;
    SessionManager& operator=(const SessionManager&) = delete;

private:
    SessionTarget target_;
    LIBSSH2_SESSION* session_;
    std::shared_ptr<ShellChannel> channel_;
    int sock_;
    bool active_;
    std::string target_str_;
    std::shared_ptr<std::mutex> io_mutex_;

    SSHResult ssh_handshake();
    SSHResult ssh_userauth();
    void teardown(const char* reason);
};
