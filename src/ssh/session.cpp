#include "session.hpp"
#include "shell_channel.hpp"
#include <core/constants.hpp>
#include <core/log.hpp>
#include <platform/platform.hpp>
#include <platform/socket_util.hpp>
#include <libssh2.h>
#include <fmt/format.h>
#include <chrono>
#include <cstring>
#include <mutex>

// libssh2 keyboard-interactive callback. The password travels through the
// session abstract pointer.
static void kbd_callback(const char* /*name*/, int /*name_len*/,
                          const char* /*instruction*/, int /*instruction_len*/,
                          int num_prompts,
                          const LIBSSH2_USERAUTH_KBDINT_PROMPT* /*prompts*/,
                          LIBSSH2_USERAUTH_KBDINT_RESPONSE* responses,
                          void** abstract) {
    const std::string* password = static_cast<const std::string*>(*abstract);
    for (int i = 0; i < num_prompts; i++) {
        responses[i].text = strdup(password->c_str());
        responses[i].length = static_cast<unsigned int>(password->length());
    }
}

static SSHResult fail(const std::string& msg) {
    return SSHResult{-1, msg};
}

SessionTarget make_session_target(const ConnectionConfig& config) {
    SessionTarget target;
    target.host = config.host;
    target.port = config.port;
    target.user = config.username;
    target.password = config.password;
    target.timeout = config.connect_timeout;
    return target;
}

SessionManager::SessionManager(const SessionTarget& target)
    : target_(target), session_(nullptr), sock_(-1), active_(false),
      target_str_(fmt::format("{}@{}:{}", target.user, target.host, target.port)),
      io_mutex_(std::make_shared<std::mutex>()) {
}

SessionManager::~SessionManager() {
    disconnect();
}

SSHResult SessionManager::connect() {
    cecssh_log("Connecting to " + target_str_);

    static std::once_flag init_once;
    static int init_rc = 0;
    std::call_once(init_once, [] { init_rc = libssh2_init(0); });
    if (init_rc != 0) {
        return fail("Failed to initialize libssh2");
    }

    auto sock = platform::connect_tcp(target_.host, target_.port, target_.timeout * 1000);
    if (sock.is_err()) {
        return fail(sock.error);
    }
    sock_ = sock.value;

    cecssh_log("TCP connected, starting SSH handshake");

    auto hs = ssh_handshake();
    if (hs.failed()) {
        teardown("Handshake failed");
        return hs;
    }

    platform::enable_tcp_keepalive(sock_);
    libssh2_keepalive_config(session_, 1, SSH_KEEPALIVE_SECS);

    auto auth = ssh_userauth();
    if (auth.failed()) {
        teardown("Authentication failed");
        return auth;
    }

    active_ = true;
    cecssh_log("Connected to " + target_str_);
    return SSHResult{0, ""};
}

SSHResult SessionManager::ssh_handshake() {
    session_ = libssh2_session_init_ex(nullptr, nullptr, nullptr, nullptr);
    if (!session_) {
        return fail("Failed to create SSH session");
    }

    libssh2_session_set_blocking(session_, 0);

    auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(target_.timeout);
    int ret;
    while ((ret = libssh2_session_handshake(session_, sock_)) == LIBSSH2_ERROR_EAGAIN) {
        if (target_.timeout > 0 && std::chrono::steady_clock::now() >= deadline) {
            return fail(fmt::format("SSH handshake timed out after {}s", target_.timeout));
        }
        platform::poll_socket(sock_, POLLIN | POLLOUT, 100);
    }

    if (ret != 0) {
        return fail(fmt::format("SSH handshake failed ({})", ret));
    }
    return SSHResult{0, ""};
}

SSHResult SessionManager::ssh_userauth() {
    int ret;

    // Check what auth methods the server supports
    char* auth_list = nullptr;
    while ((auth_list = libssh2_userauth_list(session_, target_.user.c_str(),
                                              static_cast<unsigned int>(target_.user.length()))) == nullptr) {
        if (libssh2_session_last_errno(session_) != LIBSSH2_ERROR_EAGAIN) {
            break;
        }
        platform::sleep_ms(SSH_RETRY_SLEEP_MS);
    }

    std::string methods = auth_list ? auth_list : "";
    cecssh_log("Auth methods: " + methods);

    if (methods.empty() || methods.find("password") != std::string::npos) {
        while ((ret = libssh2_userauth_password(session_,
                target_.user.c_str(), target_.password.c_str())) == LIBSSH2_ERROR_EAGAIN) {
            platform::sleep_ms(SSH_RETRY_SLEEP_MS);
        }

        if (ret == 0) return SSHResult{0, ""};
        cecssh_log(fmt::format("Password auth failed ({})", ret));
    }

    // Servers that only prompt for the password interactively
    if (methods.find("keyboard-interactive") != std::string::npos) {
        *libssh2_session_abstract(session_) = &target_.password;

        while ((ret = libssh2_userauth_keyboard_interactive(session_,
                target_.user.c_str(), kbd_callback)) == LIBSSH2_ERROR_EAGAIN) {
            platform::sleep_ms(SSH_RETRY_SLEEP_MS);
        }

        *libssh2_session_abstract(session_) = nullptr;
        if (ret == 0) return SSHResult{0, ""};
        cecssh_log(fmt::format("Keyboard-interactive auth failed ({})", ret));
    }

    return fail("Authentication failed (check username/password)");
}

Result<std::shared_ptr<ShellStream>> SessionManager::open_shell(const std::string& term,
                                                                int cols, int rows) {
    using R = Result<std::shared_ptr<ShellStream>>;
    if (!active_ || !session_) {
        return R::Err("Not connected");
    }

    LIBSSH2_CHANNEL* ch = nullptr;
    while (true) {
        {
            std::lock_guard<std::mutex> lock(*io_mutex_);
            ch = libssh2_channel_open_session(session_);
            if (ch || libssh2_session_last_errno(session_) != LIBSSH2_ERROR_EAGAIN) break;
        }
        platform::sleep_ms(SSH_RETRY_SLEEP_MS);
    }
    if (!ch) {
        return R::Err("Failed to open SSH channel");
    }

    // From here on the channel is owned by ShellChannel and freed on any failure
    auto channel = std::make_shared<ShellChannel>(ch, io_mutex_, sock_);

    int ret;
    while (true) {
        {
            std::lock_guard<std::mutex> lock(*io_mutex_);
            ret = libssh2_channel_request_pty_ex(ch, term.c_str(),
                                                 static_cast<unsigned int>(term.size()),
                                                 nullptr, 0, cols, rows, 0, 0);
        }
        if (ret != LIBSSH2_ERROR_EAGAIN) break;
        platform::sleep_ms(SSH_RETRY_SLEEP_MS);
    }
    if (ret != 0) {
        return R::Err(fmt::format("Failed to request PTY ({})", ret));
    }

    while (true) {
        {
            std::lock_guard<std::mutex> lock(*io_mutex_);
            ret = libssh2_channel_shell(ch);
        }
        if (ret != LIBSSH2_ERROR_EAGAIN) break;
        platform::sleep_ms(SSH_RETRY_SLEEP_MS);
    }
    if (ret != 0) {
        return R::Err(fmt::format("Failed to request shell ({})", ret));
    }

    cecssh_log(fmt::format("Shell open: {} {}x{}", term, cols, rows));
    channel_ = channel;
    return R::Ok(channel);
}

bool SessionManager::is_connected() {
    std::lock_guard<std::mutex> lock(*io_mutex_);
    if (!active_ || !session_ || sock_ < 0) return false;

    // Keepalive only goes out when the configured interval has elapsed
    int seconds_to_next = 0;
    int ret = libssh2_keepalive_send(session_, &seconds_to_next);
    if (ret != 0 && ret != LIBSSH2_ERROR_EAGAIN) {
        cecssh_log(fmt::format("Keepalive failed ({}), marking session dead", ret));
        active_ = false;
        return false;
    }

    int revents = platform::poll_socket(sock_, POLLIN, 0);
    if (revents & (POLLERR | POLLHUP | POLLNVAL)) {
        cecssh_log("Socket hung up, marking session dead");
        active_ = false;
        return false;
    }

    return true;
}

void SessionManager::disconnect() {
    if (channel_) {
        channel_->close();
        channel_.reset();
    }
    teardown("Normal disconnection");
}

void SessionManager::teardown(const char* reason) {
    {
        std::lock_guard<std::mutex> lock(*io_mutex_);
        active_ = false;
        if (session_) {
            // Non-blocking: a disconnect that would block is simply dropped
            libssh2_session_disconnect(session_, reason);
            libssh2_session_free(session_);
            session_ = nullptr;
        }
    }

    if (sock_ >= 0) {
        platform::close_socket(sock_);
        sock_ = -1;
        cecssh_log(std::string("Session closed: ") + reason);
    }
}
