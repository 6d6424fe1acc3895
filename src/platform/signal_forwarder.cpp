#include "signal_forwarder.hpp"
#include <core/constants.hpp>
#include <core/log.hpp>
#include <ssh/transport.hpp>
#include <fmt/format.h>
#include <cerrno>
#include <cstring>
#include <mutex>
#include <fcntl.h>
#include <poll.h>
#include <unistd.h>

namespace platform {

static volatile sig_atomic_t g_sigint_fd = -1;

// Self-pipe shared by every forwarder. Created once and never closed, so a
// handler still running on another thread can't hit a recycled fd.
static int g_pipe[2] = {-1, -1};

static void sigint_handler(int) {
    int saved_errno = errno;
    int fd = g_sigint_fd;
    if (fd >= 0) {
        char b = 1;
        // Pipe full means an interrupt is already pending
        ssize_t r = ::write(fd, &b, 1);
        (void)r;
    }
    errno = saved_errno;
}

static void set_pipe_flags(int fd) {
    int flags = fcntl(fd, F_GETFL, 0);
    fcntl(fd, F_SETFL, flags | O_NONBLOCK);
    fcntl(fd, F_SETFD, FD_CLOEXEC);
}

static bool open_signal_pipe() {
    static std::once_flag once;
    static bool ok = false;
    std::call_once(once, [] {
        if (::pipe(g_pipe) != 0) {
            cecssh_log(fmt::format("SignalForwarder: pipe() failed: {}", std::strerror(errno)));
            g_pipe[0] = g_pipe[1] = -1;
            return;
        }
        set_pipe_flags(g_pipe[0]);
        set_pipe_flags(g_pipe[1]);
        ok = true;
    });
    return ok;
}

// Drop bytes left by a signal that landed after the previous forwarder
// restored its handler.
static void discard_pending() {
    char buf[64];
    while (::read(g_pipe[0], buf, sizeof(buf)) > 0) {
    }
}

SignalForwarder::SignalForwarder(std::shared_ptr<ShellStream> stream)
    : stream_(std::move(stream)) {
    if (!open_signal_pipe()) {
        cecssh_log("SignalForwarder: no signal pipe, Ctrl+C stays local");
        return;
    }
    discard_pending();
    read_fd_ = g_pipe[0];
    g_sigint_fd = g_pipe[1];

    struct sigaction sa;
    std::memset(&sa, 0, sizeof(sa));
    sa.sa_handler = sigint_handler;
    sigemptyset(&sa.sa_mask);
    sa.sa_flags = SA_RESTART;
    if (sigaction(SIGINT, &sa, &old_sa_) != 0) {
        cecssh_log(fmt::format("SignalForwarder: sigaction failed: {}", std::strerror(errno)));
        g_sigint_fd = -1;
        return;
    }

    active_ = true;
    thread_ = std::thread(&SignalForwarder::pump, this);
}

SignalForwarder::~SignalForwarder() {
    if (!active_) return;

    sigaction(SIGINT, &old_sa_, nullptr);
    g_sigint_fd = -1;

    stop_ = true;
    if (thread_.joinable()) thread_.join();
}

void SignalForwarder::pump() {
    char buf[64];
    while (!stop_.load()) {
        struct pollfd pfd = {read_fd_, POLLIN, 0};
        int ret = poll(&pfd, 1, SIGNAL_POLL_MS);
        if (ret <= 0 || !(pfd.revents & POLLIN)) continue;

        ssize_t n;
        while ((n = ::read(read_fd_, buf, sizeof(buf))) > 0) {
            for (ssize_t i = 0; i < n; i++) {
                forward_interrupt();
            }
        }
    }
}

void SignalForwarder::forward_interrupt() {
    attempts_++;
    auto r = stream_->write(std::string(1, CTRL_C));
    if (r.is_err()) {
        cecssh_log_ignored("Forwarding Ctrl+C", r.error);
        return;
    }
    forwarded_++;
    cecssh_log("Forwarded Ctrl+C to remote");
}

} // namespace platform
