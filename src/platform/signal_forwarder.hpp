#pragma once

#include <atomic>
#include <memory>
#include <thread>
#include <signal.h>

class ShellStream;

namespace platform {

// RAII SIGINT forwarder.
//
// While alive, Ctrl+C no longer terminates the process: each SIGINT becomes
// one best-effort write of 0x03 to the shell channel. The signal handler only
// pokes a self-pipe; a small thread does the channel write, so no libssh2
// call ever runs in signal context. Write failures are logged and dropped.
//
// One forwarder per process at a time. Destruction restores the previous
// SIGINT disposition. The self-pipe is process-wide and stays open.
class SignalForwarder {
public:
    explicit SignalForwarder(std::shared_ptr<ShellStream> stream);
    ~SignalForwarder();

    // True if the handler is installed.
    bool active() const { return active_; }

    // Interrupts seen / successfully written to the channel.
    int attempts() const { return attempts_.load(); }
    int forwarded() const { return forwarded_.load(); }

    SignalForwarder(const SignalForwarder&) = delete;
    SignalForwarder& operator=(const SignalForwarder&) = delete;

private:
    std::shared_ptr<ShellStream> stream_;
    int read_fd_ = -1;
    bool active_ = false;
    std::atomic<bool> stop_{false};
    std::atomic<int> attempts_{0};
    std::atomic<int> forwarded_{0};
    struct sigaction old_sa_;
    std::thread thread_;

    void pump();
    void forward_interrupt();
};

} // namespace platform
