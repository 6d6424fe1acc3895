#include "shell_channel.hpp"
#include <core/constants.hpp>
#include <core/log.hpp>
#include <platform/platform.hpp>
#include <platform/socket_util.hpp>
#include <libssh2.h>
#include <fmt/format.h>
#include <algorithm>
#include <cstring>

ShellChannel::ShellChannel(LIBSSH2_CHANNEL* ch, std::shared_ptr<std::mutex> io_mutex, int sock)
    : ch_(ch), io_mutex_(std::move(io_mutex)), sock_(sock) {}

ShellChannel::~ShellChannel() {
    close();
}

void ShellChannel::close() {
    if (!io_mutex_) return;
    std::lock_guard<std::mutex> lock(*io_mutex_);
    if (!ch_) return;
    libssh2_channel_close(ch_);
    libssh2_channel_free(ch_);
    ch_ = nullptr;
    sock_ = -1;
}

int ShellChannel::read_once(char* buf, int len) {
    ssize_t n;
    {
        std::lock_guard<std::mutex> lock(*io_mutex_);
        if (!ch_) return -1;
        n = libssh2_channel_read(ch_, buf, static_cast<size_t>(len));
    }
    if (n > 0) return static_cast<int>(n);
    if (n == 0 || n == LIBSSH2_ERROR_EAGAIN) return 0;
    cecssh_log(fmt::format("ShellChannel: read error {}", static_cast<int>(n)));
    return -1;
}

int ShellChannel::read(char* buf, int len, int timeout_ms) {
    if (len <= 0) return 0;

    if (!pending_.empty()) {
        int n = static_cast<int>((std::min)(pending_.size(), static_cast<size_t>(len)));
        std::memcpy(buf, pending_.data(), n);
        pending_.erase(0, n);
        return n;
    }

    int n = read_once(buf, len);
    if (n != 0 || timeout_ms <= 0) return n;

    int sock;
    {
        std::lock_guard<std::mutex> lock(*io_mutex_);
        if (!ch_) return -1;
        sock = sock_;
    }

    // Poll socket without holding io_mutex_
    platform::poll_socket(sock, POLLIN, timeout_ms);
    return read_once(buf, len);
}

bool ShellChannel::data_available() {
    if (!pending_.empty()) return true;

    char buf[SSH_READ_BUF_SIZE];
    int n = read_once(buf, sizeof(buf));
    if (n > 0) {
        pending_.append(buf, n);
        return true;
    }
    return false;
}

bool ShellChannel::eof() {
    if (!pending_.empty()) return false;
    std::lock_guard<std::mutex> lock(*io_mutex_);
    if (!ch_) return true;
    return libssh2_channel_eof(ch_) != 0;
}

Result<void> ShellChannel::write(const std::string& data) {
    std::lock_guard<std::mutex> write_lock(write_mutex_);

    size_t total = data.size();
    size_t sent = 0;
    int write_retries = 0;
    while (sent < total) {
        ssize_t w;
        {
            std::lock_guard<std::mutex> lock(*io_mutex_);
            if (!ch_) return Result<void>::Err("Channel is closed");
            w = libssh2_channel_write(ch_, data.c_str() + sent, total - sent);
        }
        if (w == LIBSSH2_ERROR_EAGAIN) {
            if (++write_retries > 500) {
                return Result<void>::Err("Write stalled (EAGAIN for too long)");
            }
            platform::sleep_ms(SSH_RETRY_SLEEP_MS);
            continue;
        }
        if (w < 0) {
            return Result<void>::Err(fmt::format("Channel write error {}", static_cast<int>(w)));
        }
        write_retries = 0;
        sent += static_cast<size_t>(w);
    }
    return Result<void>::Ok();
}
