#pragma once

#include <memory>
#include <mutex>
#include <string>
#include <core/types.hpp>
#include "transport.hpp"

// libssh2 forward declaration
typedef struct _LIBSSH2_CHANNEL LIBSSH2_CHANNEL;

// RAII handle for the PTY shell channel.
// Owns the channel and closes+frees on close() or destruction.
// All libssh2 calls are protected by brief io_mutex_ holds; write_mutex_
// keeps whole writes (command line vs. Ctrl+C) from interleaving.
class ShellChannel : public ShellStream {
public:
    ShellChannel(LIBSSH2_CHANNEL* ch, std::shared_ptr<std::mutex> io_mutex, int sock);
    ~ShellChannel() override;

    int read(char* buf, int len, int timeout_ms) override;
    bool data_available() override;
    bool eof() override;
    Result<void> write(const std::string& data) override;

    // Close and free the channel. Later calls fail fast. Called by the
    // session before it frees itself.
    void close();

    // Non-copyable, non-movable (shared between threads by shared_ptr)
    ShellChannel(const ShellChannel&) = delete;
    ShellChannel& operator=(const ShellChannel&) = delete;

private:
    LIBSSH2_CHANNEL* ch_;
    std::shared_ptr<std::mutex> io_mutex_;
    int sock_;
    std::mutex write_mutex_;
    std::string pending_;     // bytes peeked by data_available(); reader-only

    // One non-blocking libssh2 read. Returns bytes, 0 for EAGAIN, <0 on error.
    int read_once(char* buf, int len);
};
