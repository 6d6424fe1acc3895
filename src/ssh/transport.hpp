#pragma once

#include <memory>
#include <string>
#include <core/types.hpp>

// Byte stream over an interactive PTY channel.
//
// Roles are disjoint: one reader at a time (drain, then the output reader),
// writers serialized by the implementation. After the owning session
// disconnects every call fails fast instead of touching freed handles.
class ShellStream {
public:
    virtual ~ShellStream() = default;

    // >0: bytes read. 0: nothing arrived within timeout_ms (check eof()).
    // <0: I/O error or channel closed.
    virtual int read(char* buf, int len, int timeout_ms) = 0;

    // Non-blocking: is there at least one byte ready to read?
    virtual bool data_available() = 0;

    // Remote side sent EOF and everything buffered has been consumed.
    virtual bool eof() = 0;

    // Write all of `data` before returning.
    virtual Result<void> write(const std::string& data) = 0;
};

// The SSH transport: connect + authenticate, open one PTY shell, report
// liveness, tear down. No retries at this layer.
class SshSession {
public:
    virtual ~SshSession() = default;

    virtual SSHResult connect() = 0;
    virtual Result<std::shared_ptr<ShellStream>> open_shell(const std::string& term,
                                                            int cols, int rows) = 0;
    virtual bool is_connected() = 0;

    // Idempotent. Errors are swallowed.
    virtual void disconnect() = 0;
};
