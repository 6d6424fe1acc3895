#pragma once

#include <algorithm>
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstring>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>
#include <session/orchestrator.hpp>
#include <ssh/transport.hpp>

// In-memory PTY channel. Tests push "remote" bytes in and inspect writes.
class FakeShellStream : public ShellStream {
public:
    using WriteHook = std::function<void(FakeShellStream&, const std::string&)>;

    void push(const std::string& data) {
        {
            std::lock_guard<std::mutex> lock(m_);
            inbound_ += data;
        }
        cv_.notify_all();
    }

    void set_eof() {
        {
            std::lock_guard<std::mutex> lock(m_);
            eof_ = true;
        }
        cv_.notify_all();
    }

    void close() {
        {
            std::lock_guard<std::mutex> lock(m_);
            closed_ = true;
        }
        cv_.notify_all();
    }

    void set_fail_writes(bool fail) {
        std::lock_guard<std::mutex> lock(m_);
        fail_writes_ = fail;
    }

    // read() ignores its timeout and hangs until close()
    void set_block_reads(bool block) {
        std::lock_guard<std::mutex> lock(m_);
        block_reads_ = block;
    }

    // Runs after a successful write, outside the lock
    void on_write(WriteHook hook) {
        std::lock_guard<std::mutex> lock(m_);
        hook_ = std::move(hook);
    }

    std::vector<std::string> writes() const {
        std::lock_guard<std::mutex> lock(m_);
        return writes_;
    }

    bool wrote(const std::string& data) const {
        std::lock_guard<std::mutex> lock(m_);
        return std::find(writes_.begin(), writes_.end(), data) != writes_.end();
    }

    size_t pending() const {
        std::lock_guard<std::mutex> lock(m_);
        return inbound_.size();
    }

    int reads() const { return reads_.load(); }
    int max_read_len() const { return max_read_len_.load(); }

    int read(char* buf, int len, int timeout_ms) override {
        reads_++;
        if (len > max_read_len_.load()) max_read_len_ = len;

        std::unique_lock<std::mutex> lock(m_);
        if (block_reads_) {
            cv_.wait(lock, [this] { return closed_; });
            return -1;
        }
        cv_.wait_for(lock, std::chrono::milliseconds(timeout_ms),
                     [this] { return closed_ || eof_ || !inbound_.empty(); });
        if (closed_) return -1;
        if (inbound_.empty()) return 0;

        int n = static_cast<int>((std::min)(inbound_.size(), static_cast<size_t>(len)));
        std::memcpy(buf, inbound_.data(), n);
        inbound_.erase(0, n);
        return n;
    }

    bool data_available() override {
        std::lock_guard<std::mutex> lock(m_);
        return !closed_ && !inbound_.empty();
    }

    bool eof() override {
        std::lock_guard<std::mutex> lock(m_);
        return closed_ || (eof_ && inbound_.empty());
    }

    Result<void> write(const std::string& data) override {
        WriteHook hook;
        {
            std::lock_guard<std::mutex> lock(m_);
            if (closed_) return Result<void>::Err("channel closed");
            if (fail_writes_) return Result<void>::Err("broken pipe");
            writes_.push_back(data);
            hook = hook_;
        }
        if (hook) hook(*this, data);
        return Result<void>::Ok();
    }

private:
    mutable std::mutex m_;
    std::condition_variable cv_;
    std::string inbound_;
    std::vector<std::string> writes_;
    bool eof_ = false;
    bool closed_ = false;
    bool fail_writes_ = false;
    bool block_reads_ = false;
    WriteHook hook_;
    std::atomic<int> reads_{0};
    std::atomic<int> max_read_len_{0};
};

class FakeSshSession : public SshSession {
public:
    explicit FakeSshSession(std::shared_ptr<FakeShellStream> stream)
        : stream_(std::move(stream)) {}

    SSHResult connect() override {
        connect_calls++;
        if (connect_result.failed()) return connect_result;
        connected = true;
        return connect_result;
    }

    Result<std::shared_ptr<ShellStream>> open_shell(const std::string& t, int c, int r) override {
        open_calls++;
        term = t;
        cols = c;
        rows = r;
        if (shell_fails) {
            return Result<std::shared_ptr<ShellStream>>::Err("pty request refused");
        }
        return Result<std::shared_ptr<ShellStream>>::Ok(stream_);
    }

    bool is_connected() override { return connected.load(); }

    void disconnect() override {
        disconnect_calls++;
        connected = false;
        stream_->close();
    }

    // Simulate the network going away underneath the session
    void drop() { connected = false; }

    SSHResult connect_result{0, ""};
    bool shell_fails = false;
    std::atomic<bool> connected{false};
    std::atomic<int> connect_calls{0};
    std::atomic<int> open_calls{0};
    std::atomic<int> disconnect_calls{0};
    std::string term;
    int cols = 0;
    int rows = 0;

private:
    std::shared_ptr<FakeShellStream> stream_;
};

// Reference timings scaled down so tests run in milliseconds
inline OrchestratorOptions fast_options() {
    OrchestratorOptions o;
    o.settle_ms = 10;
    o.drain_poll_ms = 10;
    o.liveness_poll_ms = 20;
    o.grace_ms = 200;
    o.read_poll_ms = 10;
    o.forward_interrupts = false;
    return o;
}

// Thread-safe output capture for OutputSink
struct CapturedOutput {
    std::mutex m;
    std::string text;

    OutputSink sink() {
        return [this](const char* data, size_t len) {
            std::lock_guard<std::mutex> lock(m);
            text.append(data, len);
        };
    }

    std::string get() {
        std::lock_guard<std::mutex> lock(m);
        return text;
    }
};

// Poll `cond` until true or timeout. Returns the final value.
inline bool wait_until(const std::function<bool()>& cond, int timeout_ms = 2000) {
    auto deadline = std::chrono::steady_clock::now() + std::chrono::milliseconds(timeout_ms);
    while (std::chrono::steady_clock::now() < deadline) {
        if (cond()) return true;
        std::this_thread::sleep_for(std::chrono::milliseconds(5));
    }
    return cond();
}
