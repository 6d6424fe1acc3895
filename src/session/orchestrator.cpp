#include "orchestrator.hpp"
#include "cancellation.hpp"
#include <core/log.hpp>
#include <core/shell_quote.hpp>
#include <platform/platform.hpp>
#include <platform/signal_forwarder.hpp>
#include <fmt/format.h>
#include <chrono>
#include <future>
#include <mutex>
#include <thread>
#include <cerrno>
#include <cstring>
#include <unistd.h>

const char* to_string(SessionState state) {
    switch (state) {
        case SessionState::Disconnected: return "Disconnected";
        case SessionState::Connected:    return "Connected";
        case SessionState::ShellOpen:    return "ShellOpen";
        case SessionState::Draining:     return "Draining";
        case SessionState::Executing:    return "Executing";
        case SessionState::ShuttingDown: return "ShuttingDown";
        case SessionState::Closed:       return "Closed";
    }
    return "?";
}

OutputSink stdout_sink() {
    return [](const char* data, size_t len) {
        size_t off = 0;
        while (off < len) {
            ssize_t w = ::write(STDOUT_FILENO, data + off, len - off);
            if (w < 0) {
                if (errno == EINTR) continue;
                cecssh_log(fmt::format("stdout write failed: {}", std::strerror(errno)));
                return;
            }
            off += static_cast<size_t>(w);
        }
    };
}

// ── Banner drain ──────────────────────────────────────────────

int drain_banner(ShellStream& stream, const OrchestratorOptions& opts) {
    platform::sleep_ms(opts.settle_ms);

    std::vector<char> buf(static_cast<size_t>(opts.drain_chunk > 0 ? opts.drain_chunk : SSH_DRAIN_BUF_SIZE));
    int discarded = 0;
    int empty_polls = 0;

    for (;;) {
        if (stream.data_available()) {
            int n = stream.read(buf.data(), static_cast<int>(buf.size()), 0);
            if (n <= 0) {
                // Drain is best-effort; an error here must not block dispatch
                if (n < 0) cecssh_log("Drain: read error, continuing");
                break;
            }
            discarded += n;
            empty_polls = 0;
        } else {
            if (empty_polls >= opts.drain_empty_polls) break;
            empty_polls++;
            platform::sleep_ms(opts.drain_poll_ms);
        }
    }

    cecssh_log(fmt::format("Drain: discarded {} banner bytes", discarded));
    return discarded;
}

// ── Background loops ──────────────────────────────────────────

namespace {

// Shared by the control flow and both loops. Held by shared_ptr so a reader
// that outlives the grace period never touches freed state.
struct RunSignals {
    CancellationToken cancel;
    std::once_flag first_once;
    std::promise<FinishReason> first;
    std::promise<void> reader_done;

    void finish(FinishReason why) {
        std::call_once(first_once, [&] { first.set_value(why); });
    }
};

void reader_loop(std::shared_ptr<ShellStream> stream,
                 std::shared_ptr<RunSignals> signals,
                 OutputSink sink, int read_poll_ms) {
    std::vector<char> buf(SSH_READ_BUF_SIZE);
    try {
        while (!signals->cancel.is_cancelled()) {
            int n = stream->read(buf.data(), static_cast<int>(buf.size()), read_poll_ms);
            if (n > 0) {
                sink(buf.data(), static_cast<size_t>(n));
                continue;
            }
            if (n == 0) {
                if (stream->eof()) {
                    cecssh_log("Reader: remote EOF");
                    break;
                }
                continue;
            }
            cecssh_log("Reader: channel read failed, stopping");
            break;
        }
    } catch (const std::exception& e) {
        cecssh_log(fmt::format("Reader: output sink threw: {}", e.what()));
    }

    signals->reader_done.set_value();
    signals->finish(FinishReason::ReaderDone);
}

void monitor_loop(std::shared_ptr<SshSession> session,
                  std::shared_ptr<RunSignals> signals, int interval_ms) {
    while (!signals->cancel.is_cancelled()) {
        if (!session->is_connected()) {
            cecssh_log("Monitor: transport reports disconnected");
            signals->finish(FinishReason::Disconnected);
            return;
        }
        if (signals->cancel.wait_for(std::chrono::milliseconds(interval_ms))) break;
    }
}

} // namespace

// ── SessionOrchestrator ───────────────────────────────────────

SessionOrchestrator::SessionOrchestrator(std::shared_ptr<SshSession> session,
                                         std::string remote_command,
                                         OrchestratorOptions opts,
                                         OutputSink sink)
    : session_(std::move(session)), remote_command_(std::move(remote_command)),
      opts_(std::move(opts)), sink_(std::move(sink)) {
    history_.push_back(SessionState::Disconnected);
}

void SessionOrchestrator::transition(SessionState next) {
    if (state_.load() == next) return;
    cecssh_log(fmt::format("State: {} -> {}", to_string(state_.load()), to_string(next)));
    state_.store(next);
    history_.push_back(next);
}

RunOutcome SessionOrchestrator::run() {
    RunOutcome outcome;

    auto conn = session_->connect();
    if (conn.failed()) {
        outcome.exit_code = EXIT_CONNECT_FAILED;
        outcome.error = conn.error;
        shutdown();
        return outcome;
    }
    transition(SessionState::Connected);

    auto shell = session_->open_shell(opts_.term, opts_.cols, opts_.rows);
    if (shell.is_err() || !shell.value) {
        outcome.exit_code = EXIT_SHELL_FAILED;
        outcome.error = shell.error;
        shutdown();
        return outcome;
    }
    std::shared_ptr<ShellStream> stream = shell.value;
    transition(SessionState::ShellOpen);

    // Ctrl+C goes to the remote side for as long as the channel is open
    std::unique_ptr<platform::SignalForwarder> forwarder;
    if (opts_.forward_interrupts) {
        forwarder = std::make_unique<platform::SignalForwarder>(stream);
    }

    transition(SessionState::Draining);
    outcome.banner_bytes = drain_banner(*stream, opts_);

    std::string line = build_dispatch_line(remote_command_);
    cecssh_log("Dispatch: " + line);
    auto sent = stream->write(line + "\n");
    if (sent.is_err()) {
        outcome.exit_code = EXIT_DISPATCH_FAILED;
        outcome.error = sent.error;
        shutdown();
        forwarder.reset();
        return outcome;
    }

    transition(SessionState::Executing);
    outcome.finished_by = stream_and_monitor(stream, outcome);

    shutdown();
    forwarder.reset();
    return outcome;
}

FinishReason SessionOrchestrator::stream_and_monitor(const std::shared_ptr<ShellStream>& stream,
                                                     RunOutcome& outcome) {
    auto signals = std::make_shared<RunSignals>();
    auto first = signals->first.get_future();
    auto reader_done = signals->reader_done.get_future();

    std::thread reader(reader_loop, stream, signals, sink_, opts_.read_poll_ms);
    std::thread monitor(monitor_loop, session_, signals, opts_.liveness_poll_ms);

    // Whichever loop finishes first ends the useful work
    FinishReason why = first.get();
    cecssh_log(fmt::format("Executing finished: {}",
                           why == FinishReason::ReaderDone ? "reader done" : "transport dropped"));

    transition(SessionState::ShuttingDown);
    signals->cancel.cancel();

    if (reader_done.wait_for(std::chrono::milliseconds(opts_.grace_ms)) == std::future_status::ready) {
        reader.join();
    } else {
        // Disconnect below is the backstop; the reader only holds shared state
        cecssh_log(fmt::format("Reader still running after {}ms grace, detaching", opts_.grace_ms));
        outcome.reader_exited = false;
        reader.detach();
    }

    // Monitor wakes on cancel; joined before disconnect so the two never overlap
    monitor.join();
    return why;
}

void SessionOrchestrator::shutdown() {
    transition(SessionState::ShuttingDown);
    try {
        if (session_->is_connected()) {
            session_->disconnect();
        }
    } catch (const std::exception& e) {
        cecssh_log_ignored("Disconnect", e.what());
    }
    transition(SessionState::Closed);
}
