#pragma once

#include <atomic>
#include <functional>
#include <memory>
#include <string>
#include <vector>
#include <core/constants.hpp>
#include <core/types.hpp>
#include <ssh/transport.hpp>

// Lifecycle of one run. Strictly forward; any state may jump to
// ShuttingDown on cancellation or a fatal I/O error.
enum class SessionState {
    Disconnected,
    Connected,
    ShellOpen,
    Draining,
    Executing,
    ShuttingDown,
    Closed,
};

const char* to_string(SessionState state);

// Which background loop ended the Executing phase.
enum class FinishReason {
    None,           // never reached Executing
    ReaderDone,     // EOF, read error or cancellation
    Disconnected,   // liveness monitor saw the transport drop
};

struct OrchestratorOptions {
    std::string term = PTY_TERM_TYPE;
    int cols = PTY_COLS;
    int rows = PTY_ROWS;
    int settle_ms = BANNER_SETTLE_MS;
    int drain_poll_ms = DRAIN_POLL_MS;
    int drain_empty_polls = DRAIN_EMPTY_POLLS;
    int drain_chunk = SSH_DRAIN_BUF_SIZE;
    int liveness_poll_ms = LIVENESS_POLL_MS;
    int grace_ms = SHUTDOWN_GRACE_MS;
    int read_poll_ms = READ_POLL_MS;
    bool forward_interrupts = true;
};

// Receives remote output verbatim.
using OutputSink = std::function<void(const char* data, size_t len)>;

// Writes straight to fd 1, unbuffered.
OutputSink stdout_sink();

struct RunOutcome {
    int exit_code = EXIT_OK;
    std::string error;                      // set for fatal failures only
    FinishReason finished_by = FinishReason::None;
    bool reader_exited = true;              // false if the reader outlived the grace period
    int banner_bytes = 0;                   // discarded during drain
};

// Banner drain: wait settle_ms, then read and discard while data keeps
// arriving; stop after drain_empty_polls consecutive empty polls. Read
// errors end the drain quietly. Returns the number of bytes discarded.
int drain_banner(ShellStream& stream, const OrchestratorOptions& opts);

// Runs one remote command over an interactive shell:
//
//   connect -> open PTY shell -> drain banner -> write
//   "stty -echo; exec cec-ctl ..." once -> stream output while watching
//   liveness -> cancel, wait up to grace_ms for the reader, disconnect.
//
// Each step is attempted once. Connect, shell open and dispatch failures are
// fatal and map to distinct exit codes; everything after dispatch exits 0.
class SessionOrchestrator {
public:
    SessionOrchestrator(std::shared_ptr<SshSession> session,
                        std::string remote_command,
                        OrchestratorOptions opts = OrchestratorOptions(),
                        OutputSink sink = stdout_sink());

    RunOutcome run();

    SessionState state() const { return state_.load(); }
    std::vector<SessionState> history() const { return history_; }

    SessionOrchestrator(const SessionOrchestrator&) = delete;
    SessionOrchestrator& operator=(const SessionOrchestrator&) = delete;

private:
    std::shared_ptr<SshSession> session_;
    const std::string remote_command_;
    const OrchestratorOptions opts_;
    OutputSink sink_;
    std::atomic<SessionState> state_{SessionState::Disconnected};
    std::vector<SessionState> history_;     // main thread only

    void transition(SessionState next);
    FinishReason stream_and_monitor(const std::shared_ptr<ShellStream>& stream,
                                    RunOutcome& outcome);
    void shutdown();
};
