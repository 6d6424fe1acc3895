#include <gtest/gtest.h>
#include "fake_transport.hpp"
#include <core/shell_quote.hpp>
#include <csignal>

using Clock = std::chrono::steady_clock;

class OrchestratorTest : public ::testing::Test {
protected:
    std::shared_ptr<FakeShellStream> stream = std::make_shared<FakeShellStream>();
    std::shared_ptr<FakeSshSession> session = std::make_shared<FakeSshSession>(stream);
    CapturedOutput output;

    const std::string remote = build_remote_command({"-d", "/dev/cec1", "-M"});

    // Remote answers the dispatch line with `reply` and exits
    void reply_then_exit(const std::string& reply) {
        stream->on_write([reply](FakeShellStream& s, const std::string& data) {
            if (data.empty() || data.back() != '\n') return;
            s.push(reply);
            s.set_eof();
        });
    }

    RunOutcome run(OrchestratorOptions opts = fast_options()) {
        SessionOrchestrator orch(session, remote, opts, output.sink());
        RunOutcome outcome = orch.run();
        history = orch.history();
        final_state = orch.state();
        return outcome;
    }

    std::vector<SessionState> history;
    SessionState final_state = SessionState::Disconnected;
};

TEST_F(OrchestratorTest, WritesDispatchLineExactlyOnce) {
    reply_then_exit("");
    auto outcome = run();

    EXPECT_EQ(outcome.exit_code, EXIT_OK);
    auto writes = stream->writes();
    ASSERT_EQ(writes.size(), 1u);
    EXPECT_EQ(writes[0], "stty -echo; exec cec-ctl -d /dev/cec1 -M\n");
}

TEST_F(OrchestratorTest, RequestsConfiguredPty) {
    reply_then_exit("");
    run();

    EXPECT_EQ(session->term, "xterm");
    EXPECT_EQ(session->cols, 80);
    EXPECT_EQ(session->rows, 24);
    EXPECT_EQ(session->connect_calls.load(), 1);
    EXPECT_EQ(session->open_calls.load(), 1);
}

TEST_F(OrchestratorTest, StreamsCommandOutputButNeverBanner) {
    stream->push("Linux tv 6.1.21-v8+\r\npi@tv:~$ ");
    reply_then_exit("Driver Info:\r\n\tDriver Name: vc4_hdmi\r\n");

    auto outcome = run();

    EXPECT_EQ(outcome.exit_code, EXIT_OK);
    EXPECT_GT(outcome.banner_bytes, 0);
    EXPECT_EQ(outcome.finished_by, FinishReason::ReaderDone);
    EXPECT_EQ(output.get(), "Driver Info:\r\n\tDriver Name: vc4_hdmi\r\n");
}

TEST_F(OrchestratorTest, NoOutputBeforeDispatch) {
    std::mutex m;
    std::vector<std::string> events;

    stream->push("banner");
    stream->on_write([&](FakeShellStream& s, const std::string&) {
        {
            std::lock_guard<std::mutex> lock(m);
            events.push_back("dispatch");
        }
        s.push("out");
        s.set_eof();
    });

    SessionOrchestrator orch(session, remote, fast_options(),
                             [&](const char* data, size_t len) {
                                 std::lock_guard<std::mutex> lock(m);
                                 events.push_back(std::string(data, len));
                             });
    orch.run();

    std::lock_guard<std::mutex> lock(m);
    ASSERT_EQ(events.size(), 2u);
    EXPECT_EQ(events[0], "dispatch");
    EXPECT_EQ(events[1], "out");
}

TEST_F(OrchestratorTest, StatesMoveForwardOnly) {
    reply_then_exit("ok\n");
    run();

    std::vector<SessionState> expected = {
        SessionState::Disconnected, SessionState::Connected, SessionState::ShellOpen,
        SessionState::Draining, SessionState::Executing, SessionState::ShuttingDown,
        SessionState::Closed,
    };
    EXPECT_EQ(history, expected);
    EXPECT_EQ(final_state, SessionState::Closed);
}

TEST_F(OrchestratorTest, DisconnectsAfterNormalExit) {
    reply_then_exit("");
    run();
    EXPECT_EQ(session->disconnect_calls.load(), 1);
    EXPECT_FALSE(session->connected.load());
}

TEST_F(OrchestratorTest, ConnectFailureIsFatal) {
    session->connect_result = SSHResult{1, "Connection refused"};
    auto outcome = run();

    EXPECT_EQ(outcome.exit_code, EXIT_CONNECT_FAILED);
    EXPECT_EQ(outcome.error, "Connection refused");
    EXPECT_EQ(session->open_calls.load(), 0);
    EXPECT_TRUE(stream->writes().empty());
    EXPECT_EQ(final_state, SessionState::Closed);
}

TEST_F(OrchestratorTest, ShellFailureIsFatal) {
    session->shell_fails = true;
    auto outcome = run();

    EXPECT_EQ(outcome.exit_code, EXIT_SHELL_FAILED);
    EXPECT_NE(outcome.error.find("pty"), std::string::npos);
    EXPECT_TRUE(stream->writes().empty());
    EXPECT_EQ(session->disconnect_calls.load(), 1);
}

TEST_F(OrchestratorTest, DispatchFailureIsFatal) {
    stream->set_fail_writes(true);
    auto outcome = run();

    EXPECT_EQ(outcome.exit_code, EXIT_DISPATCH_FAILED);
    EXPECT_EQ(outcome.finished_by, FinishReason::None);
    EXPECT_TRUE(output.get().empty());
    EXPECT_EQ(final_state, SessionState::Closed);
}

TEST_F(OrchestratorTest, TransportDropEndsRun) {
    FakeSshSession* s = session.get();
    stream->on_write([s](FakeShellStream&, const std::string&) { s->drop(); });

    auto outcome = run();

    EXPECT_EQ(outcome.exit_code, EXIT_OK);
    EXPECT_EQ(outcome.finished_by, FinishReason::Disconnected);
    EXPECT_TRUE(outcome.reader_exited);
    // Already gone, nothing to tear down
    EXPECT_EQ(session->disconnect_calls.load(), 0);
}

TEST_F(OrchestratorTest, ShutdownIsBoundedWhenReaderHangs) {
    FakeSshSession* s = session.get();
    stream->set_block_reads(true);
    stream->on_write([s](FakeShellStream&, const std::string&) { s->drop(); });

    auto opts = fast_options();
    auto start = Clock::now();
    auto outcome = run(opts);
    auto took = std::chrono::duration_cast<std::chrono::milliseconds>(Clock::now() - start);

    EXPECT_EQ(outcome.exit_code, EXIT_OK);
    EXPECT_FALSE(outcome.reader_exited);
    EXPECT_LT(took.count(), opts.grace_ms + 1500);
    EXPECT_EQ(final_state, SessionState::Closed);

    // Release the detached reader; it drops its stream reference on exit
    stream->close();
    EXPECT_TRUE(wait_until([&] { return stream.use_count() <= 2; }));
}

TEST_F(OrchestratorTest, ForwardsInterruptWhileExecuting) {
    stream->on_write([](FakeShellStream& s, const std::string& data) {
        if (data.empty() || data.back() != '\n') return;
        std::raise(SIGINT);
        wait_until([&] { return s.wrote(std::string(1, CTRL_C)); });
        s.push("^C");
        s.set_eof();
    });

    auto opts = fast_options();
    opts.forward_interrupts = true;
    auto outcome = run(opts);

    EXPECT_EQ(outcome.exit_code, EXIT_OK);
    EXPECT_TRUE(stream->wrote(std::string(1, CTRL_C)));
    EXPECT_EQ(output.get(), "^C");
}

TEST(SessionStateNames, AllStatesNamed) {
    EXPECT_STREQ(to_string(SessionState::Disconnected), "Disconnected");
    EXPECT_STREQ(to_string(SessionState::Executing), "Executing");
    EXPECT_STREQ(to_string(SessionState::Closed), "Closed");
}
