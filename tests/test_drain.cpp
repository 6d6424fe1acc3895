#include <gtest/gtest.h>
#include "fake_transport.hpp"

using Clock = std::chrono::steady_clock;

static long elapsed_ms(Clock::time_point start) {
    return static_cast<long>(std::chrono::duration_cast<std::chrono::milliseconds>(
        Clock::now() - start).count());
}

// Claims data is waiting but every read fails
class BrokenStream : public ShellStream {
public:
    int read(char*, int, int) override { reads++; return -1; }
    bool data_available() override { return true; }
    bool eof() override { return false; }
    Result<void> write(const std::string&) override { return Result<void>::Ok(); }
    int reads = 0;
};

TEST(BannerDrain, SilentChannelEndsAfterSettleAndEmptyPolls) {
    FakeShellStream stream;
    auto opts = fast_options();

    auto start = Clock::now();
    int discarded = drain_banner(stream, opts);
    long took = elapsed_ms(start);

    EXPECT_EQ(discarded, 0);
    EXPECT_EQ(stream.reads(), 0);
    EXPECT_GE(took, opts.settle_ms + opts.drain_empty_polls * opts.drain_poll_ms);
    EXPECT_LT(took, 1000);
}

TEST(BannerDrain, DiscardsEverythingAlreadyBuffered) {
    FakeShellStream stream;
    const std::string banner = "Welcome to Raspbian\r\nLast login: Mon Oct 19\r\npi@tv:~$ ";
    stream.push(banner);

    int discarded = drain_banner(stream, fast_options());
    EXPECT_EQ(discarded, static_cast<int>(banner.size()));
    EXPECT_EQ(stream.pending(), 0u);
}

TEST(BannerDrain, ReadsAreBoundedByChunkSize) {
    FakeShellStream stream;
    stream.push(std::string(10000, 'b'));

    auto opts = fast_options();
    int discarded = drain_banner(stream, opts);

    EXPECT_EQ(discarded, 10000);
    EXPECT_EQ(stream.pending(), 0u);
    EXPECT_EQ(stream.max_read_len(), SSH_DRAIN_BUF_SIZE);
    EXPECT_GE(stream.reads(), 10000 / SSH_DRAIN_BUF_SIZE + 1);
}

TEST(BannerDrain, KeepsGoingWhileBannerTrickles) {
    FakeShellStream stream;
    auto opts = fast_options();
    opts.drain_poll_ms = 50;

    // Bursts arrive well inside the empty-poll window
    std::thread feeder([&] {
        for (int i = 0; i < 8; i++) {
            stream.push("motd line\r\n");
            std::this_thread::sleep_for(std::chrono::milliseconds(15));
        }
    });

    int discarded = drain_banner(stream, opts);
    feeder.join();

    EXPECT_EQ(discarded, 8 * 11);
    EXPECT_EQ(stream.pending(), 0u);
}

TEST(BannerDrain, ReadErrorEndsDrain) {
    BrokenStream stream;
    int discarded = drain_banner(stream, fast_options());
    EXPECT_EQ(discarded, 0);
    EXPECT_EQ(stream.reads, 1);
}
