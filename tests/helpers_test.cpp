#include "uplink/errors.hpp"
#include "uplink/helpers.hpp"

#include <gtest/gtest.h>

#include <sys/socket.h>
#include <unistd.h>

using namespace uplink;

TEST(HelpersTest, ParsesHostPort) {
    HostPort hp;
    ASSERT_TRUE(parse_host_port("127.0.0.1:9000", hp));
    EXPECT_EQ(hp.host, "127.0.0.1");
    EXPECT_EQ(hp.port, 9000);
    EXPECT_FALSE(parse_host_port("localhost", hp));
    EXPECT_FALSE(parse_host_port(":80", hp));
    EXPECT_FALSE(parse_host_port("host:99999", hp));
    EXPECT_FALSE(parse_host_port("host:8o", hp));
}

TEST(HelpersTest, UploadUrlRoundTrip) {
    std::string url = make_upload_url(HostPort{"store.local", 7000}, "batch/rec-1-a.mp3");
    EXPECT_EQ(url, "tcp://store.local:7000/batch/rec-1-a.mp3");
    auto parsed = parse_upload_url(url);
    EXPECT_EQ(parsed.endpoint.host, "store.local");
    EXPECT_EQ(parsed.endpoint.port, 7000);
    EXPECT_EQ(parsed.object_key, "batch/rec-1-a.mp3");
}

TEST(HelpersTest, MalformedUploadUrlIsNotRetryable) {
    EXPECT_THROW(parse_upload_url("https://store/key"), NonRetryableClientError);
    EXPECT_THROW(parse_upload_url("tcp://store:7000"), NonRetryableClientError);
    EXPECT_THROW(parse_upload_url("tcp://store:7000/"), NonRetryableClientError);
    EXPECT_THROW(parse_upload_url("tcp://store/key"), NonRetryableClientError);
}

TEST(HelpersTest, SplitKeepsEmptyParts) {
    auto parts = split("a//b", '/');
    ASSERT_EQ(parts.size(), 3u);
    EXPECT_EQ(parts[1], "");
    EXPECT_EQ(split("", '/').size(), 1u);
}

TEST(HelpersTest, FramesTravelOverSocketPair) {
    int fds[2];
    ASSERT_EQ(::socketpair(AF_UNIX, SOCK_STREAM, 0, fds), 0);
    ScopedFd a(fds[0]);
    ScopedFd b(fds[1]);

    send_msg(a.get(), R"({"op":"finalize_record"})");
    send_msg(a.get(), "");
    EXPECT_EQ(recv_msg(b.get()), R"({"op":"finalize_record"})");
    EXPECT_EQ(recv_msg(b.get()), "");
}

TEST(HelpersTest, RejectsGarbageLengthPrefix) {
    int fds[2];
    ASSERT_EQ(::socketpair(AF_UNIX, SOCK_STREAM, 0, fds), 0);
    ScopedFd a(fds[0]);
    ScopedFd b(fds[1]);
    const std::string junk = "12x payload";
    send_all(a.get(), junk.data(), junk.size(), no_deadline());
    EXPECT_THROW(recv_msg(b.get()), NonRetryableClientError);
}

TEST(HelpersTest, ClosedPeerAndDeadlineAreTransient) {
    int fds[2];
    ASSERT_EQ(::socketpair(AF_UNIX, SOCK_STREAM, 0, fds), 0);
    ScopedFd a(fds[0]);
    ScopedFd b(fds[1]);

    EXPECT_THROW(recv_msg(b.get(), Clock::now() + std::chrono::milliseconds(20)), TransientNetworkError);
    a.reset();
    try {
        recv_msg(b.get());
        FAIL() << "expected connection_closed";
    } catch (const TransientNetworkError &e) {
        EXPECT_EQ(std::string(e.what()).rfind("connection_closed", 0), 0u);
    }
}

TEST(HelpersTest, ScopedFdMoveTransfersOwnership) {
    int fds[2];
    ASSERT_EQ(::socketpair(AF_UNIX, SOCK_STREAM, 0, fds), 0);
    ScopedFd a(fds[0]);
    ScopedFd moved(std::move(a));
    EXPECT_EQ(a.get(), -1);
    EXPECT_EQ(moved.get(), fds[0]);
    ::close(fds[1]);
}
