#include <gtest/gtest.h>
#include <platform/socket_util.hpp>

// ── connect_tcp ─────────────────────────────────────────────

TEST(SocketUtil, UnresolvableHostIsAnError) {
    auto r = platform::connect_tcp("login.jobrunner.invalid", 22, 1000);
    ASSERT_TRUE(r.is_err());
    EXPECT_NE(r.error.find("login.jobrunner.invalid"), std::string::npos);
}

TEST(SocketUtil, RefusedConnectionIsAnError) {
    // Nothing listens on the tcpmux port of the loopback interface.
    auto r = platform::connect_tcp("127.0.0.1", 1, 1000);
    EXPECT_TRUE(r.is_err());
}

TEST(SocketUtil, ClosingInvalidSocketIsHarmless) {
    platform::close_socket(JOBRUNNER_INVALID_SOCKET);
    EXPECT_EQ(platform::poll_socket(JOBRUNNER_INVALID_SOCKET, POLLIN, 0), 0);
}
