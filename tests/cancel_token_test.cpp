#include "uplink/cancel_token.hpp"

#include <gtest/gtest.h>

#include <thread>

using namespace uplink;

TEST(CancelTokenTest, CallbacksRunOnceOnCancel) {
    CancelToken token;
    int calls = 0;
    token.onCancel([&] { calls++; });
    token.cancel();
    token.cancel();
    EXPECT_TRUE(token.cancelled());
    EXPECT_EQ(calls, 1);
}

TEST(CancelTokenTest, LateCallbackRunsImmediately) {
    CancelToken token;
    token.cancel();
    bool ran = false;
    EXPECT_EQ(token.onCancel([&] { ran = true; }), 0u);
    EXPECT_TRUE(ran);
}

TEST(CancelTokenTest, RegistrationRemovesCallback) {
    CancelToken token;
    bool ran = false;
    {
        CancelRegistration registration(token, [&] { ran = true; });
    }
    token.cancel();
    EXPECT_FALSE(ran);
}

TEST(CancelTokenTest, WaitForReportsTimeoutOrCancel) {
    CancelToken token;
    EXPECT_TRUE(token.waitFor(std::chrono::milliseconds(5)));

    std::thread canceller([&] {
        std::this_thread::sleep_for(std::chrono::milliseconds(20));
        token.cancel();
    });
    auto start = std::chrono::steady_clock::now();
    EXPECT_FALSE(token.waitFor(std::chrono::seconds(10)));
    EXPECT_LT(std::chrono::steady_clock::now() - start, std::chrono::seconds(5));
    canceller.join();
}
