#include <gtest/gtest.h>
#include "toolhost/cancellation.hpp"
#include "toolhost/error.hpp"
#include <thread>

using namespace toolhost;

TEST(Cancellation, DefaultTokenNeverFires) {
    CancellationToken token;
    EXPECT_FALSE(token.is_cancelled());
    EXPECT_EQ(token.reason(), CancelReason::None);
    EXPECT_FALSE(token.wait_for(std::chrono::milliseconds(5)));
    EXPECT_NO_THROW(token.throw_if_cancelled());
}

TEST(Cancellation, CopiesShareState) {
    CancellationSource source;
    auto a = source.token();
    auto b = a;
    EXPECT_TRUE(source.cancel(CancelReason::Client));
    EXPECT_TRUE(a.is_cancelled());
    EXPECT_TRUE(b.is_cancelled());
    EXPECT_EQ(b.reason(), CancelReason::Client);

    CancellationSource copy = source;
    EXPECT_TRUE(copy.is_cancelled());
}

TEST(Cancellation, FirstReasonWins) {
    CancellationSource source;
    EXPECT_TRUE(source.cancel(CancelReason::Timeout));
    EXPECT_FALSE(source.cancel(CancelReason::Client));
    EXPECT_EQ(source.token().reason(), CancelReason::Timeout);
}

TEST(Cancellation, ThrowIfCancelled) {
    CancellationSource source;
    source.cancel(CancelReason::Disconnect);
    try {
        source.token().throw_if_cancelled();
        FAIL() << "expected CancelledError";
    } catch (const CancelledError& e) {
        EXPECT_NE(std::string(e.what()).find("transport disconnected"), std::string::npos);
    }
}

TEST(Cancellation, WaitWakesOnCancel) {
    CancellationSource source;
    auto token = source.token();
    std::thread canceller([source]() mutable {
        std::this_thread::sleep_for(std::chrono::milliseconds(20));
        source.cancel(CancelReason::Client);
    });
    auto start = std::chrono::steady_clock::now();
    EXPECT_TRUE(token.wait_for(std::chrono::seconds(5)));
    EXPECT_LT(std::chrono::steady_clock::now() - start, std::chrono::seconds(2));
    canceller.join();
}

TEST(Cancellation, ReasonNames) {
    EXPECT_EQ(cancel_reason_name(CancelReason::Client), "cancelled by client");
    EXPECT_EQ(cancel_reason_name(CancelReason::Timeout), "timed out");
}
