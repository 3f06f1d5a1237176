#include <gtest/gtest.h>
#include "common/thread_utils.hpp"
#include <atomic>
#include <chrono>
#include <memory>

using namespace std::chrono_literals;

// Test that an empty bound runs the call on the caller's thread
TEST(ThreadUtilsTest, UnboundedRunsInline) {
    const auto caller = std::this_thread::get_id();
    auto runner = ThreadUtils::runWithTimeout("inline", [] { return std::this_thread::get_id(); }, std::nullopt);
    EXPECT_EQ(runner, caller);
}

TEST(ThreadUtilsTest, ReturnsValueWithinBound) {
    int value = ThreadUtils::runWithTimeout("answer", [] { return 42; }, Timeout(1000ms));
    EXPECT_EQ(value, 42);
}

TEST(ThreadUtilsTest, VoidCallWithinBound) {
    auto done = std::make_shared<std::atomic<bool>>(false);
    ThreadUtils::runWithTimeout("void", [done] { done->store(true); }, Timeout(1000ms));
    EXPECT_TRUE(done->load());
}

// A hung call is abandoned once the bound expires
TEST(ThreadUtilsTest, SlowCallTimesOut) {
    const auto start = std::chrono::steady_clock::now();
    try {
        ThreadUtils::runWithTimeout("slow read", [] {
            std::this_thread::sleep_for(600ms);
            return 1;
        }, Timeout(50ms));
        FAIL() << "expected TimeoutFailure";
    } catch (const TimeoutFailure& e) {
        EXPECT_EQ(e.operation(), "slow read");
        EXPECT_EQ(e.bound(), 50ms);
    }
    EXPECT_LT(std::chrono::steady_clock::now() - start, 500ms);
}

TEST(ThreadUtilsTest, ExceptionsPropagate) {
    EXPECT_THROW(ThreadUtils::runWithTimeout("failing", []() -> int {
        throw IOFailure("/remote/file", IOErrorKind::NoSpace, true, "write failed");
    }, Timeout(1000ms)), IOFailure);

    EXPECT_THROW(ThreadUtils::runWithTimeout("failing inline", []() -> int {
        throw CancelledError();
    }, std::nullopt), CancelledError);
}

TEST(CancellationTokenTest, SetOnce) {
    CancellationToken token;
    EXPECT_FALSE(token.isCancelled());
    EXPECT_NO_THROW(token.throwIfCancelled());

    token.cancel();
    EXPECT_TRUE(token.isCancelled());
    EXPECT_THROW(token.throwIfCancelled("stopping"), CancelledError);
    token.cancel();
    EXPECT_TRUE(token.isCancelled());
}
