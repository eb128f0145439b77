#include <gtest/gtest.h>

#include <docent/core/retry.h>
#include <docent/core/types.h>

#include <stop_token>

using namespace docent;

namespace {

RetryPolicy fastPolicy(int attempts = 3) {
    RetryPolicy policy;
    policy.max_attempts = attempts;
    policy.initial_backoff = std::chrono::milliseconds(1);
    policy.max_backoff = std::chrono::milliseconds(2);
    return policy;
}

} // namespace

TEST(ResultTest, ValueAndError) {
    Result<int> ok = 42;
    ASSERT_TRUE(ok);
    EXPECT_EQ(ok.value(), 42);

    Result<int> bad = Error{ErrorCode::NotFound, "missing"};
    ASSERT_FALSE(bad);
    EXPECT_EQ(bad.error().code, ErrorCode::NotFound);
    EXPECT_EQ(bad.error().message, "missing");
    EXPECT_THROW(bad.value(), std::runtime_error);
}

TEST(ResultTest, VoidResult) {
    Result<void> ok;
    EXPECT_TRUE(ok);

    Result<void> bad = ErrorCode::DatabaseError;
    ASSERT_FALSE(bad);
    EXPECT_EQ(bad.error().code, ErrorCode::DatabaseError);
    EXPECT_FALSE(bad.error().message.empty());
    EXPECT_THROW(bad.value(), BadResultAccess);
    EXPECT_THROW(ok.error(), BadResultAccess);
}

TEST(ResultTest, TransientCodes) {
    EXPECT_TRUE(isTransient(ErrorCode::NetworkError));
    EXPECT_TRUE(isTransient(ErrorCode::Timeout));
    EXPECT_TRUE(isTransient(ErrorCode::RateLimited));
    EXPECT_TRUE(isTransient(ErrorCode::ResourceExhausted));

    EXPECT_FALSE(isTransient(ErrorCode::InvalidArgument));
    EXPECT_FALSE(isTransient(ErrorCode::GenerationError));
    EXPECT_FALSE(isTransient(ErrorCode::IsolationViolation));
}

TEST(RetryTest, RetriesTransientFailuresUntilSuccess) {
    int calls = 0;
    auto result = retryWithBackoff(fastPolicy(), "flaky", [&]() -> Result<int> {
        if (++calls < 3)
            return Error{ErrorCode::NetworkError, "connection reset"};
        return 7;
    });
    ASSERT_TRUE(result);
    EXPECT_EQ(result.value(), 7);
    EXPECT_EQ(calls, 3);
}

TEST(RetryTest, PermanentFailureIsNotRetried) {
    int calls = 0;
    auto result = retryWithBackoff(fastPolicy(), "bad request", [&]() -> Result<int> {
        ++calls;
        return Error{ErrorCode::InvalidArgument, "bad input"};
    });
    ASSERT_FALSE(result);
    EXPECT_EQ(result.error().code, ErrorCode::InvalidArgument);
    EXPECT_EQ(calls, 1);
}

TEST(RetryTest, GivesUpAfterAttemptBudget) {
    int calls = 0;
    auto result = retryWithBackoff(fastPolicy(2), "always down", [&]() -> Result<int> {
        ++calls;
        return Error{ErrorCode::Timeout, "timed out"};
    });
    ASSERT_FALSE(result);
    EXPECT_EQ(result.error().code, ErrorCode::Timeout);
    EXPECT_EQ(calls, 2);
}

TEST(RetryTest, StopRequestCancelsBeforeNextAttempt) {
    std::stop_source source;
    int calls = 0;
    auto result = retryWithBackoff(
        fastPolicy(5), "cancelled",
        [&]() -> Result<int> {
            ++calls;
            source.request_stop();
            return Error{ErrorCode::RateLimited, "slow down"};
        },
        source.get_token());
    ASSERT_FALSE(result);
    EXPECT_EQ(result.error().code, ErrorCode::OperationCancelled);
    EXPECT_EQ(calls, 1);
}
