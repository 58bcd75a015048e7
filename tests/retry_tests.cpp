#include "utilities/relay_error.hpp"
#include "utilities/retry.hpp"

#include <chrono>
#include <gtest/gtest.h>
#include <vector>

using namespace quickshare;
using namespace std::chrono_literals;

namespace {

bool transientOnly(const RelayError &e) {
  return e.code() == ErrorCode::TransportError;
}

RetryPolicy recordingPolicy(std::vector<std::chrono::milliseconds> &sleeps, int attempts) {
  RetryPolicy policy;
  policy.maxAttempts = attempts;
  policy.interval = 100ms;
  policy.backoffMultiplier = 2.0;
  policy.sleeper = [&sleeps](std::chrono::milliseconds d) { sleeps.push_back(d); };
  return policy;
}

} // namespace

TEST(RetryTest, SucceedsAfterTransientFailures) {
  std::vector<std::chrono::milliseconds> sleeps;
  int calls = 0;
  int result = retryWithPolicy(
      recordingPolicy(sleeps, 5),
      [&] {
        if (++calls < 3)
          throw RelayError(ErrorCode::TransportError, "flaky");
        return 42;
      },
      transientOnly, ErrorCode::UploadFailed, "test op");
  EXPECT_EQ(result, 42);
  EXPECT_EQ(calls, 3);
  ASSERT_EQ(sleeps.size(), 2u);
  EXPECT_EQ(sleeps[0], 100ms);
  EXPECT_EQ(sleeps[1], 200ms);
}

TEST(RetryTest, ExhaustionRaisesTerminalCode) {
  std::vector<std::chrono::milliseconds> sleeps;
  int calls = 0;
  try {
    retryWithPolicy(
        recordingPolicy(sleeps, 3),
        [&]() -> int {
          ++calls;
          throw RelayError(ErrorCode::TransportError, "down");
        },
        transientOnly, ErrorCode::UploadFailed, "test op");
    FAIL() << "expected RelayError";
  } catch (const RelayError &e) {
    EXPECT_EQ(e.code(), ErrorCode::UploadFailed);
  }
  EXPECT_EQ(calls, 3);
  EXPECT_EQ(sleeps.size(), 2u);
}

TEST(RetryTest, NonRetryablePropagatesImmediately) {
  std::vector<std::chrono::milliseconds> sleeps;
  int calls = 0;
  try {
    retryWithPolicy(
        recordingPolicy(sleeps, 5),
        [&]() -> int {
          ++calls;
          throw RelayError(ErrorCode::CodeCompleted, "used up");
        },
        transientOnly, ErrorCode::UploadFailed, "test op");
    FAIL() << "expected RelayError";
  } catch (const RelayError &e) {
    EXPECT_EQ(e.code(), ErrorCode::CodeCompleted);
  }
  EXPECT_EQ(calls, 1);
  EXPECT_TRUE(sleeps.empty());
}

TEST(RelayErrorTest, NamesRoundTripAndMapToStatus) {
  for (int i = 0; i <= static_cast<int>(ErrorCode::Internal); ++i) {
    auto code = static_cast<ErrorCode>(i);
    EXPECT_EQ(errorCodeFromName(errorCodeName(code)), code);
  }
  EXPECT_EQ(errorCodeFromName("NOT_A_REASON"), ErrorCode::Internal);

  EXPECT_EQ(httpStatusFor(ErrorCode::InvalidRequest), 400);
  EXPECT_EQ(httpStatusFor(ErrorCode::Unauthorized), 401);
  EXPECT_EQ(httpStatusFor(ErrorCode::Forbidden), 403);
  EXPECT_EQ(httpStatusFor(ErrorCode::CodeNotFound), 404);
  EXPECT_EQ(httpStatusFor(ErrorCode::KeyNotReady), 404);
  EXPECT_EQ(httpStatusFor(ErrorCode::DuplicateContent), 409);
  EXPECT_EQ(httpStatusFor(ErrorCode::CodeCompleted), 410);
  EXPECT_EQ(httpStatusFor(ErrorCode::Internal), 500);

  EXPECT_TRUE(isTerminalCodeState(ErrorCode::CodeExpired));
  EXPECT_TRUE(isTerminalCodeState(ErrorCode::CodeInvalidated));
  EXPECT_FALSE(isTerminalCodeState(ErrorCode::KeyNotReady));
}
