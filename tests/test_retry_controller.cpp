/**
 * @file test_retry_controller.cpp
 * @brief Unit tests for the bounded retry loop
 */

#include <gtest/gtest.h>

#include "core/CancellationToken.hpp"
#include "core/downloader/RetryController.hpp"

#include <deque>

namespace lockerfetch::test {

using core::CancellationToken;
using core::downloader::ErrorKind;
using core::downloader::RetryController;
using core::downloader::TransferExecutor;
using core::downloader::TransferResult;
using core::downloader::TransferTask;

/**
 * Executor returning scripted results, then repeating the last one
 */
class ScriptedExecutor : public TransferExecutor {
public:
    explicit ScriptedExecutor(std::deque<TransferResult> results) : results_(std::move(results)) {}

    TransferResult transfer(const TransferTask&) override {
        ++calls;
        if (on_call) on_call();
        if (results_.size() > 1) {
            TransferResult result = results_.front();
            results_.pop_front();
            return result;
        }
        return results_.front();
    }

    int calls{0};
    std::function<void()> on_call;

private:
    std::deque<TransferResult> results_;
};

auto network_error() -> TransferResult {
    return TransferResult::failed(ErrorKind::NetworkError, "connection reset");
}

auto ok_result() -> TransferResult {
    return TransferResult::success("/tmp/file.bin", 10, std::chrono::milliseconds(5), 65536);
}

const TransferTask kTask("https://cyberdrop.me/f/abc", "/tmp");

TEST(RetryControllerTest, SucceedsFirstTime) {
    ScriptedExecutor executor({ok_result()});
    RetryController retry(executor, 0.0, 0.0);

    TransferResult result = retry.transferWithRetry(kTask, 5);

    EXPECT_TRUE(result.isSuccess());
    EXPECT_EQ(result.attempts, 1);
    EXPECT_EQ(result.sourceUrl, "https://cyberdrop.me/f/abc");
    EXPECT_EQ(executor.calls, 1);
}

TEST(RetryControllerTest, RetriesTransientFailuresUntilSuccess) {
    ScriptedExecutor executor({network_error(),
                               TransferResult::failed(ErrorKind::Timeout, "timed out"),
                               TransferResult::failed(ErrorKind::Http, "HTTP 503", 503),
                               ok_result()});
    RetryController retry(executor, 0.0, 0.0);

    TransferResult result = retry.transferWithRetry(kTask, 10);

    EXPECT_TRUE(result.isSuccess());
    EXPECT_EQ(result.attempts, 4);
    EXPECT_EQ(executor.calls, 4);
}

TEST(RetryControllerTest, StopsAtMaxAttempts) {
    ScriptedExecutor executor({network_error()});
    RetryController retry(executor, 0.0, 0.0);

    TransferResult result = retry.transferWithRetry(kTask, 3);

    EXPECT_EQ(result.error, ErrorKind::NetworkError);
    EXPECT_EQ(result.attempts, 3);
    EXPECT_EQ(executor.calls, 3);
}

TEST(RetryControllerTest, PermanentFailuresAreNotRetried) {
    for (auto kind : {ErrorKind::SizeMismatch, ErrorKind::RobotsDenied, ErrorKind::IoError,
                      ErrorKind::ResolutionFailed}) {
        ScriptedExecutor executor({TransferResult::failed(kind, "permanent")});
        RetryController retry(executor, 0.0, 0.0);

        TransferResult result = retry.transferWithRetry(kTask, 10);
        EXPECT_EQ(result.error, kind);
        EXPECT_EQ(executor.calls, 1) << core::downloader::toString(kind);
    }
}

TEST(RetryControllerTest, ClientErrorsOtherThan429AreFinal) {
    ScriptedExecutor not_found({TransferResult::failed(ErrorKind::Http, "HTTP 404", 404)});
    RetryController(not_found, 0.0, 0.0).transferWithRetry(kTask, 5);
    EXPECT_EQ(not_found.calls, 1);

    ScriptedExecutor throttled({TransferResult::failed(ErrorKind::Http, "HTTP 429", 429), ok_result()});
    EXPECT_TRUE(RetryController(throttled, 0.0, 0.0).transferWithRetry(kTask, 5).isSuccess());
    EXPECT_EQ(throttled.calls, 2);
}

TEST(RetryControllerTest, SkippedIsReturnedImmediately) {
    ScriptedExecutor executor({TransferResult::skipped(kTask.sourceUrl, "already downloaded")});
    TransferResult result = RetryController(executor, 0.0, 0.0).transferWithRetry(kTask, 5);
    EXPECT_TRUE(result.isSkipped());
    EXPECT_EQ(executor.calls, 1);
}

TEST(RetryControllerTest, ZeroAttemptsStillTriesOnce) {
    ScriptedExecutor executor({network_error()});
    RetryController(executor, 0.0, 0.0).transferWithRetry(kTask, 0);
    EXPECT_EQ(executor.calls, 1);
}

TEST(RetryControllerTest, CancellationInterruptsBackoff) {
    CancellationToken cancel;
    ScriptedExecutor executor({network_error()});
    executor.on_call = [&cancel] { cancel.cancel(); };
    RetryController retry(executor, 30.0, 0.5, &cancel);

    auto start = std::chrono::steady_clock::now();
    TransferResult result = retry.transferWithRetry(kTask, 10);
    auto elapsed = std::chrono::steady_clock::now() - start;

    EXPECT_EQ(result.error, ErrorKind::Cancelled);
    EXPECT_EQ(result.attempts, 1);
    EXPECT_EQ(executor.calls, 1);
    EXPECT_LT(elapsed, std::chrono::seconds(5));
}

TEST(RetryControllerTest, BackoffGrowsLinearly) {
    EXPECT_EQ(RetryController::backoffDelay(1, 2.0, 0.5), std::chrono::milliseconds(2000));
    EXPECT_EQ(RetryController::backoffDelay(2, 2.0, 0.5), std::chrono::milliseconds(2500));
    EXPECT_EQ(RetryController::backoffDelay(5, 2.0, 0.5), std::chrono::milliseconds(4000));

    auto previous = RetryController::backoffDelay(1, 2.0, 0.5);
    for (int attempt = 2; attempt <= 9; ++attempt) {
        auto delay = RetryController::backoffDelay(attempt, 2.0, 0.5);
        EXPECT_GT(delay, previous);
        previous = delay;
    }
}

TEST(RetryControllerTest, BackoffIsZeroWhenDisabled) {
    EXPECT_EQ(RetryController::backoffDelay(3, 0.0, 0.0), std::chrono::milliseconds(0));
}

} // namespace lockerfetch::test
