#pragma once

/**
 * RetryController.hpp
 * 
 * Bounded retry loop with linearly growing delays around a transfer.
 */

#include "TransferSession.hpp"
#include "../CancellationToken.hpp"

#include <chrono>

namespace lockerfetch::core::downloader {

class RetryController {
public:
    /**
     * @param executor Transfer carried out on every attempt
     * @param baseDelay Seconds to wait after the first failed attempt
     * @param delayIncrement Seconds added per further attempt
     * @param cancel Interrupts waits between attempts (may be null)
     */
    RetryController(TransferExecutor& executor, double baseDelay, double delayIncrement,
                    const CancellationToken* cancel = nullptr);

    /**
     * Run the transfer until it succeeds, fails permanently or runs out of attempts
     * @param task Task to transfer
     * @param maxAttempts Number of attempts, at least 1
     * @return First Success or Skipped result, a permanent failure, or the last failure
     */
    TransferResult transferWithRetry(const TransferTask& task, int maxAttempts);

    /**
     * Wait after attempt number `attempt` (1-based): base + (attempt-1) * increment
     */
    static std::chrono::milliseconds backoffDelay(int attempt, double baseDelay, double delayIncrement);

private:
    TransferExecutor& m_executor;
    double m_baseDelay;
    double m_delayIncrement;
    const CancellationToken* m_cancel;
};

} // namespace lockerfetch::core::downloader
