/**
 * RetryController.cpp
 */

#include "RetryController.hpp"
#include "../EngineConfig.hpp"
#include "../Logger.hpp"

#include <algorithm>
#include <thread>

namespace lockerfetch::core::downloader {

RetryController::RetryController(TransferExecutor& executor, double baseDelay, double delayIncrement,
                                 const CancellationToken* cancel)
    : m_executor(executor)
    , m_baseDelay(baseDelay)
    , m_delayIncrement(delayIncrement)
    , m_cancel(cancel) {}

std::chrono::milliseconds RetryController::backoffDelay(int attempt, double baseDelay, double delayIncrement) {
    int step = std::max(attempt, 1) - 1;
    return EngineConfig::toMillis(baseDelay + step * delayIncrement);
}

TransferResult RetryController::transferWithRetry(const TransferTask& task, int maxAttempts) {
    maxAttempts = std::max(maxAttempts, 1);
    TransferResult last;

    for (int attempt = 1; attempt <= maxAttempts; ++attempt) {
        last = m_executor.transfer(task);
        last.attempts = attempt;
        if (last.sourceUrl.empty()) {
            last.sourceUrl = task.sourceUrl;
        }

        if (!last.isFailed()) {
            return last;
        }

        if (!last.isRetryable()) {
            LOG_DEBUG("{} is permanent for {}, not retrying", last.describe(), task.url);
            return last;
        }

        if (attempt == maxAttempts) {
            break;
        }

        auto delay = backoffDelay(attempt, m_baseDelay, m_delayIncrement);
        LOG_WARN("Attempt {}/{} for {} failed ({}: {}), retrying in {}ms", attempt, maxAttempts,
                 task.url, last.describe(), last.message, delay.count());

        if (m_cancel) {
            if (!m_cancel->waitFor(delay)) {
                TransferResult cancelled = TransferResult::failed(ErrorKind::Cancelled, "cancelled during backoff");
                cancelled.sourceUrl = task.sourceUrl;
                cancelled.attempts = attempt;
                return cancelled;
            }
        } else {
            std::this_thread::sleep_for(delay);
        }
    }

    LOG_ERROR("Giving up on {} after {} attempts: {}", task.url, maxAttempts, last.describe());
    return last;
}

} // namespace lockerfetch::core::downloader
