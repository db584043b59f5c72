#pragma once

/**
 * CancellationToken.hpp
 * 
 * Cooperative cancellation flag shared by a batch.
 */

#include <algorithm>
#include <atomic>
#include <chrono>
#include <thread>

namespace lockerfetch::core {

/**
 * Cancellation flag
 * 
 * cancel() only stores to a lock-free atomic, so it may be called from a
 * signal handler. Waiters poll in short slices instead of blocking on a
 * condition variable for the same reason.
 */
class CancellationToken {
public:
    static constexpr std::chrono::milliseconds kPollSlice{50};

    CancellationToken() = default;
    CancellationToken(const CancellationToken&) = delete;
    CancellationToken& operator=(const CancellationToken&) = delete;

    void cancel() noexcept { m_cancelled.store(true); }
    void reset() noexcept { m_cancelled.store(false); }

    bool isCancelled() const noexcept { return m_cancelled.load(); }

    /**
     * Sleep for the given duration unless cancelled first
     * @param duration Time to wait
     * @return true if the full duration elapsed, false if cancelled
     */
    template<typename Rep, typename Period>
    bool waitFor(std::chrono::duration<Rep, Period> duration) const {
        auto deadline = std::chrono::steady_clock::now()
            + std::chrono::duration_cast<std::chrono::steady_clock::duration>(duration);

        while (!isCancelled()) {
            auto now = std::chrono::steady_clock::now();
            if (now >= deadline) {
                return true;
            }
            auto remaining = deadline - now;
            std::this_thread::sleep_for(std::min<std::chrono::steady_clock::duration>(remaining, kPollSlice));
        }
        return false;
    }

private:
    std::atomic<bool> m_cancelled{false};
};

} // namespace lockerfetch::core
