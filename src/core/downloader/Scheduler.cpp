/**
 * Scheduler.cpp
 */

#include "Scheduler.hpp"
#include "../EngineConfig.hpp"
#include "../Logger.hpp"
#include "../ThreadPool.hpp"

#include <algorithm>
#include <chrono>
#include <condition_variable>
#include <deque>
#include <mutex>
#include <utility>

namespace lockerfetch::core::downloader {

using Clock = std::chrono::steady_clock;

namespace {

constexpr std::chrono::milliseconds kIdlePoll{50};

TransferResult runGuarded(const TransferJob& job, const TransferTask& task, size_t index) {
    try {
        return job(task, index);
    } catch (const std::exception& e) {
        LOG_ERROR("Unhandled error while downloading {}: {}", task.url, e.what());
        TransferResult result = TransferResult::failed(ErrorKind::NetworkError, e.what());
        result.sourceUrl = task.sourceUrl;
        return result;
    } catch (...) {
        LOG_ERROR("Unhandled non-standard error while downloading {}", task.url);
        TransferResult result = TransferResult::failed(ErrorKind::NetworkError, "unknown error");
        result.sourceUrl = task.sourceUrl;
        return result;
    }
}

} // namespace

SchedulerOptions SchedulerOptions::fromConfig(const EngineConfig& config) {
    SchedulerOptions options;
    options.admissionDelay = config.admissionDelay;
    options.reductionPause = config.reductionPause;
    options.errorThreshold = config.errorThreshold;
    options.memoryWarningPercent = config.memoryWarningPercent;
    return options;
}

Scheduler::Scheduler(SchedulerOptions options, const CancellationToken* cancel)
    : m_options(std::move(options))
    , m_cancel(cancel) {
    if (!m_options.sampler) {
        m_options.sampler = [] { return ResourceMonitor::instance().sample(); };
    }
}

BatchResult Scheduler::run(const std::vector<TransferTask>& tasks, int targetWorkerCount, const TransferJob& job) {
    BatchResult batch;
    batch.results.resize(tasks.size());

    int target = std::max(1, targetWorkerCount);
    batch.finalWorkerTarget = target;
    if (tasks.empty()) {
        m_phase = SchedulerPhase::Done;
        return batch;
    }

    m_phase = SchedulerPhase::Running;

    std::mutex mutex;
    std::condition_variable completed;
    std::deque<std::pair<size_t, TransferResult>> completions;

    size_t next = 0;
    size_t inFlight = 0;
    int consecutiveErrors = 0;
    bool reducedOnce = false;
    Clock::time_point pauseUntil = Clock::now();
    Clock::time_point nextAdmissionAt = Clock::now();

    auto admissionDelay = EngineConfig::toMillis(m_options.admissionDelay);
    auto reductionPause = EngineConfig::toMillis(m_options.reductionPause);

    ThreadPool pool(std::min(static_cast<size_t>(target), tasks.size()));

    LOG_INFO("Starting {} downloads with up to {} workers", tasks.size(), target);

    // Held everywhere except while waiting and while sampling resources
    std::unique_lock<std::mutex> lock(mutex, std::defer_lock);

    auto handleCompletion = [&](size_t index, TransferResult result) {
        --inFlight;
        batch.record(result);

        if (result.isFailed()) {
            ++consecutiveErrors;
        } else {
            consecutiveErrors = 0;
        }

        if (consecutiveErrors >= m_options.errorThreshold && !reducedOnce) {
            int reduced = std::max(1, target / 2);
            LOG_WARN("{} consecutive errors, reducing workers from {} to {}", consecutiveErrors, target, reduced);
            target = reduced;
            reducedOnce = true;
            ++batch.reductions;
            pauseUntil = Clock::now() + reductionPause;
        }

        if (m_options.resourceFeedback) {
            size_t finished = batch.successCount + batch.errorCount;
            double successRate = finished == 0
                ? 1.0
                : static_cast<double>(batch.successCount) / static_cast<double>(finished);

            WorkerLoad load;
            load.current = target;
            load.max = target;
            load.min = 1;
            load.consecutiveErrors = consecutiveErrors;
            load.successRate = successRate;
            load.memoryWarningPercent = m_options.memoryWarningPercent;

            lock.unlock();
            ResourceSample sample = m_options.sampler();
            lock.lock();

            int recommended = ResourceMonitor::recommendWorkerCount(sample, load);
            if (recommended < target) {
                LOG_INFO("Resource pressure: reducing workers from {} to {}", target, recommended);
                target = recommended;
            }
        }

        batch.results[index] = std::move(result);
    };

    lock.lock();
    while (true) {
        while (!completions.empty()) {
            auto [index, result] = std::move(completions.front());
            completions.pop_front();
            handleCompletion(index, std::move(result));
        }

        bool cancelled = m_cancel && m_cancel->isCancelled();
        if ((next == tasks.size() || cancelled) && inFlight == 0) {
            break;
        }

        auto now = Clock::now();
        bool slotFree = !cancelled && next < tasks.size() && inFlight < static_cast<size_t>(target);

        if (slotFree && now >= pauseUntil && now >= nextAdmissionAt) {
            size_t index = next++;
            ++inFlight;
            batch.peakInFlight = std::max(batch.peakInFlight, inFlight);
            nextAdmissionAt = now + admissionDelay;

            if (m_options.onAdmit) {
                m_options.onAdmit(index, inFlight, target);
            }
            LOG_DEBUG("Admitted task {} ({} in flight, target {})", index + 1, inFlight, target);

            pool.submit([&, index] {
                TransferResult result = runGuarded(job, tasks[index], index);
                {
                    std::lock_guard<std::mutex> guard(mutex);
                    completions.emplace_back(index, std::move(result));
                }
                completed.notify_one();
            });
            continue;
        }

        Clock::time_point wakeAt = now + kIdlePoll;
        if (slotFree) {
            wakeAt = std::min(wakeAt, std::max(pauseUntil, nextAdmissionAt));
        }
        completed.wait_until(lock, wakeAt, [&] { return !completions.empty(); });
    }
    lock.unlock();

    pool.shutdown();

    batch.notStarted = tasks.size() - next;
    for (size_t i = next; i < tasks.size(); ++i) {
        TransferResult skippedByCancel = TransferResult::failed(ErrorKind::Cancelled, "not started");
        skippedByCancel.sourceUrl = tasks[i].sourceUrl;
        batch.results[i] = std::move(skippedByCancel);
    }
    if (batch.notStarted > 0) {
        LOG_WARN("Cancelled: {} downloads not started", batch.notStarted);
    }

    batch.finalWorkerTarget = target;
    m_phase = SchedulerPhase::Done;
    return batch;
}

} // namespace lockerfetch::core::downloader
