#pragma once

/**
 * Scheduler.hpp
 * 
 * Admission-controlled worker pool over a task queue. The worker target
 * starts at the requested concurrency and only ever goes down: once on an
 * error burst, and whenever the resource monitor recommends fewer workers.
 */

#include "TransferTask.hpp"
#include "ResourceMonitor.hpp"
#include "../CancellationToken.hpp"

#include <atomic>
#include <functional>
#include <vector>

namespace lockerfetch::core {
struct EngineConfig;
}

namespace lockerfetch::core::downloader {

/**
 * Work executed for one admitted task on a pool thread
 */
using TransferJob = std::function<TransferResult(const TransferTask& task, size_t index)>;

/**
 * Observer invoked by the dispatcher right after a task is admitted
 */
using AdmissionCallback = std::function<void(size_t index, size_t inFlight, int target)>;

using SampleProvider = std::function<ResourceSample()>;

struct SchedulerOptions {
    double admissionDelay{1.5};         // seconds between admissions
    double reductionPause{3.0};         // seconds without admissions after a reduction
    int errorThreshold{3};              // consecutive failures that halve the target
    double memoryWarningPercent{80.0};
    bool resourceFeedback{true};
    SampleProvider sampler;             // empty = ResourceMonitor::instance().sample()
    AdmissionCallback onAdmit;

    static SchedulerOptions fromConfig(const EngineConfig& config);
};

enum class SchedulerPhase {
    Idle,
    Running,
    Done
};

/**
 * Scheduler
 * 
 * run() dispatches from the calling thread: it admits tasks in queue
 * order, collects completions from the pool and owns every counter.
 */
class Scheduler {
public:
    explicit Scheduler(SchedulerOptions options, const CancellationToken* cancel = nullptr);

    Scheduler(const Scheduler&) = delete;
    Scheduler& operator=(const Scheduler&) = delete;

    /**
     * Run all tasks with at most targetWorkerCount in flight
     * @param tasks Tasks in admission order
     * @param targetWorkerCount Initial worker target (at least 1)
     * @param job Work for one task; exceptions become Failed(NetworkError)
     * @return Aggregated result, per-task results in input order
     */
    BatchResult run(const std::vector<TransferTask>& tasks, int targetWorkerCount, const TransferJob& job);

    SchedulerPhase phase() const { return m_phase.load(); }

private:
    SchedulerOptions m_options;
    const CancellationToken* m_cancel;
    std::atomic<SchedulerPhase> m_phase{SchedulerPhase::Idle};
};

} // namespace lockerfetch::core::downloader
