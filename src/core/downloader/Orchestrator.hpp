#pragma once

/**
 * Orchestrator.hpp
 * 
 * Entry point of the download engine: runs a batch of tasks either
 * sequentially or through the scheduler and reports the outcome.
 */

#include "EngineContext.hpp"
#include "Scheduler.hpp"
#include "TransferTask.hpp"
#include "../EngineConfig.hpp"

#include <random>
#include <vector>

namespace lockerfetch::core::downloader {

class TransferExecutor;

/**
 * Orchestrator
 * 
 * Per task: ledger lookup, robots gate, site resolution, then the retry
 * controller around a transfer session. Task failures end up in the
 * BatchResult; only environment failures throw.
 */
class Orchestrator {
public:
    Orchestrator(const EngineConfig& config, EngineContext context);

    Orchestrator(const Orchestrator&) = delete;
    Orchestrator& operator=(const Orchestrator&) = delete;

    /**
     * Download a batch
     * @param tasks Tasks in processing order
     * @return Aggregated result
     * @throws EngineError if a destination directory cannot be created
     */
    BatchResult process(const std::vector<TransferTask>& tasks);

    /**
     * Override scheduler tuning (sampler, admission observer)
     */
    void setSchedulerOptions(SchedulerOptions options) { m_schedulerOptions = std::move(options); }

private:
    BatchResult processSequential(const std::vector<TransferTask>& tasks);
    BatchResult processConcurrent(const std::vector<TransferTask>& tasks);

    TransferResult runTask(const TransferTask& task, TransferExecutor& executor);
    void prepareDirectories(const std::vector<TransferTask>& tasks) const;
    void logReport(const BatchResult& result) const;

private:
    const EngineConfig& m_config;
    EngineContext m_context;
    SchedulerOptions m_schedulerOptions;
    std::mt19937 m_rng;
};

} // namespace lockerfetch::core::downloader
