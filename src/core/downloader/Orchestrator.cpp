/**
 * Orchestrator.cpp
 */

#include "Orchestrator.hpp"
#include "Ledger.hpp"
#include "RetryController.hpp"
#include "TransferSession.hpp"
#include "../EngineError.hpp"
#include "../Logger.hpp"
#include "../../sites/RobotsPolicy.hpp"
#include "../../sites/SiteRegistry.hpp"
#include "../../utils/FileUtils.hpp"
#include "../../utils/StringUtils.hpp"

#include <chrono>
#include <set>

namespace lockerfetch::core::downloader {

using utils::FileUtils;
using utils::StringUtils;

Orchestrator::Orchestrator(const EngineConfig& config, EngineContext context)
    : m_config(config)
    , m_context(context)
    , m_schedulerOptions(SchedulerOptions::fromConfig(config))
    , m_rng(std::random_device{}()) {}

BatchResult Orchestrator::process(const std::vector<TransferTask>& tasks) {
    prepareDirectories(tasks);

    BatchResult result = m_config.isConcurrent() ? processConcurrent(tasks) : processSequential(tasks);
    logReport(result);
    return result;
}

BatchResult Orchestrator::processSequential(const std::vector<TransferTask>& tasks) {
    LOG_INFO("Downloading {} files sequentially", tasks.size());

    BatchResult batch;
    batch.results.resize(tasks.size());
    batch.finalWorkerTarget = 1;

    TransferSession session(m_config, m_context.transport, &m_context.ledger,
                            m_context.monitor, &m_context.cancel);
    std::uniform_real_distribution<double> pause(m_config.sequentialMinPause, m_config.sequentialMaxPause);

    size_t index = 0;
    for (; index < tasks.size(); ++index) {
        if (m_context.cancel.isCancelled()) {
            break;
        }

        LOG_INFO("[{}/{}] {}", index + 1, tasks.size(), tasks[index].sourceUrl);
        TransferResult result = runTask(tasks[index], session);
        batch.peakInFlight = 1;
        batch.record(result);
        bool skipped = result.isSkipped();
        batch.results[index] = std::move(result);

        bool last = index + 1 == tasks.size();
        if (!last && !skipped && m_config.sequentialMaxPause > 0.0) {
            if (!m_context.cancel.waitFor(EngineConfig::toMillis(pause(m_rng)))) {
                ++index;
                break;
            }
        }
    }

    batch.notStarted = tasks.size() - index;
    for (size_t i = index; i < tasks.size(); ++i) {
        TransferResult notStarted = TransferResult::failed(ErrorKind::Cancelled, "not started");
        notStarted.sourceUrl = tasks[i].sourceUrl;
        batch.results[i] = std::move(notStarted);
    }
    return batch;
}

BatchResult Orchestrator::processConcurrent(const std::vector<TransferTask>& tasks) {
    SchedulerOptions options = m_schedulerOptions;
    if (!options.sampler) {
        ResourceMonitor& monitor = m_context.monitor;
        options.sampler = [&monitor] { return monitor.sample(); };
    }
    Scheduler scheduler(std::move(options), &m_context.cancel);

    auto job = [this](const TransferTask& task, size_t) {
        TransferSession session(m_config, m_context.transport, &m_context.ledger,
                                m_context.monitor, &m_context.cancel);
        return runTask(task, session);
    };

    return scheduler.run(tasks, m_config.maxConcurrentDownloads, job);
}

TransferResult Orchestrator::runTask(const TransferTask& task, TransferExecutor& executor) {
    if (m_context.ledger.contains(task.sourceUrl)) {
        LOG_INFO("Skipping {} (already downloaded)", task.sourceUrl);
        return TransferResult::skipped(task.sourceUrl, "already downloaded");
    }

    if (m_config.respectRobots) {
        std::string agent = m_config.userAgents.empty() ? "*" : m_config.userAgents.front();
        if (!m_context.robots.allowed(task.url, agent)) {
            LOG_WARN("Access to {} is denied by robots.txt", task.url);
            TransferResult denied = TransferResult::failed(ErrorKind::RobotsDenied, "denied by robots.txt");
            denied.sourceUrl = task.sourceUrl;
            return denied;
        }
    }

    TransferTask resolved = task;
    if (!task.isResolved()) {
        sites::SiteHandler* handler = m_context.sites.handlerFor(task.url);
        auto location = handler ? handler->resolve(task.url) : std::nullopt;
        if (!location) {
            LOG_ERROR("Could not resolve a download URL for {}", task.url);
            TransferResult unresolved = TransferResult::failed(ErrorKind::ResolutionFailed, "could not resolve download URL");
            unresolved.sourceUrl = task.sourceUrl;
            return unresolved;
        }
        resolved = task.resolvedTo(location->url, location->size);
    }

    RetryController retry(executor, m_config.retryBaseDelay, m_config.retryDelayIncrement, &m_context.cancel);
    return retry.transferWithRetry(resolved, m_config.maxRetries);
}

void Orchestrator::prepareDirectories(const std::vector<TransferTask>& tasks) const {
    std::set<std::string> directories;
    for (const auto& task : tasks) {
        directories.insert(task.destDir.empty() ? std::string(".") : task.destDir);
    }
    for (const auto& dir : directories) {
        if (!FileUtils::createDirectories(dir)) {
            throw EngineError("Cannot create download directory " + dir);
        }
    }
}

void Orchestrator::logReport(const BatchResult& result) const {
    LOG_INFO("Downloaded: {} | Skipped: {} | Failed: {}", result.successCount, result.skippedCount,
             result.errorCount);
    if (result.notStarted > 0) {
        LOG_INFO("Not started: {}", result.notStarted);
    }
    LOG_INFO("Total downloaded: {}", StringUtils::formatBytes(result.totalBytes));

    double average = result.averageThroughput();
    if (average > 0.0) {
        LOG_INFO("Average download speed: {}", StringUtils::formatRate(average));
    }

    if (result.success()) {
        LOG_INFO("All downloads completed successfully");
    } else {
        LOG_WARN("Completed with {} errors", result.errorCount);
    }
}

} // namespace lockerfetch::core::downloader
