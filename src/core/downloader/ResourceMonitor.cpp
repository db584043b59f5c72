/**
 * ResourceMonitor.cpp
 */

#include "ResourceMonitor.hpp"
#include "../Logger.hpp"
#include "../../utils/HttpClient.hpp"
#include "../../utils/StringUtils.hpp"

#include <algorithm>
#include <chrono>
#include <cmath>
#include <thread>

namespace lockerfetch::core::downloader {

using utils::PlatformUtils;
using utils::StringUtils;

namespace {

constexpr double kKiB = 1024.0;
constexpr double kMiB = 1024.0 * 1024.0;

constexpr double kSlowLimit = 256 * kKiB;
constexpr double kMediumLimit = 1 * kMiB;
constexpr double kFastLimit = 5 * kMiB;

double lerp(double from, double to, double t) {
    t = std::clamp(t, 0.0, 1.0);
    return from + (to - from) * t;
}

} // namespace

SpeedTier classifySpeed(double bytesPerSecond) {
    if (bytesPerSecond < kSlowLimit) return SpeedTier::Slow;
    if (bytesPerSecond < kMediumLimit) return SpeedTier::Medium;
    if (bytesPerSecond <= kFastLimit) return SpeedTier::Normal;
    return SpeedTier::Fast;
}

// -- ChunkSizing --

size_t ChunkSizing::forThroughput(std::optional<double> bytesPerSecond) {
    if (!bytesPerSecond || *bytesPerSecond <= 0.0) {
        return kDefaultChunk;
    }

    double speed = *bytesPerSecond;
    double size = 0.0;
    switch (classifySpeed(speed)) {
        case SpeedTier::Slow:
            size = static_cast<double>(kMinChunk);
            break;
        case SpeedTier::Medium:
            size = lerp(static_cast<double>(kMinChunk), 1 * kMiB,
                        (speed - kSlowLimit) / (kMediumLimit - kSlowLimit));
            break;
        case SpeedTier::Normal:
            size = lerp(1 * kMiB, 4 * kMiB,
                        (speed - kMediumLimit) / (kFastLimit - kMediumLimit));
            break;
        case SpeedTier::Fast:
            size = static_cast<double>(kMaxChunk);
            break;
    }
    return clamp(static_cast<size_t>(size));
}

size_t ChunkSizing::blend(size_t current, size_t target, double weight) {
    weight = std::clamp(weight, 0.0, 1.0);
    double blended = weight * static_cast<double>(target)
                   + (1.0 - weight) * static_cast<double>(current);
    return clamp(static_cast<size_t>(std::llround(blended)));
}

size_t ChunkSizing::clamp(size_t size) {
    return std::clamp(size, kMinChunk, kMaxChunk);
}

// -- ThroughputEstimator --

std::optional<double> ThroughputEstimator::update(int64_t bytes, double seconds) {
    if (bytes <= 0 || seconds <= 0.0) {
        return m_value;
    }
    double measured = static_cast<double>(bytes) / seconds;
    if (m_value) {
        m_value = m_weight * measured + (1.0 - m_weight) * *m_value;
    } else {
        m_value = measured;
    }
    return m_value;
}

void ThroughputEstimator::seed(double bytesPerSecond) {
    if (bytesPerSecond > 0.0) {
        m_value = bytesPerSecond;
    }
}

// -- ResourceMonitor --

ResourceMonitor& ResourceMonitor::instance() {
    static ResourceMonitor monitor;
    return monitor;
}

ResourceSample ResourceMonitor::sample() {
    ResourceSample s;

    int64_t total = PlatformUtils::getTotalMemory();
    int64_t available = PlatformUtils::getAvailableMemory();
    if (total > 0 && available >= 0) {
        s.memoryPercent = 100.0 * static_cast<double>(total - available) / static_cast<double>(total);
    }

    s.processRss = PlatformUtils::getProcessResidentMemory();
    s.coreCount = std::max(1, PlatformUtils::getCPUCores());

    {
        std::lock_guard<std::mutex> lock(m_cpuMutex);
        if (!m_lastCpu.valid) {
            m_lastCpu = PlatformUtils::readCpuTimes();
            std::this_thread::sleep_for(std::chrono::milliseconds(100));
        }
        utils::CpuTimes now = PlatformUtils::readCpuTimes();
        s.cpuPercent = PlatformUtils::cpuUsageBetween(m_lastCpu, now);
        if (now.valid) {
            m_lastCpu = now;
        }
    }

    double throughput = m_lastThroughput.load();
    if (throughput > 0.0) {
        s.throughput = throughput;
    }

    return s;
}

std::optional<double> ResourceMonitor::measureConnectionSpeed(utils::HttpTransport& transport,
                                                              const std::string& probeUrl,
                                                              int64_t probeBytes,
                                                              const utils::HttpOptions& options,
                                                              const CancellationToken* cancel) {
    if (probeBytes <= 0) {
        return std::nullopt;
    }

    utils::HttpOptions probeOptions = options;
    probeOptions.headers["Range"] = "bytes=0-" + std::to_string(probeBytes - 1);

    int64_t received = 0;
    auto onHead = [](const utils::ResponseHead& head) {
        return head.statusCode == 200 || head.statusCode == 206;
    };
    auto onData = [&](const char*, size_t size) {
        if (cancel && cancel->isCancelled()) return false;
        received += static_cast<int64_t>(size);
        // Servers that ignore Range would send the whole file
        return received < probeBytes;
    };

    auto start = std::chrono::steady_clock::now();
    utils::StreamResult result = transport.stream(probeUrl, probeOptions, onHead, onData);
    double elapsed = std::chrono::duration<double>(std::chrono::steady_clock::now() - start).count();

    bool truncatedByUs = result.transportError == utils::TransportError::Aborted && received >= probeBytes;
    if ((result.transportError != utils::TransportError::None && !truncatedByUs) || received == 0) {
        LOG_DEBUG("Speed probe failed for {}: status {}", probeUrl, result.head.statusCode);
        return std::nullopt;
    }
    if (elapsed <= 0.0) {
        return std::nullopt;
    }

    double speed = static_cast<double>(received) / elapsed;
    LOG_DEBUG("Speed probe: {} in {:.2f}s ({})", StringUtils::formatBytes(received), elapsed,
              StringUtils::formatRate(speed));
    reportThroughput(speed);
    return speed;
}

void ResourceMonitor::reportThroughput(double bytesPerSecond) {
    if (bytesPerSecond > 0.0) {
        m_lastThroughput.store(bytesPerSecond);
    }
}

bool ResourceMonitor::reclaimMemory() {
    bool released = PlatformUtils::releaseFreeMemory();
    LOG_DEBUG("Memory reclaim {}", released ? "performed" : "not available");
    return released;
}

int ResourceMonitor::recommendWorkerCount(const ResourceSample& sample, const WorkerLoad& load) {
    int minWorkers = std::max(1, load.min);
    int maxWorkers = std::max(minWorkers, load.max);

    double optimal = std::floor(std::max(1, sample.coreCount) * 0.75);
    optimal = std::max(optimal, 1.0);

    if (sample.cpuPercent >= 95.0) {
        optimal *= 0.4;
    } else if (sample.cpuPercent >= 80.0) {
        optimal *= 0.6;
    }

    double warn = load.memoryWarningPercent;
    if (sample.memoryPercent > warn && warn < 100.0) {
        double factor = 1.0 - 0.7 * (sample.memoryPercent - warn) / (100.0 - warn);
        optimal *= std::max(0.3, factor);
    }

    if (sample.throughput) {
        switch (classifySpeed(*sample.throughput)) {
            case SpeedTier::Slow:   optimal *= 0.5; break;
            case SpeedTier::Medium: optimal *= 0.8; break;
            case SpeedTier::Fast:   optimal *= 1.2; break;
            case SpeedTier::Normal: break;
        }
    }

    if (load.consecutiveErrors > 0) {
        optimal *= std::max(0.3, 1.0 - 0.15 * load.consecutiveErrors);
    }

    if (load.successRate < 0.8) {
        optimal *= std::max(0.5, load.successRate / 0.8);
    }

    int target = std::clamp(static_cast<int>(std::floor(optimal)), minWorkers, maxWorkers);

    bool heavyDegradation = load.consecutiveErrors >= 3 || load.successRate < 0.5;
    int recommended = load.current;
    if (target > load.current) {
        recommended = std::min(target, load.current + 2);
    } else if (target < load.current) {
        recommended = heavyDegradation ? target : std::max(target, load.current - 1);
    }

    return std::clamp(recommended, minWorkers, maxWorkers);
}

} // namespace lockerfetch::core::downloader
