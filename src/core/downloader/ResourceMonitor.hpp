#pragma once

/**
 * ResourceMonitor.hpp
 * 
 * System resource sampling, connection speed probing and the
 * heuristics derived from them: worker count recommendation and
 * adaptive chunk sizing.
 */

#include "../CancellationToken.hpp"
#include "../../utils/PlatformUtils.hpp"

#include <atomic>
#include <cstdint>
#include <mutex>
#include <optional>
#include <string>

namespace lockerfetch::utils { class HttpTransport; struct HttpOptions; }

namespace lockerfetch::core::downloader {

/**
 * One immutable snapshot of the machine
 */
struct ResourceSample {
    double memoryPercent{0.0};          // system memory in use, 0-100
    int64_t processRss{0};              // bytes
    double cpuPercent{0.0};             // system-wide, 0-100
    int coreCount{1};
    std::optional<double> throughput;   // last measured bytes/s
};

/**
 * Connection speed classes used by the heuristics
 */
enum class SpeedTier {
    Slow,       // < 256 KiB/s
    Medium,     // 256 KiB/s - 1 MiB/s
    Normal,     // 1 - 5 MiB/s
    Fast        // > 5 MiB/s
};

SpeedTier classifySpeed(double bytesPerSecond);

/**
 * Chunk sizing helpers
 */
struct ChunkSizing {
    static constexpr size_t kMinChunk = 64 * 1024;
    static constexpr size_t kMaxChunk = 4 * 1024 * 1024;
    static constexpr size_t kDefaultChunk = 1024 * 1024;

    /**
     * Target chunk size for a throughput
     * @param bytesPerSecond Measured throughput, nullopt when unknown
     * @return Size in [kMinChunk, kMaxChunk]
     */
    static size_t forThroughput(std::optional<double> bytesPerSecond);

    /**
     * Move the working chunk size toward a target
     * @param current Working size
     * @param target Size suggested by the latest throughput
     * @param weight Share of the target in the result
     * @return Blended size clamped to [kMinChunk, kMaxChunk]
     */
    static size_t blend(size_t current, size_t target, double weight);

    static size_t clamp(size_t size);
};

/**
 * Exponential moving average of throughput
 * 
 * Owned by a single transfer session; not thread-safe.
 */
class ThroughputEstimator {
public:
    explicit ThroughputEstimator(double weight = 0.3) : m_weight(weight) {}

    /**
     * Fold a new measurement into the average
     * @param bytes Bytes moved during the window
     * @param seconds Window length
     * @return Current average
     */
    std::optional<double> update(int64_t bytes, double seconds);

    void seed(double bytesPerSecond);

    std::optional<double> value() const { return m_value; }
    double weight() const { return m_weight; }

private:
    double m_weight;
    std::optional<double> m_value;
};

/**
 * Inputs for recommendWorkerCount besides the sample
 */
struct WorkerLoad {
    int current{1};
    int max{1};
    int min{1};
    int consecutiveErrors{0};
    double successRate{1.0};
    double memoryWarningPercent{80.0};
};

/**
 * ResourceMonitor
 * 
 * Reads /proc on Linux. sample() is safe to call from any thread; the CPU
 * percentage is the load since the previous call.
 */
class ResourceMonitor {
public:
    ResourceMonitor() = default;

    ResourceMonitor(const ResourceMonitor&) = delete;
    ResourceMonitor& operator=(const ResourceMonitor&) = delete;

    /**
     * Process-wide monitor shared by the scheduler and the sessions
     */
    static ResourceMonitor& instance();

    ResourceSample sample();

    /**
     * Time a small ranged download
     * @param transport HTTP transport to use
     * @param probeUrl File to probe
     * @param probeBytes Number of bytes to request
     * @param options Request options (user agent, referer, proxy)
     * @param cancel Aborts the probe when set
     * @return Bytes per second, nullopt on any failure
     */
    std::optional<double> measureConnectionSpeed(utils::HttpTransport& transport,
                                                 const std::string& probeUrl,
                                                 int64_t probeBytes,
                                                 const utils::HttpOptions& options,
                                                 const CancellationToken* cancel = nullptr);

    /**
     * Publish a throughput measurement so later samples carry it
     */
    void reportThroughput(double bytesPerSecond);

    /**
     * Ask the allocator to return free memory to the OS
     * @return true if a reclaim was performed
     */
    bool reclaimMemory();

    /**
     * Worker count suited to the current load
     * 
     * Starts at 75% of the cores, scales down for CPU, memory, slow
     * links, error streaks and low success rates, and up for fast links.
     * Increases are limited to +2 and decreases to -1 per call unless
     * the batch is degrading heavily.
     */
    static int recommendWorkerCount(const ResourceSample& sample, const WorkerLoad& load);

private:
    std::mutex m_cpuMutex;
    utils::CpuTimes m_lastCpu;
    std::atomic<double> m_lastThroughput{-1.0};
};

} // namespace lockerfetch::core::downloader
