#pragma once

/**
 * TransferSession.hpp
 * 
 * One resumable, adaptively chunked file transfer at a time.
 */

#include "TransferTask.hpp"
#include "ResourceMonitor.hpp"
#include "../CancellationToken.hpp"
#include "../EngineConfig.hpp"

#include <filesystem>
#include <functional>
#include <optional>
#include <random>
#include <string>

namespace lockerfetch::utils { class HttpTransport; struct HttpOptions; struct ResponseHead; }

namespace lockerfetch::core::downloader {

class DownloadLedger;

/**
 * Anything that can carry out a single transfer attempt
 */
class TransferExecutor {
public:
    virtual ~TransferExecutor() = default;

    virtual TransferResult transfer(const TransferTask& task) = 0;
};

/**
 * Size announced by a response
 */
struct ContentRange {
    int64_t start{-1};
    int64_t end{-1};
    int64_t total{-1};      // -1 for "*"
};

/**
 * TransferSession
 * 
 * Streams task.url into <destDir>/<name>.part, resuming from the existing
 * partial file when the server honours Range, and publishes the file with
 * fsync + rename once the size checks out. Throughput estimation and the
 * working chunk size carry over between the tasks of one session.
 * 
 * A session is not thread-safe; the scheduler creates one per task.
 */
class TransferSession : public TransferExecutor {
public:
    using Sampler = std::function<ResourceSample()>;
    using Reclaimer = std::function<bool()>;

    /**
     * @param config Engine settings (delays, user agents, thresholds)
     * @param transport Shared HTTP transport
     * @param ledger Ledger updated after a successful publish (may be null)
     * @param monitor Resource monitor used for probing and memory checks
     * @param cancel Batch cancellation token (may be null)
     */
    TransferSession(const EngineConfig& config,
                    utils::HttpTransport& transport,
                    DownloadLedger* ledger,
                    ResourceMonitor& monitor,
                    const CancellationToken* cancel = nullptr);

    TransferSession(const TransferSession&) = delete;
    TransferSession& operator=(const TransferSession&) = delete;

    TransferResult transfer(const TransferTask& task) override;

    /**
     * Replace the memory sampler (defaults to monitor.sample())
     */
    void setSampler(Sampler sampler) { m_sampler = std::move(sampler); }

    /**
     * Replace the memory reclaim hint (defaults to monitor.reclaimMemory())
     */
    void setReclaimer(Reclaimer reclaimer) { m_reclaimer = std::move(reclaimer); }

    size_t chunkSize() const { return m_chunkSize; }
    std::optional<double> estimatedThroughput() const { return m_estimator.value(); }

    /**
     * Final file name for a task: explicit name, URL basename or
     * "unnamed_file", with characters illegal in file names replaced
     */
    static std::string fileNameFor(const TransferTask& task);

    static std::optional<ContentRange> parseContentRange(const std::string& value);

    /**
     * Expected final size of the file
     * @param head Response head
     * @param offset Bytes already on disk when the request was made
     * @param declared Size declared by the task (-1 = unknown)
     * @return Size in bytes, -1 when unknown
     */
    static int64_t resolveExpectedSize(const utils::ResponseHead& head, int64_t offset, int64_t declared);

private:
    struct Attempt;

    Attempt streamOnce(const TransferTask& task, const std::filesystem::path& partPath);
    void probeConnection(const std::string& url);
    utils::HttpOptions requestOptions(int64_t offset);
    bool politenessDelay();
    void onChunkWritten(size_t bytes);
    void reclaimMemory();
    bool isMaintenanceUrl(const std::string& url) const;
    bool cancelled() const { return m_cancel && m_cancel->isCancelled(); }

private:
    const EngineConfig& m_config;
    utils::HttpTransport& m_transport;
    DownloadLedger* m_ledger;
    ResourceMonitor& m_monitor;
    const CancellationToken* m_cancel;
    Sampler m_sampler;
    Reclaimer m_reclaimer;

    std::mt19937 m_rng;
    ThroughputEstimator m_estimator;
    bool m_probed{false};
    size_t m_chunkSize{ChunkSizing::kDefaultChunk};

    // Recalculation window
    uint64_t m_chunkCount{0};
    int64_t m_windowBytes{0};
    std::chrono::steady_clock::time_point m_windowStart;
};

} // namespace lockerfetch::core::downloader
