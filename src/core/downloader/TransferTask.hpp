#pragma once

/**
 * TransferTask.hpp
 * 
 * Value types flowing through the download engine: the task to fetch,
 * the per-task result and the aggregated batch result.
 */

#include <nlohmann/json.hpp>

#include <chrono>
#include <cstdint>
#include <string>
#include <vector>

namespace lockerfetch::core::downloader {

/**
 * TransferTask - one file to fetch
 * 
 * sourceUrl is the page the user asked for and the ledger key; url is the
 * address actually fetched. Both are equal until the task is resolved.
 */
struct TransferTask {
    std::string sourceUrl;
    std::string url;
    std::string destDir;
    std::string fileName;           // empty = derive from url
    int64_t expectedSize{-1};       // -1 = unknown

    TransferTask() = default;

    TransferTask(std::string url_, std::string destDir_,
                 std::string fileName_ = {}, int64_t expectedSize_ = -1)
        : sourceUrl(url_)
        , url(std::move(url_))
        , destDir(std::move(destDir_))
        , fileName(std::move(fileName_))
        , expectedSize(expectedSize_) {}

    /**
     * Copy of this task pointing at a resolved download URL
     * @param resolvedUrl Direct file URL
     * @param size Size reported by the resolver (-1 keeps the declared size)
     */
    TransferTask resolvedTo(const std::string& resolvedUrl, int64_t size = -1) const {
        TransferTask task = *this;
        task.url = resolvedUrl;
        if (size >= 0) task.expectedSize = size;
        return task;
    }

    bool isResolved() const { return url != sourceUrl; }
};

/**
 * Failure taxonomy
 */
enum class ErrorKind {
    None,
    NetworkError,
    Timeout,
    Http,                   // see TransferResult::httpStatus
    RangeNotSatisfiable,
    SizeMismatch,
    RobotsDenied,
    Maintenance,
    ResolutionFailed,
    IoError,
    Cancelled
};

const char* toString(ErrorKind kind);

/**
 * Whether another attempt may succeed
 * @param kind Failure kind
 * @param httpStatus Status code, only consulted for ErrorKind::Http
 */
bool isRetryable(ErrorKind kind, int httpStatus = 0);

enum class Outcome {
    Success,
    Skipped,
    Failed
};

const char* toString(Outcome outcome);

/**
 * TransferResult - exactly one per task
 */
struct TransferResult {
    Outcome outcome{Outcome::Failed};
    ErrorKind error{ErrorKind::None};
    int httpStatus{0};

    // Success details
    int64_t bytes{0};
    std::chrono::milliseconds duration{0};
    double throughput{0.0};         // bytes/s
    size_t finalChunkSize{0};

    std::string sourceUrl;
    std::string path;
    int attempts{0};
    std::string message;

    bool isSuccess() const { return outcome == Outcome::Success; }
    bool isSkipped() const { return outcome == Outcome::Skipped; }
    bool isFailed() const { return outcome == Outcome::Failed; }
    bool isRetryable() const { return isFailed() && downloader::isRetryable(error, httpStatus); }

    /**
     * Short description, e.g. "Failed(Http 404)"
     */
    std::string describe() const;

    static TransferResult success(const std::string& path, int64_t bytes,
                                  std::chrono::milliseconds duration, size_t finalChunkSize);
    static TransferResult skipped(const std::string& sourceUrl, const std::string& reason);
    static TransferResult failed(ErrorKind kind, const std::string& message, int httpStatus = 0);
};

/**
 * BatchResult - aggregate of one engine run
 */
struct BatchResult {
    size_t successCount{0};
    size_t errorCount{0};
    size_t skippedCount{0};
    size_t notStarted{0};
    int64_t totalBytes{0};
    std::chrono::milliseconds totalTime{0};

    size_t peakInFlight{0};
    int finalWorkerTarget{0};
    int reductions{0};

    std::vector<TransferResult> results;    // input order

    bool success() const { return errorCount == 0; }
    size_t total() const { return successCount + errorCount + skippedCount + notStarted; }

    /**
     * totalBytes / totalTime, or 0 when the batch ran for 0.1 s or less
     */
    double averageThroughput() const;

    /**
     * Fold one finished task into the counters
     */
    void record(const TransferResult& result);

    std::string summary() const;
    nlohmann::json toJson() const;
};

} // namespace lockerfetch::core::downloader
