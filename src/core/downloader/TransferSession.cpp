/**
 * TransferSession.cpp
 */

#include "TransferSession.hpp"
#include "Ledger.hpp"
#include "../Logger.hpp"
#include "../../utils/FileUtils.hpp"
#include "../../utils/HttpClient.hpp"
#include "../../utils/StringUtils.hpp"
#include "../../utils/UrlUtils.hpp"

#include <algorithm>
#include <thread>
#include <vector>

namespace lockerfetch::core::downloader {

using utils::FileUtils;
using utils::PartFile;
using utils::StringUtils;
using utils::UrlUtils;

namespace fs = std::filesystem;

/**
 * Outcome of a single request
 */
struct TransferSession::Attempt {
    bool ok{false};
    bool rangeRejected{false};      // 416 or a Content-Range that does not start at the offset
    ErrorKind error{ErrorKind::None};
    int httpStatus{0};
    std::string message;
    int64_t written{0};
    int64_t expectedSize{-1};
};

TransferSession::TransferSession(const EngineConfig& config,
                                 utils::HttpTransport& transport,
                                 DownloadLedger* ledger,
                                 ResourceMonitor& monitor,
                                 const CancellationToken* cancel)
    : m_config(config)
    , m_transport(transport)
    , m_ledger(ledger)
    , m_monitor(monitor)
    , m_cancel(cancel)
    , m_sampler([&monitor] { return monitor.sample(); })
    , m_reclaimer([&monitor] { return monitor.reclaimMemory(); })
    , m_rng(std::random_device{}())
    , m_estimator(config.smoothingWeight)
    , m_windowStart(std::chrono::steady_clock::now()) {}

std::string TransferSession::fileNameFor(const TransferTask& task) {
    std::string name = StringUtils::trim(task.fileName);
    if (name.empty()) {
        name = UrlUtils::fileName(UrlUtils::ensureScheme(task.url));
    }
    if (name.empty()) {
        name = "unnamed_file";
    }
    return StringUtils::sanitizeFileName(name);
}

std::optional<ContentRange> TransferSession::parseContentRange(const std::string& value) {
    // bytes <start>-<end>/<total|*>
    std::string text = StringUtils::trim(value);
    if (!StringUtils::startsWith(StringUtils::toLower(text), "bytes")) {
        return std::nullopt;
    }
    text = StringUtils::trim(text.substr(5));

    auto slash = text.find('/');
    if (slash == std::string::npos) {
        return std::nullopt;
    }

    ContentRange range;
    std::string span = text.substr(0, slash);
    std::string total = StringUtils::trim(text.substr(slash + 1));

    auto dash = span.find('-');
    if (dash != std::string::npos) {
        range.start = StringUtils::parseLong(span.substr(0, dash), -1);
        range.end = StringUtils::parseLong(span.substr(dash + 1), -1);
    }
    if (total != "*") {
        range.total = StringUtils::parseLong(total, -1);
    }
    return range;
}

int64_t TransferSession::resolveExpectedSize(const utils::ResponseHead& head, int64_t offset, int64_t declared) {
    auto contentLength = head.header("content-length");
    int64_t length = contentLength ? StringUtils::parseLong(*contentLength, -1) : -1;

    if (head.statusCode == 206) {
        if (auto contentRange = head.header("content-range")) {
            auto range = parseContentRange(*contentRange);
            if (range && range->total >= 0) {
                return range->total;
            }
        }
        if (length >= 0) {
            return offset + length;
        }
    } else if (head.statusCode == 200 && length >= 0) {
        return length;
    }
    return declared;
}

TransferResult TransferSession::transfer(const TransferTask& task) {
    std::string name = fileNameFor(task);
    fs::path destDir = task.destDir.empty() ? fs::path(".") : fs::path(task.destDir);
    fs::path finalPath = destDir / name;
    fs::path partPath = FileUtils::partPathFor(finalPath);

    auto fail = [&](ErrorKind kind, const std::string& message, int status = 0) {
        TransferResult result = TransferResult::failed(kind, message, status);
        result.sourceUrl = task.sourceUrl;
        result.path = finalPath.string();
        result.finalChunkSize = m_chunkSize;
        return result;
    };

    if (!FileUtils::createDirectories(destDir)) {
        return fail(ErrorKind::IoError, "cannot create directory " + destDir.string());
    }

    if (!m_probed) {
        m_probed = true;
        probeConnection(task.url);
    }

    auto start = std::chrono::steady_clock::now();
    int restarts = 0;
    Attempt attempt;

    while (true) {
        if (cancelled()) {
            return fail(ErrorKind::Cancelled, "cancelled");
        }

        attempt = streamOnce(task, partPath);
        if (!attempt.rangeRejected) {
            break;
        }

        if (restarts >= 1) {
            return fail(ErrorKind::RangeNotSatisfiable, "range rejected after restart", attempt.httpStatus);
        }
        ++restarts;
        LOG_WARN("Range rejected for {}, restarting from zero", name);
        if (FileUtils::fileExists(partPath) && !FileUtils::deleteFile(partPath)) {
            return fail(ErrorKind::IoError, "cannot delete " + partPath.string());
        }
    }

    if (!attempt.ok) {
        return fail(attempt.error, attempt.message, attempt.httpStatus);
    }

    int64_t finalSize = FileUtils::getFileSize(partPath);
    if (attempt.expectedSize >= 0 && finalSize != attempt.expectedSize) {
        LOG_ERROR("Size mismatch for {}: expected {}, got {}", name, attempt.expectedSize, finalSize);
        return fail(ErrorKind::SizeMismatch,
                    "expected " + std::to_string(attempt.expectedSize) + " bytes, got " + std::to_string(finalSize));
    }

    if (!FileUtils::moveFile(partPath, finalPath)) {
        return fail(ErrorKind::IoError, "cannot rename " + partPath.string());
    }

    if (m_ledger && !m_ledger->markDownloaded(task.sourceUrl)) {
        LOG_WARN("Downloaded {} but could not record it in the ledger", name);
    }

    auto duration = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - start);
    TransferResult result = TransferResult::success(finalPath.string(), attempt.written, duration, m_chunkSize);
    result.sourceUrl = task.sourceUrl;
    result.httpStatus = attempt.httpStatus;

    LOG_INFO("Downloaded {} ({} in {}, {})", name, StringUtils::formatBytes(finalSize),
             StringUtils::formatDuration(duration), StringUtils::formatRate(result.throughput));
    return result;
}

TransferSession::Attempt TransferSession::streamOnce(const TransferTask& task, const fs::path& partPath) {
    Attempt attempt;

    int64_t offset = std::max<int64_t>(0, FileUtils::getFileSize(partPath));

    if (!politenessDelay()) {
        attempt.error = ErrorKind::Cancelled;
        attempt.message = "cancelled";
        return attempt;
    }

    utils::HttpOptions options = requestOptions(offset);
    m_windowStart = std::chrono::steady_clock::now();
    m_windowBytes = 0;

    PartFile part;
    std::vector<char> buffer;
    buffer.reserve(m_chunkSize);
    bool failed = false;

    auto setFailure = [&](ErrorKind kind, const std::string& message, int status = 0) {
        failed = true;
        attempt.error = kind;
        attempt.message = message;
        if (status != 0) attempt.httpStatus = status;
    };

    auto flush = [&]() -> bool {
        if (buffer.empty()) return true;
        if (!part.write(buffer.data(), buffer.size())) {
            setFailure(ErrorKind::IoError, "write failed: " + part.lastError());
            return false;
        }
        attempt.written += static_cast<int64_t>(buffer.size());
        onChunkWritten(buffer.size());
        buffer.clear();
        return true;
    };

    auto onHead = [&](const utils::ResponseHead& head) -> bool {
        attempt.httpStatus = head.statusCode;

        if (isMaintenanceUrl(head.effectiveUrl)) {
            setFailure(ErrorKind::Maintenance, "server is under maintenance");
            return false;
        }

        if (head.statusCode == 416) {
            attempt.rangeRejected = true;
            setFailure(ErrorKind::RangeNotSatisfiable, "HTTP 416", 416);
            return false;
        }

        PartFile::Mode mode = PartFile::Mode::Truncate;
        if (head.statusCode == 206) {
            if (offset > 0) {
                auto contentRange = head.header("content-range");
                auto range = contentRange ? parseContentRange(*contentRange) : std::nullopt;
                if (range && range->start >= 0 && range->start != offset) {
                    attempt.rangeRejected = true;
                    setFailure(ErrorKind::RangeNotSatisfiable, "range starts at " + std::to_string(range->start), 206);
                    return false;
                }
                mode = PartFile::Mode::Append;
            }
        } else if (head.statusCode == 200) {
            if (offset > 0) {
                LOG_DEBUG("Server ignored Range for {}, starting over", task.url);
                offset = 0;
            }
        } else {
            setFailure(ErrorKind::Http, "HTTP " + std::to_string(head.statusCode), head.statusCode);
            return false;
        }

        attempt.expectedSize = resolveExpectedSize(head, offset, task.expectedSize);
        if (attempt.expectedSize > m_config.largeFileThreshold) {
            LOG_DEBUG("Large file ({}), reclaiming memory first", StringUtils::formatBytes(attempt.expectedSize));
            reclaimMemory();
        }

        if (!part.open(partPath, mode)) {
            setFailure(ErrorKind::IoError, "cannot open " + partPath.string() + ": " + part.lastError());
            return false;
        }
        return true;
    };

    auto onData = [&](const char* data, size_t size) -> bool {
        if (cancelled()) {
            setFailure(ErrorKind::Cancelled, "cancelled");
            return false;
        }
        buffer.insert(buffer.end(), data, data + size);
        if (buffer.size() >= m_chunkSize) {
            return flush();
        }
        return true;
    };

    utils::StreamResult stream = m_transport.stream(task.url, options, onHead, onData);

    // Whatever arrived stays in the .part for the next attempt
    if (part.isOpen()) {
        if (attempt.error != ErrorKind::IoError && !flush()) {
            LOG_ERROR("Could not save received data to {}", partPath.string());
        }
        if (!part.sync() && !failed) {
            setFailure(ErrorKind::IoError, "fsync failed: " + part.lastError());
        }
        part.close();
    }

    if (failed) {
        return attempt;
    }

    switch (stream.transportError) {
        case utils::TransportError::None:
            break;
        case utils::TransportError::Timeout:
            setFailure(ErrorKind::Timeout, stream.error.empty() ? "timed out" : stream.error);
            return attempt;
        case utils::TransportError::Network:
        case utils::TransportError::Aborted:
            setFailure(ErrorKind::NetworkError, stream.error.empty() ? "transfer interrupted" : stream.error);
            return attempt;
    }

    if (!stream.headDelivered) {
        setFailure(ErrorKind::NetworkError, "no response");
        return attempt;
    }

    attempt.ok = true;
    return attempt;
}

void TransferSession::probeConnection(const std::string& url) {
    if (m_config.probeSize <= 0) {
        return;
    }
    auto speed = m_monitor.measureConnectionSpeed(m_transport, url, m_config.probeSize,
                                                  requestOptions(0), m_cancel);
    if (speed) {
        m_estimator.seed(*speed);
        m_chunkSize = ChunkSizing::forThroughput(speed);
        LOG_DEBUG("Initial chunk size {} for {}", StringUtils::formatBytes(static_cast<int64_t>(m_chunkSize)),
                  StringUtils::formatRate(*speed));
    } else {
        m_chunkSize = ChunkSizing::kDefaultChunk;
    }
}

utils::HttpOptions TransferSession::requestOptions(int64_t offset) {
    utils::HttpOptions options;
    options.timeoutSeconds = m_config.timeoutSeconds;
    options.connectTimeoutSeconds = m_config.connectTimeoutSeconds;
    options.maxRedirects = m_config.maxRedirects;
    options.verifySSL = m_config.verifySSL;
    options.proxyUrl = m_config.proxy;

    if (!m_config.userAgents.empty()) {
        std::uniform_int_distribution<size_t> pick(0, m_config.userAgents.size() - 1);
        options.userAgent = m_config.userAgents[pick(m_rng)];
    }
    if (!m_config.referer.empty()) {
        options.headers["Referer"] = m_config.referer;
    }
    if (offset > 0) {
        options.headers["Range"] = "bytes=" + std::to_string(offset) + "-";
    }
    return options;
}

bool TransferSession::politenessDelay() {
    if (m_config.maxDelay <= 0.0) {
        return !cancelled();
    }
    std::uniform_real_distribution<double> delay(m_config.minDelay, m_config.maxDelay);
    auto wait = EngineConfig::toMillis(delay(m_rng));
    if (m_cancel) {
        return m_cancel->waitFor(wait);
    }
    std::this_thread::sleep_for(wait);
    return true;
}

void TransferSession::onChunkWritten(size_t bytes) {
    ++m_chunkCount;
    m_windowBytes += static_cast<int64_t>(bytes);

    if (m_chunkCount % static_cast<uint64_t>(m_config.chunkRecalcInterval) == 0) {
        auto now = std::chrono::steady_clock::now();
        double seconds = std::chrono::duration<double>(now - m_windowStart).count();
        auto estimate = m_estimator.update(m_windowBytes, seconds);
        if (estimate) {
            size_t target = ChunkSizing::forThroughput(estimate);
            m_chunkSize = ChunkSizing::blend(m_chunkSize, target, m_config.smoothingWeight);
            m_monitor.reportThroughput(*estimate);
        }
        m_windowBytes = 0;
        m_windowStart = now;
    }

    if (m_chunkCount % static_cast<uint64_t>(m_config.memoryCheckInterval) == 0 && m_sampler) {
        ResourceSample sample = m_sampler();
        if (sample.memoryPercent > m_config.memoryWarningPercent) {
            LOG_WARN("Memory usage at {:.1f}%, reclaiming", sample.memoryPercent);
            reclaimMemory();
        }
    }
}

void TransferSession::reclaimMemory() {
    if (m_reclaimer && !m_reclaimer()) {
        LOG_DEBUG("Memory reclaim had no effect");
    }
}

bool TransferSession::isMaintenanceUrl(const std::string& url) const {
    if (url.empty()) return false;
    return std::find(m_config.maintenanceUrls.begin(), m_config.maintenanceUrls.end(), url)
        != m_config.maintenanceUrls.end();
}

} // namespace lockerfetch::core::downloader
