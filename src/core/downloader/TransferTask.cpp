/**
 * TransferTask.cpp
 */

#include "TransferTask.hpp"
#include "../../utils/StringUtils.hpp"

#include <sstream>

namespace lockerfetch::core::downloader {

using utils::StringUtils;

const char* toString(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::None:                return "None";
        case ErrorKind::NetworkError:        return "NetworkError";
        case ErrorKind::Timeout:             return "Timeout";
        case ErrorKind::Http:                return "Http";
        case ErrorKind::RangeNotSatisfiable: return "RangeNotSatisfiable";
        case ErrorKind::SizeMismatch:        return "SizeMismatch";
        case ErrorKind::RobotsDenied:        return "RobotsDenied";
        case ErrorKind::Maintenance:         return "Maintenance";
        case ErrorKind::ResolutionFailed:    return "ResolutionFailed";
        case ErrorKind::IoError:             return "IoError";
        case ErrorKind::Cancelled:           return "Cancelled";
    }
    return "Unknown";
}

bool isRetryable(ErrorKind kind, int httpStatus) {
    switch (kind) {
        case ErrorKind::NetworkError:
        case ErrorKind::Timeout:
        case ErrorKind::Maintenance:
        case ErrorKind::RangeNotSatisfiable:
            return true;
        case ErrorKind::Http:
            return httpStatus == 429 || httpStatus >= 500;
        default:
            return false;
    }
}

const char* toString(Outcome outcome) {
    switch (outcome) {
        case Outcome::Success: return "Success";
        case Outcome::Skipped: return "Skipped";
        case Outcome::Failed:  return "Failed";
    }
    return "Unknown";
}

// -- TransferResult --

std::string TransferResult::describe() const {
    if (outcome != Outcome::Failed) {
        return toString(outcome);
    }
    std::string text = std::string("Failed(") + toString(error);
    if (error == ErrorKind::Http) {
        text += " " + std::to_string(httpStatus);
    }
    return text + ")";
}

TransferResult TransferResult::success(const std::string& path, int64_t bytes,
                                       std::chrono::milliseconds duration, size_t finalChunkSize) {
    TransferResult result;
    result.outcome = Outcome::Success;
    result.path = path;
    result.bytes = bytes;
    result.duration = duration;
    result.finalChunkSize = finalChunkSize;
    if (duration.count() > 0) {
        result.throughput = static_cast<double>(bytes) * 1000.0 / static_cast<double>(duration.count());
    }
    return result;
}

TransferResult TransferResult::skipped(const std::string& sourceUrl, const std::string& reason) {
    TransferResult result;
    result.outcome = Outcome::Skipped;
    result.sourceUrl = sourceUrl;
    result.message = reason;
    return result;
}

TransferResult TransferResult::failed(ErrorKind kind, const std::string& message, int httpStatus) {
    TransferResult result;
    result.outcome = Outcome::Failed;
    result.error = kind;
    result.httpStatus = httpStatus;
    result.message = message;
    return result;
}

// -- BatchResult --

double BatchResult::averageThroughput() const {
    if (totalTime.count() <= 100) {
        return 0.0;
    }
    return static_cast<double>(totalBytes) * 1000.0 / static_cast<double>(totalTime.count());
}

void BatchResult::record(const TransferResult& result) {
    switch (result.outcome) {
        case Outcome::Success:
            ++successCount;
            totalBytes += result.bytes;
            totalTime += result.duration;
            break;
        case Outcome::Skipped:
            ++skippedCount;
            break;
        case Outcome::Failed:
            ++errorCount;
            break;
    }
}

std::string BatchResult::summary() const {
    std::ostringstream out;
    out << successCount << " downloaded, " << skippedCount << " skipped, "
        << errorCount << " failed";
    if (notStarted > 0) {
        out << ", " << notStarted << " not started";
    }
    out << " | " << StringUtils::formatBytes(totalBytes);

    double average = averageThroughput();
    if (average > 0.0) {
        out << " at " << StringUtils::formatRate(average) << " average";
    }
    return out.str();
}

nlohmann::json BatchResult::toJson() const {
    nlohmann::json files = nlohmann::json::array();
    for (const auto& result : results) {
        nlohmann::json entry = {
            {"source", result.sourceUrl},
            {"outcome", toString(result.outcome)},
            {"attempts", result.attempts}
        };
        if (!result.path.empty()) entry["path"] = result.path;
        if (result.isSuccess()) {
            entry["bytes"] = result.bytes;
            entry["durationMs"] = result.duration.count();
            entry["throughput"] = result.throughput;
            entry["finalChunkSize"] = result.finalChunkSize;
        }
        if (result.isFailed()) {
            entry["error"] = toString(result.error);
            if (result.httpStatus != 0) entry["httpStatus"] = result.httpStatus;
        }
        if (!result.message.empty()) entry["message"] = result.message;
        files.push_back(std::move(entry));
    }

    return {
        {"success", success()},
        {"successCount", successCount},
        {"errorCount", errorCount},
        {"skippedCount", skippedCount},
        {"notStarted", notStarted},
        {"totalBytes", totalBytes},
        {"totalTimeMs", totalTime.count()},
        {"averageThroughput", averageThroughput()},
        {"peakInFlight", peakInFlight},
        {"finalWorkerTarget", finalWorkerTarget},
        {"reductions", reductions},
        {"files", std::move(files)}
    };
}

} // namespace lockerfetch::core::downloader
