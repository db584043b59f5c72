#pragma once

/**
 * EngineConfig.hpp
 * 
 * Immutable settings snapshot handed to the download engine.
 */

#include <cstdint>
#include <chrono>
#include <optional>
#include <string>
#include <vector>

namespace lockerfetch::utils { struct HttpOptions; }

namespace lockerfetch::core {

class Config;

/**
 * Engine settings
 * 
 * Built once (usually from the Config store) and passed by const
 * reference; no engine component reads the Config store directly.
 * Delays are in seconds.
 */
struct EngineConfig {
    // Batch behaviour
    int maxConcurrentDownloads{3};
    double minDelay{1.0};
    double maxDelay{3.0};
    int maxRetries{10};
    bool respectRobots{false};
    std::string proxy;
    std::string downloadDir{"downloads"};

    // Retry
    double retryBaseDelay{2.0};
    double retryDelayIncrement{0.5};

    // Scheduler
    double admissionDelay{1.5};
    double reductionPause{3.0};
    int errorThreshold{3};
    double sequentialMinPause{0.5};
    double sequentialMaxPause{1.0};

    // Transfer
    double smoothingWeight{0.3};
    int64_t probeSize{256 * 1024};             // 0 disables the speed probe
    int chunkRecalcInterval{10};
    int memoryCheckInterval{50};
    double memoryWarningPercent{80.0};
    int64_t largeFileThreshold{100LL * 1024 * 1024};
    std::vector<std::string> maintenanceUrls{"https://bnkr.b-cdn.net/maintenance.mp4"};

    // HTTP
    int timeoutSeconds{30};
    int connectTimeoutSeconds{10};
    int maxRedirects{5};
    bool verifySSL{true};
    std::string referer{"https://bunkr.sk/"};
    std::vector<std::string> userAgents;

    // Sites
    std::string bunkrApiUrl{"https://bunkr.cr/api/vs"};
    std::vector<std::string> allowedDomains;

    /**
     * Snapshot the engine keys of a Config store
     * @param config Source store; missing keys keep the defaults above
     * @return Populated settings
     */
    static EngineConfig fromConfig(const Config& config);

    /**
     * Check the settings for values the engine cannot work with
     * @return Description of the first problem, or nullopt when usable
     */
    std::optional<std::string> validate() const;

    /**
     * Request defaults for the shared HTTP client
     */
    utils::HttpOptions httpDefaults() const;

    bool isConcurrent() const { return maxConcurrentDownloads > 1; }

    static std::chrono::milliseconds toMillis(double seconds) {
        if (seconds <= 0.0) return std::chrono::milliseconds(0);
        return std::chrono::milliseconds(static_cast<int64_t>(seconds * 1000.0));
    }
};

} // namespace lockerfetch::core
