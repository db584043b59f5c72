/**
 * EngineConfig.cpp
 */

#include "EngineConfig.hpp"
#include "Config.hpp"
#include "../utils/HttpClient.hpp"

namespace lockerfetch::core {

EngineConfig EngineConfig::fromConfig(const Config& config) {
    EngineConfig c;

    c.maxConcurrentDownloads = config.get<int>("engine.maxConcurrentDownloads", c.maxConcurrentDownloads);
    c.minDelay = config.get<double>("engine.minDelay", c.minDelay);
    c.maxDelay = config.get<double>("engine.maxDelay", c.maxDelay);
    c.maxRetries = config.get<int>("engine.maxRetries", c.maxRetries);
    c.respectRobots = config.get<bool>("engine.respectRobots", c.respectRobots);
    c.proxy = config.get<std::string>("engine.proxy", c.proxy);
    c.downloadDir = config.get<std::string>("engine.downloadDir", c.downloadDir);
    c.smoothingWeight = config.get<double>("engine.smoothingWeight", c.smoothingWeight);

    c.retryBaseDelay = config.get<double>("retry.baseDelay", c.retryBaseDelay);
    c.retryDelayIncrement = config.get<double>("retry.delayIncrement", c.retryDelayIncrement);

    c.admissionDelay = config.get<double>("scheduler.admissionDelay", c.admissionDelay);
    c.reductionPause = config.get<double>("scheduler.reductionPause", c.reductionPause);
    c.errorThreshold = config.get<int>("scheduler.errorThreshold", c.errorThreshold);
    c.sequentialMinPause = config.get<double>("scheduler.sequentialMinPause", c.sequentialMinPause);
    c.sequentialMaxPause = config.get<double>("scheduler.sequentialMaxPause", c.sequentialMaxPause);

    c.probeSize = config.get<int64_t>("transfer.probeSize", c.probeSize);
    c.chunkRecalcInterval = config.get<int>("transfer.chunkRecalcInterval", c.chunkRecalcInterval);
    c.memoryCheckInterval = config.get<int>("transfer.memoryCheckInterval", c.memoryCheckInterval);
    c.memoryWarningPercent = config.get<double>("transfer.memoryWarningPercent", c.memoryWarningPercent);
    c.largeFileThreshold = config.get<int64_t>("transfer.largeFileThreshold", c.largeFileThreshold);
    c.maintenanceUrls = config.get<std::vector<std::string>>("transfer.maintenanceUrls", c.maintenanceUrls);

    c.timeoutSeconds = config.get<int>("http.timeout", c.timeoutSeconds);
    c.connectTimeoutSeconds = config.get<int>("http.connectTimeout", c.connectTimeoutSeconds);
    c.maxRedirects = config.get<int>("http.maxRedirects", c.maxRedirects);
    c.verifySSL = config.get<bool>("http.verifySSL", c.verifySSL);
    c.referer = config.get<std::string>("http.referer", c.referer);
    c.userAgents = config.get<std::vector<std::string>>("http.userAgents", c.userAgents);

    c.bunkrApiUrl = config.get<std::string>("sites.bunkrApi", c.bunkrApiUrl);
    c.allowedDomains = config.get<std::vector<std::string>>("sites.allowedDomains", c.allowedDomains);

    return c;
}

std::optional<std::string> EngineConfig::validate() const {
    if (maxConcurrentDownloads < 1) {
        return "maxConcurrentDownloads must be at least 1";
    }
    if (maxRetries < 1) {
        return "maxRetries must be at least 1";
    }
    if (minDelay < 0.0 || maxDelay < minDelay) {
        return "delays must satisfy 0 <= minDelay <= maxDelay";
    }
    if (sequentialMinPause < 0.0 || sequentialMaxPause < sequentialMinPause) {
        return "sequential pauses must satisfy 0 <= min <= max";
    }
    if (smoothingWeight <= 0.0 || smoothingWeight > 1.0) {
        return "smoothingWeight must be in (0, 1]";
    }
    if (errorThreshold < 1) {
        return "errorThreshold must be at least 1";
    }
    if (chunkRecalcInterval < 1 || memoryCheckInterval < 1) {
        return "chunk intervals must be at least 1";
    }
    if (probeSize < 0) {
        return "probeSize must not be negative";
    }
    return std::nullopt;
}

utils::HttpOptions EngineConfig::httpDefaults() const {
    utils::HttpOptions options;
    options.timeoutSeconds = timeoutSeconds;
    options.connectTimeoutSeconds = connectTimeoutSeconds;
    options.maxRedirects = maxRedirects;
    options.verifySSL = verifySSL;
    options.proxyUrl = proxy;
    return options;
}

} // namespace lockerfetch::core
