/**
 * Application.cpp
 * 
 * Implementation of the CLI driver.
 */

#include "Application.hpp"
#include "EngineError.hpp"
#include "Logger.hpp"
#include "downloader/Ledger.hpp"
#include "downloader/Orchestrator.hpp"
#include "downloader/ResourceMonitor.hpp"
#include "../sites/RobotsPolicy.hpp"
#include "../sites/SiteRegistry.hpp"
#include "../utils/FileUtils.hpp"
#include "../utils/HttpClient.hpp"
#include "../utils/PathUtils.hpp"
#include "../utils/StringUtils.hpp"
#include "../utils/UrlUtils.hpp"

#include <nlohmann/json.hpp>

#include <chrono>
#include <fstream>

namespace lockerfetch::core {

using utils::FileUtils;
using utils::PathUtils;
using utils::StringUtils;
using utils::UrlUtils;

Application::Application(EngineConfig config, std::shared_ptr<utils::HttpTransport> transport)
    : m_config(std::move(config))
    , m_transport(std::move(transport)) {}

Application::~Application() = default;

bool Application::initialize() {
    if (m_state != AppState::Uninitialized) {
        LOG_WARN("Application already initialized");
        return false;
    }

    if (auto problem = m_config.validate()) {
        LOG_ERROR("Invalid configuration: {}", *problem);
        m_state = AppState::Error;
        return false;
    }

    try {
        if (!m_transport) {
            m_transport = std::make_shared<utils::HttpClient>(m_config.httpDefaults());
        }
        m_sites = sites::SiteRegistry::createDefault(*m_transport, m_config);

        if (m_config.respectRobots) {
            utils::HttpOptions robotsOptions = m_config.httpDefaults();
            if (!m_config.userAgents.empty()) robotsOptions.userAgent = m_config.userAgents.front();
            m_robots = std::make_unique<sites::RobotsTxtPolicy>(*m_transport, robotsOptions);
        } else {
            m_robots = std::make_unique<sites::AllowAllPolicy>();
        }
    } catch (const std::exception& e) {
        LOG_ERROR("Initialization error: {}", e.what());
        m_state = AppState::Error;
        return false;
    }

    LOG_DEBUG("Download directory: {}", m_config.downloadDir);
    LOG_DEBUG("Mode: {}", m_config.isConcurrent()
        ? "concurrent (" + std::to_string(m_config.maxConcurrentDownloads) + " workers)"
        : std::string("sequential"));

    m_state = AppState::Ready;
    return true;
}

std::optional<std::string> Application::validateUrl(const std::string& url) const {
    std::string normalized = UrlUtils::ensureScheme(url);
    if (!UrlUtils::isValidUrl(normalized)) {
        return "not a valid URL";
    }
    if (UrlUtils::hasUnsafePath(normalized)) {
        return "URL path is not allowed";
    }
    if (!m_config.allowedDomains.empty()) {
        std::string host = UrlUtils::host(normalized);
        bool allowed = false;
        for (const auto& domain : m_config.allowedDomains) {
            if (host == domain || StringUtils::endsWith(host, "." + domain)) {
                allowed = true;
                break;
            }
        }
        if (!allowed) {
            return "domain " + host + " is not supported";
        }
    }
    return std::nullopt;
}

std::vector<std::string> Application::readUrlFile(const std::string& path) {
    std::vector<std::string> urls;
    for (const auto& line : FileUtils::readLines(path)) {
        std::string url = StringUtils::trim(line);
        if (url.empty() || url[0] == '#') continue;
        urls.push_back(url);
    }
    return urls;
}

std::vector<downloader::TransferTask> Application::buildTasks(const sites::Album& album,
                                                              const std::string& directory) const {
    std::vector<downloader::TransferTask> tasks;
    tasks.reserve(album.files.size());
    for (const auto& file : album.files) {
        tasks.emplace_back(file.url, directory, file.name, file.size);
    }
    return tasks;
}

UrlReport Application::processUrl(const std::string& url) {
    UrlReport report;
    report.url = url;

    if (auto problem = validateUrl(url)) {
        report.error = *problem;
        LOG_ERROR("Skipping {}: {}", url, *problem);
        return report;
    }

    std::string normalized = UrlUtils::ensureScheme(url);
    sites::SiteHandler* handler = m_sites->handlerFor(normalized);
    auto album = handler ? handler->parse(normalized) : std::nullopt;
    if (!album || album->files.empty()) {
        report.error = "no downloadable files found";
        LOG_ERROR("No downloadable files found at {}", url);
        return report;
    }
    report.accepted = true;

    std::filesystem::path directory(m_config.downloadDir);
    if (!album->name.empty()) {
        directory /= StringUtils::sanitizeFileName(album->name);
    }
    report.directory = directory.string();

    LOG_INFO("{}: {} file(s) -> {}", url, album->files.size(), report.directory);

    try {
        if (!FileUtils::createDirectories(directory)) {
            throw EngineError("Cannot create download directory " + directory.string());
        }
        downloader::FileLedger ledger(directory / PathUtils::kLedgerFileName);

        downloader::EngineContext context{
            *m_transport,
            ledger,
            *m_robots,
            *m_sites,
            m_cancel,
            downloader::ResourceMonitor::instance()
        };

        downloader::Orchestrator orchestrator(m_config, context);
        report.batch = orchestrator.process(buildTasks(*album, report.directory));
    } catch (const EngineError& e) {
        report.error = e.what();
        report.batch.errorCount = album->files.size();
        LOG_CRITICAL("{}", e.what());
    }

    return report;
}

int Application::run(const std::vector<std::string>& urls, const std::string& reportPath) {
    if (m_state != AppState::Ready) {
        LOG_ERROR("Application is not initialized");
        return 1;
    }
    m_state = AppState::Running;

    auto start = std::chrono::steady_clock::now();
    std::vector<UrlReport> reports;
    bool allSucceeded = true;

    for (size_t i = 0; i < urls.size(); ++i) {
        if (m_cancel.isCancelled()) {
            LOG_WARN("Cancelled, {} URL(s) left unprocessed", urls.size() - i);
            allSucceeded = false;
            break;
        }
        LOG_INFO("URL {}/{}: {}", i + 1, urls.size(), urls[i]);
        reports.push_back(processUrl(urls[i]));
        allSucceeded = allSucceeded && reports.back().success();
    }

    auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - start);

    size_t succeeded = 0;
    for (const auto& report : reports) {
        if (report.success()) ++succeeded;
        if (report.accepted) {
            LOG_INFO("{}: {}", report.url, report.batch.summary());
        }
    }
    LOG_INFO("{}/{} URLs processed successfully in {}", succeeded, urls.size(),
             StringUtils::formatDuration(elapsed));

    if (!reportPath.empty() && !writeReport(reports, reportPath)) {
        LOG_ERROR("Could not write report to {}", reportPath);
    }

    m_state = AppState::Ready;
    return allSucceeded ? 0 : 1;
}

bool Application::writeReport(const std::vector<UrlReport>& reports, const std::string& path) const {
    nlohmann::json entries = nlohmann::json::array();
    for (const auto& report : reports) {
        nlohmann::json entry = {
            {"url", report.url},
            {"accepted", report.accepted},
            {"success", report.success()}
        };
        if (!report.directory.empty()) entry["directory"] = report.directory;
        if (!report.error.empty()) entry["error"] = report.error;
        if (report.accepted) entry["batch"] = report.batch.toJson();
        entries.push_back(std::move(entry));
    }

    nlohmann::json document = {
        {"version", getVersion()},
        {"cancelled", isCancelled()},
        {"urls", std::move(entries)}
    };

    std::filesystem::path reportPath(path);
    if (reportPath.has_parent_path() && !FileUtils::createDirectories(reportPath.parent_path())) {
        return false;
    }
    std::ofstream file(reportPath);
    if (!file.is_open()) {
        return false;
    }
    file << document.dump(2) << '\n';
    return static_cast<bool>(file);
}

} // namespace lockerfetch::core
