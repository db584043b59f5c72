#pragma once

/**
 * Application.hpp
 * 
 * CLI-side driver: turns user supplied URLs into download batches and
 * runs them through the engine.
 */

#include "CancellationToken.hpp"
#include "EngineConfig.hpp"
#include "downloader/TransferTask.hpp"

#include <atomic>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace lockerfetch::utils { class HttpTransport; }
namespace lockerfetch::sites { class SiteRegistry; class RobotsPolicy; struct Album; }

namespace lockerfetch::core {

enum class AppState {
    Uninitialized,
    Ready,
    Running,
    Error
};

/**
 * Outcome of one user supplied URL
 */
struct UrlReport {
    std::string url;
    std::string directory;
    bool accepted{false};           // passed validation and parsing
    std::string error;
    downloader::BatchResult batch;

    bool success() const { return accepted && batch.success(); }
};

/**
 * Application
 * 
 * Owns the shared collaborators (transport, site registry, robots policy,
 * cancellation token) for the lifetime of a run.
 */
class Application {
public:
    /**
     * @param config Engine settings
     * @param transport HTTP transport; a cpr-backed client is created when null
     */
    explicit Application(EngineConfig config, std::shared_ptr<utils::HttpTransport> transport = nullptr);
    ~Application();

    Application(const Application&) = delete;
    Application& operator=(const Application&) = delete;

    /**
     * Validate the configuration and build the collaborators
     * @return true if ready to run
     */
    bool initialize();

    /**
     * Process every URL in order
     * @param urls User supplied album or file URLs
     * @param reportPath Optional path of a JSON report
     * @return Process exit code: 0 when everything succeeded, 1 otherwise
     */
    int run(const std::vector<std::string>& urls, const std::string& reportPath = "");

    /**
     * Download everything behind one URL
     */
    UrlReport processUrl(const std::string& url);

    /**
     * Stop admitting work; safe to call from a signal handler
     */
    void requestCancel() noexcept { m_cancel.cancel(); }

    bool isCancelled() const noexcept { return m_cancel.isCancelled(); }

    AppState getState() const { return m_state.load(); }

    const EngineConfig& config() const { return m_config; }

    /**
     * Check a URL before it reaches a site handler
     * @return Reason for rejection, nullopt if acceptable
     */
    std::optional<std::string> validateUrl(const std::string& url) const;

    /**
     * Read a URL list file: one URL per line, '#' starts a comment
     */
    static std::vector<std::string> readUrlFile(const std::string& path);

    static std::string getVersion() { return "1.0.0"; }
    static std::string getName() { return "LockerFetch"; }

private:
    std::vector<downloader::TransferTask> buildTasks(const sites::Album& album, const std::string& directory) const;
    bool writeReport(const std::vector<UrlReport>& reports, const std::string& path) const;

private:
    std::atomic<AppState> m_state{AppState::Uninitialized};
    EngineConfig m_config;
    CancellationToken m_cancel;

    std::shared_ptr<utils::HttpTransport> m_transport;
    std::unique_ptr<sites::SiteRegistry> m_sites;
    std::unique_ptr<sites::RobotsPolicy> m_robots;
};

} // namespace lockerfetch::core
