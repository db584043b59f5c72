#pragma once

/**
 * EngineContext.hpp
 * 
 * Collaborators shared by every task of a batch.
 */

namespace lockerfetch::utils { class HttpTransport; }
namespace lockerfetch::sites { class RobotsPolicy; class SiteRegistry; }

namespace lockerfetch::core {
class CancellationToken;
}

namespace lockerfetch::core::downloader {

class DownloadLedger;
class ResourceMonitor;

/**
 * Non-owning bundle; everything referenced must outlive the batch
 */
struct EngineContext {
    utils::HttpTransport& transport;
    DownloadLedger& ledger;
    sites::RobotsPolicy& robots;
    sites::SiteRegistry& sites;
    CancellationToken& cancel;
    ResourceMonitor& monitor;
};

} // namespace lockerfetch::core::downloader
