#pragma once

/**
 * Ledger.hpp
 * 
 * Record of source URLs already downloaded, used to skip work on reruns.
 */

#include <filesystem>
#include <mutex>
#include <string>
#include <unordered_set>

namespace lockerfetch::core::downloader {

/**
 * Ledger interface
 * 
 * Implementations must be safe to call from every worker at once.
 */
class DownloadLedger {
public:
    virtual ~DownloadLedger() = default;

    virtual bool contains(const std::string& url) const = 0;

    /**
     * Record a finished download
     * @return false if the entry could not be persisted
     */
    virtual bool markDownloaded(const std::string& url) = 0;
};

/**
 * FileLedger - already_downloaded.txt
 * 
 * One URL per line, UTF-8, append-only. The file is read once when the
 * ledger is opened; appends are serialized by a mutex.
 */
class FileLedger : public DownloadLedger {
public:
    explicit FileLedger(std::filesystem::path path);

    FileLedger(const FileLedger&) = delete;
    FileLedger& operator=(const FileLedger&) = delete;

    bool contains(const std::string& url) const override;
    bool markDownloaded(const std::string& url) override;

    size_t size() const;
    const std::filesystem::path& path() const { return m_path; }

private:
    std::filesystem::path m_path;
    mutable std::mutex m_mutex;
    std::unordered_set<std::string> m_entries;
};

} // namespace lockerfetch::core::downloader
