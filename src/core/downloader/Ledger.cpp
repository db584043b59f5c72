/**
 * Ledger.cpp
 */

#include "Ledger.hpp"
#include "../Logger.hpp"
#include "../../utils/FileUtils.hpp"
#include "../../utils/StringUtils.hpp"

#include <fstream>

namespace lockerfetch::core::downloader {

using utils::FileUtils;
using utils::StringUtils;

FileLedger::FileLedger(std::filesystem::path path) : m_path(std::move(path)) {
    for (const auto& line : FileUtils::readLines(m_path)) {
        std::string url = StringUtils::trim(line);
        if (!url.empty()) {
            m_entries.insert(std::move(url));
        }
    }
    if (!m_entries.empty()) {
        LOG_DEBUG("Ledger {} holds {} entries", m_path.string(), m_entries.size());
    }
}

bool FileLedger::contains(const std::string& url) const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_entries.count(StringUtils::trim(url)) > 0;
}

bool FileLedger::markDownloaded(const std::string& url) {
    std::string entry = StringUtils::trim(url);
    if (entry.empty()) {
        return false;
    }

    std::lock_guard<std::mutex> lock(m_mutex);
    if (m_entries.count(entry) > 0) {
        return true;
    }

    if (m_path.has_parent_path()) {
        FileUtils::createDirectories(m_path.parent_path());
    }

    std::ofstream file(m_path, std::ios::app | std::ios::binary);
    if (!file.is_open()) {
        LOG_ERROR("Cannot open ledger {}", m_path.string());
        return false;
    }
    file << entry << '\n';
    file.flush();
    if (!file) {
        LOG_ERROR("Failed to append to ledger {}", m_path.string());
        return false;
    }

    m_entries.insert(std::move(entry));
    return true;
}

size_t FileLedger::size() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_entries.size();
}

} // namespace lockerfetch::core::downloader
