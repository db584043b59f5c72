/**
 * FileUtils.cpp
 * 
 * File system operations for downloads and the ledger.
 */

#include "FileUtils.hpp"

#include <fstream>
#include <cerrno>
#include <cstring>

#include <fcntl.h>
#include <unistd.h>

namespace lockerfetch::utils {

// -- Directory operations --

bool FileUtils::createDirectories(const fs::path& path) {
    std::error_code ec;
    fs::create_directories(path, ec);
    return !ec && fs::is_directory(path, ec);
}

// -- File operations --

bool FileUtils::fileExists(const fs::path& path) { std::error_code ec; return fs::is_regular_file(path, ec); }

bool FileUtils::moveFile(const fs::path& source, const fs::path& destination) {
    std::error_code ec; fs::rename(source, destination, ec); return !ec;
}

bool FileUtils::deleteFile(const fs::path& path) { std::error_code ec; return fs::remove(path, ec); }

int64_t FileUtils::getFileSize(const fs::path& path) {
    std::error_code ec;
    auto size = fs::file_size(path, ec);
    return ec ? -1 : static_cast<int64_t>(size);
}

// -- Read/Write --

std::vector<std::string> FileUtils::readLines(const fs::path& path) {
    std::vector<std::string> lines;
    std::ifstream file(path);
    if (!file.is_open()) return lines;
    std::string line;
    while (std::getline(file, line)) {
        if (!line.empty() && line.back() == '\r') line.pop_back();
        lines.push_back(line);
    }
    return lines;
}

fs::path FileUtils::partPathFor(const fs::path& finalPath) {
    fs::path part = finalPath;
    part += ".part";
    return part;
}

// -- PartFile --

PartFile::~PartFile() { close(); }

PartFile::PartFile(PartFile&& other) noexcept
    : m_fd(other.m_fd), m_path(std::move(other.m_path)), m_lastError(std::move(other.m_lastError)) {
    other.m_fd = -1;
}

PartFile& PartFile::operator=(PartFile&& other) noexcept {
    if (this != &other) {
        close();
        m_fd = other.m_fd;
        m_path = std::move(other.m_path);
        m_lastError = std::move(other.m_lastError);
        other.m_fd = -1;
    }
    return *this;
}

bool PartFile::open(const fs::path& path, Mode mode) {
    close();
    m_path = path;
    int flags = O_WRONLY | O_CREAT | O_CLOEXEC | (mode == Mode::Append ? O_APPEND : O_TRUNC);
    m_fd = ::open(path.c_str(), flags, 0644);
    if (m_fd < 0) {
        m_lastError = std::strerror(errno);
        return false;
    }
    return true;
}

bool PartFile::write(const char* data, size_t size) {
    if (m_fd < 0) return false;
    while (size > 0) {
        ssize_t written = ::write(m_fd, data, size);
        if (written < 0) {
            if (errno == EINTR) continue;
            m_lastError = std::strerror(errno);
            return false;
        }
        data += written;
        size -= static_cast<size_t>(written);
    }
    return true;
}

bool PartFile::sync() {
    if (m_fd < 0) return false;
    if (::fsync(m_fd) != 0) {
        m_lastError = std::strerror(errno);
        return false;
    }
    return true;
}

void PartFile::close() {
    if (m_fd >= 0) {
        ::close(m_fd);
        m_fd = -1;
    }
}

} // namespace lockerfetch::utils
