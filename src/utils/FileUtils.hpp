// LockerFetch - File Utilities
// File system operations used by the transfer engine

#pragma once

#include <cstdint>
#include <string>
#include <vector>
#include <filesystem>

namespace fs = std::filesystem;

namespace lockerfetch::utils {

/**
 * @brief File and directory utilities
 */
class FileUtils {
public:
    // Directory operations
    static bool createDirectories(const fs::path& path);

    // File operations
    static bool fileExists(const fs::path& path);
    static bool moveFile(const fs::path& source, const fs::path& destination);
    static bool deleteFile(const fs::path& path);
    static int64_t getFileSize(const fs::path& path);   // -1 if missing

    // Read/Write operations
    static std::vector<std::string> readLines(const fs::path& path);

    // Partial downloads
    static fs::path partPathFor(const fs::path& finalPath);
};

/**
 * @brief RAII writer for a .part file
 *
 * Wraps a POSIX descriptor so the data can be fsync'ed before the
 * file is published with an atomic rename.
 */
class PartFile {
public:
    enum class Mode { Truncate, Append };

    PartFile() = default;
    ~PartFile();

    PartFile(const PartFile&) = delete;
    PartFile& operator=(const PartFile&) = delete;

    PartFile(PartFile&& other) noexcept;
    PartFile& operator=(PartFile&& other) noexcept;

    /**
     * Open the file, creating it when absent
     * @param path Path of the .part file
     * @param mode Truncate for a fresh transfer, Append to resume
     * @return true if the descriptor is usable
     */
    bool open(const fs::path& path, Mode mode);

    /**
     * Write the whole buffer, retrying short writes
     * @return false on any I/O error
     */
    bool write(const char* data, size_t size);

    /**
     * Flush kernel buffers to stable storage
     */
    bool sync();

    void close();

    bool isOpen() const { return m_fd >= 0; }
    const fs::path& path() const { return m_path; }
    const std::string& lastError() const { return m_lastError; }

private:
    int m_fd{-1};
    fs::path m_path;
    std::string m_lastError;
};

} // namespace lockerfetch::utils
