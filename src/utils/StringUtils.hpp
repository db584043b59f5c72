// LockerFetch - String Utilities
// String manipulation and formatting

#pragma once

#include <cstdint>
#include <string>
#include <vector>
#include <chrono>

namespace lockerfetch::utils {

/**
 * @brief String manipulation utilities
 */
class StringUtils {
public:
    // Trimming
    static std::string trim(const std::string& str);

    // Case conversion
    static std::string toLower(const std::string& str);

    // Splitting and joining
    static std::vector<std::string> split(const std::string& str, char delimiter);
    static std::string join(const std::vector<std::string>& parts, const std::string& separator);

    // Search
    static bool contains(const std::string& str, const std::string& substr);
    static bool startsWith(const std::string& str, const std::string& prefix);
    static bool endsWith(const std::string& str, const std::string& suffix);

    // Formatting
    static std::string formatBytes(int64_t bytes);
    static std::string formatRate(double bytesPerSecond);
    static std::string formatDuration(std::chrono::milliseconds duration);

    // File names
    static std::string sanitizeFileName(const std::string& name);

    // Parsing
    static int64_t parseLong(const std::string& str, int64_t defaultValue = 0);
    static double parseDouble(const std::string& str, double defaultValue = 0.0);

    // Truncation
    static std::string truncate(const std::string& str, size_t maxLength, const std::string& suffix = "...");
};

} // namespace lockerfetch::utils
