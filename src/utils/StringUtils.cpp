/**
 * StringUtils.cpp
 * 
 * String manipulation and formatting utilities.
 */

#include "StringUtils.hpp"

#include <algorithm>
#include <cctype>
#include <iomanip>
#include <sstream>
#include <stdexcept>

namespace lockerfetch::utils {

// -- Trimming --

std::string StringUtils::trim(const std::string& str) {
    auto start = str.find_first_not_of(" \t\n\r\f\v");
    if (start == std::string::npos) return "";
    auto end = str.find_last_not_of(" \t\n\r\f\v");
    return str.substr(start, end - start + 1);
}

// -- Case conversion --

std::string StringUtils::toLower(const std::string& str) {
    std::string result = str;
    std::transform(result.begin(), result.end(), result.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return result;
}

// -- Split/Join --

std::vector<std::string> StringUtils::split(const std::string& str, char delimiter) {
    std::vector<std::string> parts;
    std::istringstream iss(str);
    std::string part;
    while (std::getline(iss, part, delimiter)) parts.push_back(part);
    return parts;
}

std::string StringUtils::join(const std::vector<std::string>& parts, const std::string& separator) {
    if (parts.empty()) return "";
    std::string result = parts[0];
    for (size_t i = 1; i < parts.size(); ++i) result += separator + parts[i];
    return result;
}

// -- Search --

bool StringUtils::contains(const std::string& str, const std::string& substr) {
    return str.find(substr) != std::string::npos;
}

bool StringUtils::startsWith(const std::string& str, const std::string& prefix) {
    return str.size() >= prefix.size() && str.compare(0, prefix.size(), prefix) == 0;
}

bool StringUtils::endsWith(const std::string& str, const std::string& suffix) {
    return str.size() >= suffix.size() && str.compare(str.size() - suffix.size(), suffix.size(), suffix) == 0;
}

// -- Formatting --

std::string StringUtils::formatBytes(int64_t bytes) {
    const char* units[] = {"B", "KB", "MB", "GB", "TB"};
    double size = static_cast<double>(bytes);
    int unit = 0;
    while (size >= 1024.0 && unit < 4) { size /= 1024.0; ++unit; }
    std::ostringstream oss;
    oss << std::fixed << std::setprecision(unit == 0 ? 0 : 2) << size << " " << units[unit];
    return oss.str();
}

std::string StringUtils::formatRate(double bytesPerSecond) {
    if (bytesPerSecond <= 0.0) return "0 B/s";
    return formatBytes(static_cast<int64_t>(bytesPerSecond)) + "/s";
}

std::string StringUtils::formatDuration(std::chrono::milliseconds duration) {
    auto h = std::chrono::duration_cast<std::chrono::hours>(duration);
    auto m = std::chrono::duration_cast<std::chrono::minutes>(duration - h);
    auto s = std::chrono::duration_cast<std::chrono::seconds>(duration - h - m);
    std::ostringstream oss;
    oss << std::setfill('0') << std::setw(2) << h.count() << ":"
        << std::setfill('0') << std::setw(2) << m.count() << ":"
        << std::setfill('0') << std::setw(2) << s.count();
    return oss.str();
}

// -- File names --

std::string StringUtils::sanitizeFileName(const std::string& name) {
    // <>:"/\|?*' and control bytes become '-'
    std::string result;
    result.reserve(name.size());
    for (char c : name) {
        unsigned char uc = static_cast<unsigned char>(c);
        bool illegal = uc < 0x20 || c == '<' || c == '>' || c == ':' || c == '"' ||
                       c == '/' || c == '\\' || c == '|' || c == '?' || c == '*' || c == '\'';
        result += illegal ? '-' : c;
    }
    result = trim(result);
    if (result.empty() || result == "." || result == "..") return "unnamed";
    return result;
}

// -- Parsing --

int64_t StringUtils::parseLong(const std::string& str, int64_t defaultValue) {
    try {
        return std::stoll(trim(str));
    } catch (const std::invalid_argument&) {
        return defaultValue;
    } catch (const std::out_of_range&) {
        return defaultValue;
    }
}

double StringUtils::parseDouble(const std::string& str, double defaultValue) {
    try {
        return std::stod(trim(str));
    } catch (const std::invalid_argument&) {
        return defaultValue;
    } catch (const std::out_of_range&) {
        return defaultValue;
    }
}

// -- Truncation --

std::string StringUtils::truncate(const std::string& str, size_t maxLength, const std::string& suffix) {
    if (str.size() <= maxLength) return str;
    if (maxLength <= suffix.size()) return str.substr(0, maxLength);
    return str.substr(0, maxLength - suffix.size()) + suffix;
}

} // namespace lockerfetch::utils
