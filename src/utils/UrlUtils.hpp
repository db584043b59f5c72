// LockerFetch - URL Utilities
// Lightweight URL inspection used for routing, naming and robots lookups

#pragma once

#include <string>

namespace lockerfetch::utils {

/**
 * @brief Helpers for the small subset of URL handling the downloader needs
 */
class UrlUtils {
public:
    // Prepend https:// (or https: for protocol-relative URLs) when no scheme is present
    static std::string ensureScheme(const std::string& url);

    static std::string host(const std::string& url);       // lowercase, no port or credentials
    static std::string path(const std::string& url);       // no query or fragment, "/" when empty
    static std::string origin(const std::string& url);     // scheme://authority

    // Decoded basename of the URL path, empty if the path ends in '/'
    static std::string fileName(const std::string& url);

    // Syntactic http(s) URL check
    static bool isValidUrl(const std::string& url);

    // Rejects ".." segments and empty segments ("//") in the path
    static bool hasUnsafePath(const std::string& url);
};

} // namespace lockerfetch::utils
