/**
 * UrlUtils.cpp
 */

#include "UrlUtils.hpp"
#include "StringUtils.hpp"
#include "HttpClient.hpp"

#include <regex>

namespace lockerfetch::utils {

namespace {

// Returns [authorityBegin, authorityEnd) for a URL with a scheme
std::pair<size_t, size_t> authorityRange(const std::string& url) {
    auto schemeEnd = url.find("://");
    if (schemeEnd == std::string::npos) return {std::string::npos, std::string::npos};
    size_t begin = schemeEnd + 3;
    size_t end = url.find_first_of("/?#", begin);
    if (end == std::string::npos) end = url.size();
    return {begin, end};
}

} // namespace

std::string UrlUtils::ensureScheme(const std::string& url) {
    std::string trimmed = StringUtils::trim(url);
    if (StringUtils::startsWith(trimmed, "http://") || StringUtils::startsWith(trimmed, "https://")) {
        return trimmed;
    }
    if (StringUtils::startsWith(trimmed, "//")) {
        return "https:" + trimmed;
    }
    return "https://" + trimmed;
}

std::string UrlUtils::host(const std::string& url) {
    auto [begin, end] = authorityRange(url);
    if (begin == std::string::npos) return "";

    std::string authority = url.substr(begin, end - begin);
    auto at = authority.rfind('@');
    if (at != std::string::npos) authority = authority.substr(at + 1);
    auto colon = authority.find(':');
    if (colon != std::string::npos) authority = authority.substr(0, colon);
    return StringUtils::toLower(authority);
}

std::string UrlUtils::path(const std::string& url) {
    auto [begin, end] = authorityRange(url);
    if (begin == std::string::npos) return "/";
    if (end >= url.size() || url[end] != '/') return "/";

    auto stop = url.find_first_of("?#", end);
    return url.substr(end, stop == std::string::npos ? std::string::npos : stop - end);
}

std::string UrlUtils::origin(const std::string& url) {
    auto [begin, end] = authorityRange(url);
    if (begin == std::string::npos) return "";
    return url.substr(0, end);
}

std::string UrlUtils::fileName(const std::string& url) {
    std::string p = path(url);
    auto slash = p.rfind('/');
    std::string base = slash == std::string::npos ? p : p.substr(slash + 1);
    if (base.empty()) return "";
    return HttpClient::urlDecode(base);
}

bool UrlUtils::isValidUrl(const std::string& url) {
    static const std::regex pattern(
        R"(^https?://)"
        R"((?:(?:[A-Z0-9](?:[A-Z0-9-]{0,61}[A-Z0-9])?\.)+(?:[A-Z]{2,6}\.?|[A-Z0-9-]{2,}\.?)|)"
        R"(localhost|)"
        R"(\d{1,3}\.\d{1,3}\.\d{1,3}\.\d{1,3}))"
        R"((?::\d+)?)"
        R"((?:/?|[/?]\S+)$)",
        std::regex::icase);
    return std::regex_match(url, pattern);
}

bool UrlUtils::hasUnsafePath(const std::string& url) {
    std::string p = path(url);
    return StringUtils::contains(p, "..") || StringUtils::contains(p, "//");
}

} // namespace lockerfetch::utils
