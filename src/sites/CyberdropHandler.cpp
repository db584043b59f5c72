/**
 * CyberdropHandler.cpp
 */

#include "CyberdropHandler.hpp"
#include "../core/Logger.hpp"
#include "../utils/StringUtils.hpp"
#include "../utils/UrlUtils.hpp"

namespace lockerfetch::sites {

using utils::StringUtils;
using utils::UrlUtils;

std::optional<ResolvedFile> CyberdropHandler::resolve(const std::string& pageUrl) {
    std::string url = StringUtils::trim(pageUrl);
    if (url.empty()) {
        return std::nullopt;
    }
    return ResolvedFile{UrlUtils::ensureScheme(url), -1};
}

std::optional<Album> CyberdropHandler::parse(const std::string& url) {
    std::string normalized = UrlUtils::ensureScheme(url);
    std::string path = UrlUtils::path(normalized);
    if (StringUtils::startsWith(path, "/f/") && path.size() > 3) {
        Album album;
        album.files.push_back(AlbumFile{normalized, {}, -1});
        return album;
    }
    LOG_WARN("Album pages are not supported: {}", url);
    return std::nullopt;
}

} // namespace lockerfetch::sites
