/**
 * BunkrHandler.cpp
 */

#include "BunkrHandler.hpp"
#include "../core/EngineConfig.hpp"
#include "../core/Logger.hpp"
#include "../utils/HttpClient.hpp"
#include "../utils/StringUtils.hpp"
#include "../utils/UrlUtils.hpp"

#include <nlohmann/json.hpp>

namespace lockerfetch::sites {

using json = nlohmann::json;
using utils::StringUtils;
using utils::UrlUtils;

namespace {

constexpr const char* kBunkrBase = "https://bunkr.sk";

std::string normalizePageUrl(const std::string& pageUrl) {
    std::string url = StringUtils::trim(pageUrl);
    if (StringUtils::startsWith(url, "/") && !StringUtils::startsWith(url, "//")) {
        return kBunkrBase + url;
    }
    return UrlUtils::ensureScheme(url);
}

} // namespace

BunkrHandler::BunkrHandler(utils::HttpTransport& transport, const core::EngineConfig& config)
    : m_transport(transport)
    , m_apiUrl(config.bunkrApiUrl)
    , m_referer(config.referer)
    , m_userAgent(config.userAgents.empty() ? std::string() : config.userAgents.front())
    , m_proxy(config.proxy)
    , m_timeoutSeconds(config.timeoutSeconds) {}

std::optional<std::string> BunkrHandler::extractSlug(const std::string& pageUrl) {
    std::string path = UrlUtils::path(normalizePageUrl(pageUrl));
    auto pos = path.find("/f/");
    if (pos == std::string::npos) {
        return std::nullopt;
    }
    std::string slug = path.substr(pos + 3);
    while (!slug.empty() && slug.back() == '/') slug.pop_back();
    if (slug.empty()) {
        return std::nullopt;
    }
    return slug;
}

std::optional<ResolvedFile> BunkrHandler::resolve(const std::string& pageUrl) {
    auto slug = extractSlug(pageUrl);
    if (!slug) {
        LOG_ERROR("Could not extract slug from URL {}", pageUrl);
        return std::nullopt;
    }
    LOG_DEBUG("Resolving Bunkr slug {}", *slug);

    utils::HttpOptions options;
    options.userAgent = m_userAgent;
    options.proxyUrl = m_proxy;
    options.timeoutSeconds = m_timeoutSeconds;
    if (!m_referer.empty()) options.headers["Referer"] = m_referer;

    json payload = {{"slug", *slug}};
    utils::HttpResponse response = m_transport.postJson(m_apiUrl, payload.dump(), options);

    if (!response.isSuccess()) {
        LOG_ERROR("HTTP {} getting file data for slug {}: {}", response.statusCode, *slug, response.error);
        return std::nullopt;
    }

    try {
        json data = json::parse(response.body);
        if (data.contains("url") && data["url"].is_string()) {
            std::string url = data["url"].get<std::string>();
            if (StringUtils::startsWith(url, "http")) {
                LOG_DEBUG("Using direct URL from API response for slug {}", *slug);
                return ResolvedFile{url, -1};
            }
        }
        LOG_ERROR("API response for slug {} carries no direct URL (encrypted={})", *slug,
                  data.value("encrypted", false));
    } catch (const json::exception& e) {
        LOG_ERROR("Invalid API response for slug {}: {}", *slug, e.what());
    }
    return std::nullopt;
}

std::optional<Album> BunkrHandler::parse(const std::string& url) {
    std::string normalized = normalizePageUrl(url);
    if (extractSlug(normalized)) {
        Album album;
        album.files.push_back(AlbumFile{normalized, {}, -1});
        return album;
    }
    LOG_WARN("Album pages are not supported: {}", url);
    return std::nullopt;
}

} // namespace lockerfetch::sites
