#pragma once

/**
 * BunkrHandler.hpp
 * 
 * Bunkr file resolution through the /api/vs endpoint.
 */

#include "SiteHandler.hpp"

#include <string>
#include <vector>

namespace lockerfetch::utils { class HttpTransport; }
namespace lockerfetch::core { struct EngineConfig; }

namespace lockerfetch::sites {

/**
 * BunkrHandler
 * 
 * resolve() posts the file slug to the API and accepts the answer only
 * when it already carries a direct http(s) URL; encrypted answers are
 * reported as unresolvable.
 */
class BunkrHandler : public SiteHandler {
public:
    BunkrHandler(utils::HttpTransport& transport, const core::EngineConfig& config);

    HostKind kind() const override { return HostKind::Bunkr; }

    std::optional<ResolvedFile> resolve(const std::string& pageUrl) override;
    std::optional<Album> parse(const std::string& url) override;

    /**
     * Slug of a file page URL ("https://bunkr.cr/f/abc" -> "abc")
     */
    static std::optional<std::string> extractSlug(const std::string& pageUrl);

private:
    utils::HttpTransport& m_transport;
    std::string m_apiUrl;
    std::string m_referer;
    std::string m_userAgent;
    std::string m_proxy;
    int m_timeoutSeconds;
};

} // namespace lockerfetch::sites
