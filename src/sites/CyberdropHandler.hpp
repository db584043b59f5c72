#pragma once

/**
 * CyberdropHandler.hpp
 * 
 * Cyberdrop file URLs are direct download URLs.
 */

#include "SiteHandler.hpp"

namespace lockerfetch::sites {

class CyberdropHandler : public SiteHandler {
public:
    HostKind kind() const override { return HostKind::Cyberdrop; }

    std::optional<ResolvedFile> resolve(const std::string& pageUrl) override;
    std::optional<Album> parse(const std::string& url) override;
};

} // namespace lockerfetch::sites
