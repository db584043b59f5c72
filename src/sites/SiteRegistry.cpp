/**
 * SiteRegistry.cpp
 */

#include "SiteRegistry.hpp"
#include "BunkrHandler.hpp"
#include "CyberdropHandler.hpp"
#include "../utils/UrlUtils.hpp"
#include "../utils/StringUtils.hpp"

namespace lockerfetch::sites {

using utils::StringUtils;
using utils::UrlUtils;

const char* toString(HostKind kind) {
    switch (kind) {
        case HostKind::Bunkr:     return "bunkr";
        case HostKind::Cyberdrop: return "cyberdrop";
        case HostKind::Unknown:   return "unknown";
    }
    return "unknown";
}

HostKind hostKindFor(const std::string& url) {
    std::string host = UrlUtils::host(UrlUtils::ensureScheme(url));
    if (host.empty()) {
        return HostKind::Unknown;
    }

    // Bunkr rotates TLDs and serves files from numbered CDN subdomains
    auto labels = StringUtils::split(host, '.');
    for (const auto& label : labels) {
        if (StringUtils::startsWith(label, "bunkr")) return HostKind::Bunkr;
        if (label == "cyberdrop") return HostKind::Cyberdrop;
    }
    return HostKind::Unknown;
}

std::unique_ptr<SiteRegistry> SiteRegistry::createDefault(utils::HttpTransport& transport,
                                                          const core::EngineConfig& config) {
    auto registry = std::make_unique<SiteRegistry>();
    registry->registerHandler(std::make_shared<BunkrHandler>(transport, config));
    registry->registerHandler(std::make_shared<CyberdropHandler>());
    return registry;
}

void SiteRegistry::registerHandler(std::shared_ptr<SiteHandler> handler) {
    if (!handler) return;
    HostKind kind = handler->kind();
    m_handlers[kind] = std::move(handler);
}

SiteHandler* SiteRegistry::handlerFor(HostKind kind) const {
    auto it = m_handlers.find(kind);
    if (it != m_handlers.end()) {
        return it->second.get();
    }
    if (kind == HostKind::Unknown) {
        auto bunkr = m_handlers.find(HostKind::Bunkr);
        if (bunkr != m_handlers.end()) {
            return bunkr->second.get();
        }
    }
    return nullptr;
}

SiteHandler* SiteRegistry::handlerFor(const std::string& url) const {
    return handlerFor(hostKindFor(url));
}

} // namespace lockerfetch::sites
