#pragma once

/**
 * SiteRegistry.hpp
 * 
 * Maps host kinds to their handlers.
 */

#include "SiteHandler.hpp"

#include <map>
#include <memory>
#include <string>

namespace lockerfetch::utils { class HttpTransport; }
namespace lockerfetch::core { struct EngineConfig; }

namespace lockerfetch::sites {

class SiteRegistry {
public:
    SiteRegistry() = default;

    /**
     * Registry holding the Bunkr and Cyberdrop handlers
     */
    static std::unique_ptr<SiteRegistry> createDefault(utils::HttpTransport& transport,
                                                       const core::EngineConfig& config);

    void registerHandler(std::shared_ptr<SiteHandler> handler);

    /**
     * Handler for a URL; unknown hosts fall back to the Bunkr handler
     * @return Handler, or nullptr when nothing suitable is registered
     */
    SiteHandler* handlerFor(const std::string& url) const;

    SiteHandler* handlerFor(HostKind kind) const;

    size_t size() const { return m_handlers.size(); }

private:
    std::map<HostKind, std::shared_ptr<SiteHandler>> m_handlers;
};

} // namespace lockerfetch::sites
