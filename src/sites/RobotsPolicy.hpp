#pragma once

/**
 * RobotsPolicy.hpp
 * 
 * robots.txt gate consulted before a transfer when enabled.
 */

#include <condition_variable>
#include <map>
#include <memory>
#include <mutex>
#include <set>
#include <string>
#include <vector>

namespace lockerfetch::utils { class HttpTransport; struct HttpOptions; }

namespace lockerfetch::sites {

class RobotsPolicy {
public:
    virtual ~RobotsPolicy() = default;

    virtual bool allowed(const std::string& url, const std::string& userAgent) = 0;
};

/**
 * Policy used when robots.txt checking is disabled
 */
class AllowAllPolicy : public RobotsPolicy {
public:
    bool allowed(const std::string&, const std::string&) override { return true; }
};

/**
 * Parsed robots.txt of one origin
 */
class RobotsRules {
public:
    struct Rule {
        std::string prefix;
        bool allow{false};
    };

    static RobotsRules parse(const std::string& content);

    static RobotsRules allowAll() { return RobotsRules(); }
    static RobotsRules disallowAll();

    /**
     * Longest matching prefix wins; Allow wins ties
     * @param path URL path (with query)
     * @param userAgent Agent string; matched case-insensitively against group names
     */
    bool allows(const std::string& path, const std::string& userAgent) const;

private:
    const std::vector<Rule>* rulesFor(const std::string& userAgent) const;

    std::map<std::string, std::vector<Rule>> m_groups;  // lowercased agent token -> rules
};

/**
 * RobotsTxtPolicy - fetches and caches robots.txt per origin
 * 
 * Unreachable or missing robots.txt allows everything; 401/403 denies
 * everything.
 */
class RobotsTxtPolicy : public RobotsPolicy {
public:
    RobotsTxtPolicy(utils::HttpTransport& transport, const utils::HttpOptions& options);
    ~RobotsTxtPolicy() override;

    bool allowed(const std::string& url, const std::string& userAgent) override;

private:
    RobotsRules fetch(const std::string& origin);

    utils::HttpTransport& m_transport;
    std::unique_ptr<utils::HttpOptions> m_options;
    std::mutex m_mutex;
    std::condition_variable m_fetched;
    std::map<std::string, RobotsRules> m_cache;
    std::set<std::string> m_pending;        // origins being fetched
};

} // namespace lockerfetch::sites
