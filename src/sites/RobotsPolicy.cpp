/**
 * RobotsPolicy.cpp
 */

#include "RobotsPolicy.hpp"
#include "../core/Logger.hpp"
#include "../utils/HttpClient.hpp"
#include "../utils/StringUtils.hpp"
#include "../utils/UrlUtils.hpp"

#include <exception>
#include <sstream>

namespace lockerfetch::sites {

using utils::StringUtils;
using utils::UrlUtils;

// -- RobotsRules --

RobotsRules RobotsRules::disallowAll() {
    RobotsRules rules;
    rules.m_groups["*"].push_back(Rule{"/", false});
    return rules;
}

RobotsRules RobotsRules::parse(const std::string& content) {
    RobotsRules rules;
    std::vector<std::string> currentAgents;
    bool lastWasAgent = false;

    std::istringstream stream(content);
    std::string line;
    while (std::getline(stream, line)) {
        auto hash = line.find('#');
        if (hash != std::string::npos) line.erase(hash);
        line = StringUtils::trim(line);
        if (line.empty()) continue;

        auto colon = line.find(':');
        if (colon == std::string::npos) continue;
        std::string field = StringUtils::toLower(StringUtils::trim(line.substr(0, colon)));
        std::string value = StringUtils::trim(line.substr(colon + 1));

        if (field == "user-agent") {
            if (!lastWasAgent) currentAgents.clear();
            currentAgents.push_back(StringUtils::toLower(value));
            rules.m_groups[currentAgents.back()];
            lastWasAgent = true;
            continue;
        }

        lastWasAgent = false;
        if (currentAgents.empty()) continue;

        if (field == "allow" || field == "disallow") {
            // An empty Disallow allows everything
            if (value.empty()) continue;
            for (const auto& agent : currentAgents) {
                rules.m_groups[agent].push_back(Rule{value, field == "allow"});
            }
        }
    }
    return rules;
}

const std::vector<RobotsRules::Rule>* RobotsRules::rulesFor(const std::string& userAgent) const {
    std::string agent = StringUtils::toLower(userAgent);
    for (const auto& [name, rules] : m_groups) {
        if (name != "*" && !name.empty() && StringUtils::contains(agent, name)) {
            return &rules;
        }
    }
    auto wildcard = m_groups.find("*");
    return wildcard == m_groups.end() ? nullptr : &wildcard->second;
}

bool RobotsRules::allows(const std::string& path, const std::string& userAgent) const {
    const auto* rules = rulesFor(userAgent);
    if (!rules) return true;

    const Rule* best = nullptr;
    for (const auto& rule : *rules) {
        if (!StringUtils::startsWith(path, rule.prefix)) continue;
        if (!best || rule.prefix.size() > best->prefix.size()
            || (rule.prefix.size() == best->prefix.size() && rule.allow)) {
            best = &rule;
        }
    }
    return best ? best->allow : true;
}

// -- RobotsTxtPolicy --

RobotsTxtPolicy::RobotsTxtPolicy(utils::HttpTransport& transport, const utils::HttpOptions& options)
    : m_transport(transport)
    , m_options(std::make_unique<utils::HttpOptions>(options)) {}

RobotsTxtPolicy::~RobotsTxtPolicy() = default;

bool RobotsTxtPolicy::allowed(const std::string& url, const std::string& userAgent) {
    std::string normalized = UrlUtils::ensureScheme(url);
    std::string origin = UrlUtils::origin(normalized);
    if (origin.empty()) {
        return true;
    }

    std::string target = UrlUtils::path(normalized);
    auto query = normalized.find('?');
    if (query != std::string::npos) {
        target += normalized.substr(query);
    }

    std::unique_lock<std::mutex> lock(m_mutex);
    m_fetched.wait(lock, [&] { return m_pending.count(origin) == 0; });

    auto it = m_cache.find(origin);
    if (it == m_cache.end()) {
        // Fetch without the lock; other origins stay answerable meanwhile
        m_pending.insert(origin);
        lock.unlock();

        RobotsRules rules = RobotsRules::allowAll();
        try {
            rules = fetch(origin);
        } catch (const std::exception& e) {
            LOG_WARN("robots.txt lookup for {} failed: {}", origin, e.what());
        }

        lock.lock();
        m_pending.erase(origin);
        it = m_cache.emplace(origin, std::move(rules)).first;
        m_fetched.notify_all();
    }
    return it->second.allows(target, userAgent.empty() ? "*" : userAgent);
}

RobotsRules RobotsTxtPolicy::fetch(const std::string& origin) {
    std::string robotsUrl = origin + "/robots.txt";
    utils::HttpResponse response = m_transport.get(robotsUrl, *m_options);

    if (response.transportError != utils::TransportError::None) {
        LOG_WARN("Could not fetch robots.txt at {}: {}", robotsUrl, response.error);
        return RobotsRules::allowAll();
    }
    if (response.statusCode == 401 || response.statusCode == 403) {
        LOG_DEBUG("robots.txt at {} answered {}, treating as disallow all", robotsUrl, response.statusCode);
        return RobotsRules::disallowAll();
    }
    if (!response.isSuccess()) {
        return RobotsRules::allowAll();
    }
    return RobotsRules::parse(response.body);
}

} // namespace lockerfetch::sites
