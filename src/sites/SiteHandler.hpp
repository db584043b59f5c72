#pragma once

/**
 * SiteHandler.hpp
 * 
 * Capability interface implemented once per supported file host.
 */

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace lockerfetch::sites {

enum class HostKind {
    Bunkr,
    Cyberdrop,
    Unknown
};

const char* toString(HostKind kind);

/**
 * Classify a URL by host name
 */
HostKind hostKindFor(const std::string& url);

/**
 * Direct file location produced by a resolver
 */
struct ResolvedFile {
    std::string url;
    int64_t size{-1};
};

struct AlbumFile {
    std::string url;        // file page URL
    std::string name;       // empty = derive from the URL
    int64_t size{-1};
};

struct Album {
    std::string name;       // empty for a single file
    std::vector<AlbumFile> files;
};

/**
 * SiteHandler
 * 
 * Implementations are shared by all workers and must be thread-safe.
 */
class SiteHandler {
public:
    virtual ~SiteHandler() = default;

    virtual HostKind kind() const = 0;

    /**
     * Turn a file page URL into a direct download URL
     * @param pageUrl File page URL
     * @return Resolved location, nullopt if the page cannot be resolved
     */
    virtual std::optional<ResolvedFile> resolve(const std::string& pageUrl) = 0;

    /**
     * List the files behind a user-supplied URL
     * @param url Album or file URL
     * @return Album, nullopt if the URL is not understood
     */
    virtual std::optional<Album> parse(const std::string& url) = 0;
};

} // namespace lockerfetch::sites
