// LockerFetch - HTTP Client
// Streaming HTTP transport using cpr/libcurl

#pragma once

#include <cstdint>
#include <string>
#include <map>
#include <functional>
#include <memory>
#include <optional>

namespace lockerfetch::utils {

/**
 * @brief Failure below the HTTP layer
 */
enum class TransportError {
    None,
    Timeout,
    Network,
    Aborted     // a handler asked to stop
};

/**
 * @brief Status line and headers of the final (post-redirect) response
 */
struct ResponseHead {
    int statusCode{0};
    std::string effectiveUrl;
    std::map<std::string, std::string> headers;   // keys lowercased

    std::optional<std::string> header(const std::string& name) const;
};

/**
 * @brief HTTP response structure for buffered requests
 */
struct HttpResponse {
    int statusCode{0};
    std::string body;
    std::map<std::string, std::string> headers;   // keys lowercased
    std::string effectiveUrl;
    std::string error;
    TransportError transportError{TransportError::None};
    double downloadTime{0.0};

    bool isSuccess() const {
        return transportError == TransportError::None && statusCode >= 200 && statusCode < 300;
    }

    bool isOk() const { return statusCode == 200; }
    bool isNotFound() const { return statusCode == 404; }
    bool isServerError() const { return statusCode >= 500; }
};

/**
 * @brief Outcome of a streamed request
 */
struct StreamResult {
    ResponseHead head;
    bool headDelivered{false};
    TransportError transportError{TransportError::None};
    std::string error;
    double elapsedSeconds{0.0};
};

/**
 * @brief HTTP request options
 *
 * Everything that varies per request (user agent, Range, Referer) lives
 * here so a shared client never has to be mutated.
 */
struct HttpOptions {
    std::map<std::string, std::string> headers;
    int timeoutSeconds{30};
    int connectTimeoutSeconds{10};
    bool followRedirects{true};
    int maxRedirects{5};
    bool verifySSL{true};
    std::string userAgent;
    std::string proxyUrl;
};

/**
 * @brief libcurl time limits derived from HttpOptions
 *
 * Buffered requests get a total deadline. Streams get none and are
 * instead aborted when fewer than lowSpeedLimit bytes/s arrive for
 * lowSpeedSeconds, so a long but healthy download is never cut off.
 */
struct TransferLimits {
    long totalTimeoutMs{0};         // 0 = no limit on the whole transfer
    long connectTimeoutMs{0};
    long lowSpeedLimit{0};          // bytes per second, 0 = stall detection off
    long lowSpeedSeconds{0};

    static TransferLimits forBuffered(const HttpOptions& options);
    static TransferLimits forStream(const HttpOptions& options);
};

// Called once with the final response head before any body byte; return false to abort
using HeadHandler = std::function<bool(const ResponseHead& head)>;

// Called for every body fragment; return false to abort
using DataHandler = std::function<bool(const char* data, size_t size)>;

/**
 * @brief Transport seam used by the download engine
 *
 * Implementations must be safe to call from several threads at once.
 */
class HttpTransport {
public:
    virtual ~HttpTransport() = default;

    virtual HttpResponse get(const std::string& url, const HttpOptions& options) = 0;
    virtual HttpResponse postJson(const std::string& url, const std::string& json,
                                  const HttpOptions& options) = 0;

    /**
     * Stream a GET response body through callbacks
     *
     * onHead is invoked exactly once when the request produced a response,
     * either before the first body byte or after completion for empty bodies.
     */
    virtual StreamResult stream(const std::string& url, const HttpOptions& options,
                                const HeadHandler& onHead, const DataHandler& onData) = 0;
};

/**
 * @brief cpr-backed HttpTransport
 *
 * Holds only immutable defaults; each call builds its own cpr::Session,
 * so one instance can be shared by every worker.
 */
class HttpClient : public HttpTransport {
public:
    explicit HttpClient(HttpOptions defaults = {});
    ~HttpClient() override;

    // Disable copy
    HttpClient(const HttpClient&) = delete;
    HttpClient& operator=(const HttpClient&) = delete;

    const HttpOptions& defaultOptions() const { return m_defaults; }

    HttpResponse get(const std::string& url, const HttpOptions& options) override;
    HttpResponse postJson(const std::string& url, const std::string& json,
                          const HttpOptions& options) override;
    StreamResult stream(const std::string& url, const HttpOptions& options,
                        const HeadHandler& onHead, const DataHandler& onData) override;

    // URL utilities
    static std::string urlEncode(const std::string& str);
    static std::string urlDecode(const std::string& str);

    // Parse one raw header line into head (status lines reset the header map)
    static void parseHeaderLine(const std::string& line, ResponseHead& head);

private:
    HttpOptions merged(const HttpOptions& options) const;

    HttpOptions m_defaults;
};

/**
 * @brief Global CURL initialization
 */
class CurlGlobalInit {
public:
    static void init();
};

} // namespace lockerfetch::utils
