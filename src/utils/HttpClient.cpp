/**
 * HttpClient.cpp
 * 
 * HTTP transport implementation using cpr (which wraps libcurl).
 * libcurl is used directly where cpr has no equivalent: global init,
 * the effective URL while a body is still streaming, and URL escaping.
 */

#include "HttpClient.hpp"
#include "StringUtils.hpp"

#include <cpr/cpr.h>
#include <curl/curl.h>

#include <chrono>
#include <mutex>

namespace lockerfetch::utils {

// -- CurlGlobalInit --

void CurlGlobalInit::init() {
    static std::once_flag once;
    std::call_once(once, [] { curl_global_init(CURL_GLOBAL_ALL); });
}

// -- ResponseHead --

std::optional<std::string> ResponseHead::header(const std::string& name) const {
    auto it = headers.find(StringUtils::toLower(name));
    if (it == headers.end()) return std::nullopt;
    return it->second;
}

// -- TransferLimits --

TransferLimits TransferLimits::forBuffered(const HttpOptions& options) {
    TransferLimits limits;
    limits.totalTimeoutMs = static_cast<long>(options.timeoutSeconds) * 1000;
    limits.connectTimeoutMs = static_cast<long>(options.connectTimeoutSeconds) * 1000;
    return limits;
}

TransferLimits TransferLimits::forStream(const HttpOptions& options) {
    TransferLimits limits;
    limits.connectTimeoutMs = static_cast<long>(options.connectTimeoutSeconds) * 1000;
    limits.lowSpeedLimit = 1;
    limits.lowSpeedSeconds = options.timeoutSeconds;
    return limits;
}

namespace {

void configureSession(cpr::Session& session, const std::string& url, const HttpOptions& options,
                      const TransferLimits& limits) {
    session.SetUrl(cpr::Url{url});

    cpr::Header headers;
    for (const auto& [key, value] : options.headers) headers[key] = value;
    session.SetHeader(headers);

    if (!options.userAgent.empty()) {
        session.SetUserAgent(cpr::UserAgent{options.userAgent});
    }

    if (limits.totalTimeoutMs > 0) {
        session.SetTimeout(cpr::Timeout{std::chrono::milliseconds{limits.totalTimeoutMs}});
    }
    session.SetConnectTimeout(cpr::ConnectTimeout{std::chrono::milliseconds{limits.connectTimeoutMs}});

    // Stall detection goes straight to the curl handle
    if (limits.lowSpeedLimit > 0) {
        auto holder = session.GetCurlHolder();
        if (holder && holder->handle) {
            curl_easy_setopt(holder->handle, CURLOPT_LOW_SPEED_LIMIT, limits.lowSpeedLimit);
            curl_easy_setopt(holder->handle, CURLOPT_LOW_SPEED_TIME, limits.lowSpeedSeconds);
        }
    }

    if (options.followRedirects) {
        session.SetRedirect(cpr::Redirect{static_cast<long>(options.maxRedirects)});
    } else {
        session.SetRedirect(cpr::Redirect{false});
    }

    session.SetVerifySsl(cpr::VerifySsl{options.verifySSL});

    if (!options.proxyUrl.empty()) {
        session.SetProxies(cpr::Proxies{{"http", options.proxyUrl}, {"https", options.proxyUrl}});
    }
}

TransportError classify(const cpr::Error& error) {
    if (error.code == cpr::ErrorCode::OK) return TransportError::None;
    if (error.code == cpr::ErrorCode::OPERATION_TIMEDOUT) return TransportError::Timeout;
    return TransportError::Network;
}

HttpResponse toHttpResponse(const cpr::Response& response) {
    HttpResponse result;
    result.statusCode = static_cast<int>(response.status_code);
    result.body = response.text;
    result.effectiveUrl = response.url.str();
    result.error = response.error.message;
    result.transportError = classify(response.error);
    result.downloadTime = response.elapsed;
    for (const auto& [key, value] : response.header) {
        result.headers[StringUtils::toLower(key)] = value;
    }
    return result;
}

std::string currentEffectiveUrl(CURL* handle, const std::string& fallback) {
    char* effective = nullptr;
    if (handle && curl_easy_getinfo(handle, CURLINFO_EFFECTIVE_URL, &effective) == CURLE_OK && effective) {
        return effective;
    }
    return fallback;
}

} // namespace

// -- HttpClient --

HttpClient::HttpClient(HttpOptions defaults) : m_defaults(std::move(defaults)) {
    CurlGlobalInit::init();
}

HttpClient::~HttpClient() = default;

HttpOptions HttpClient::merged(const HttpOptions& options) const {
    HttpOptions result = options;

    std::map<std::string, std::string> headers = m_defaults.headers;
    for (const auto& [key, value] : options.headers) headers[key] = value;
    result.headers = std::move(headers);

    if (result.userAgent.empty()) result.userAgent = m_defaults.userAgent;
    if (result.proxyUrl.empty()) result.proxyUrl = m_defaults.proxyUrl;
    if (result.timeoutSeconds <= 0) result.timeoutSeconds = m_defaults.timeoutSeconds > 0 ? m_defaults.timeoutSeconds : 30;
    if (result.connectTimeoutSeconds <= 0) {
        result.connectTimeoutSeconds = m_defaults.connectTimeoutSeconds > 0 ? m_defaults.connectTimeoutSeconds : 10;
    }
    if (!m_defaults.verifySSL) result.verifySSL = false;
    return result;
}

HttpResponse HttpClient::get(const std::string& url, const HttpOptions& options) {
    HttpOptions opts = merged(options);
    cpr::Session session;
    configureSession(session, url, opts, TransferLimits::forBuffered(opts));
    return toHttpResponse(session.Get());
}

HttpResponse HttpClient::postJson(const std::string& url, const std::string& json, const HttpOptions& options) {
    HttpOptions opts = options;
    opts.headers["Content-Type"] = "application/json";

    opts = merged(opts);
    cpr::Session session;
    configureSession(session, url, opts, TransferLimits::forBuffered(opts));
    session.SetBody(cpr::Body{json});
    return toHttpResponse(session.Post());
}

StreamResult HttpClient::stream(const std::string& url, const HttpOptions& options,
                                const HeadHandler& onHead, const DataHandler& onData) {
    StreamResult result;
    ResponseHead head;
    bool abortedByHandler = false;

    HttpOptions opts = merged(options);
    cpr::Session session;
    configureSession(session, url, opts, TransferLimits::forStream(opts));
    auto holder = session.GetCurlHolder();

    session.SetHeaderCallback(cpr::HeaderCallback{[&head](auto line, intptr_t) -> bool {
        parseHeaderLine(std::string(line), head);
        return true;
    }});

    session.SetWriteCallback(cpr::WriteCallback{[&](auto data, intptr_t) -> bool {
        if (!result.headDelivered) {
            result.headDelivered = true;
            head.effectiveUrl = currentEffectiveUrl(holder ? holder->handle : nullptr, url);
            if (onHead && !onHead(head)) {
                abortedByHandler = true;
                return false;
            }
        }
        if (data.size() == 0) return true;
        if (onData && !onData(data.data(), data.size())) {
            abortedByHandler = true;
            return false;
        }
        return true;
    }});

    cpr::Response response = session.Get();

    if (response.status_code > 0) head.statusCode = static_cast<int>(response.status_code);
    if (head.effectiveUrl.empty()) head.effectiveUrl = response.url.str();
    result.elapsedSeconds = response.elapsed;

    if (abortedByHandler) {
        result.transportError = TransportError::Aborted;
    } else if (response.error) {
        result.transportError = classify(response.error);
        result.error = response.error.message;
    } else if (!result.headDelivered) {
        // Empty body: the head was never seen by the write callback
        result.headDelivered = true;
        if (onHead && !onHead(head)) {
            result.transportError = TransportError::Aborted;
        }
    }

    result.head = std::move(head);
    return result;
}

void HttpClient::parseHeaderLine(const std::string& line, ResponseHead& head) {
    std::string trimmed = StringUtils::trim(line);
    if (trimmed.empty()) return;

    if (StringUtils::startsWith(trimmed, "HTTP/")) {
        // New response block (redirect hop or interim response)
        head.headers.clear();
        auto space = trimmed.find(' ');
        if (space != std::string::npos) {
            head.statusCode = static_cast<int>(StringUtils::parseLong(trimmed.substr(space + 1, 3), 0));
        }
        return;
    }

    auto colon = trimmed.find(':');
    if (colon == std::string::npos) return;
    std::string key = StringUtils::toLower(StringUtils::trim(trimmed.substr(0, colon)));
    head.headers[key] = StringUtils::trim(trimmed.substr(colon + 1));
}

std::string HttpClient::urlEncode(const std::string& str) {
    CURL* curl = curl_easy_init();
    if (!curl) return str;
    char* output = curl_easy_escape(curl, str.c_str(), static_cast<int>(str.size()));
    std::string result = output ? std::string(output) : str;
    curl_free(output);
    curl_easy_cleanup(curl);
    return result;
}

std::string HttpClient::urlDecode(const std::string& str) {
    CURL* curl = curl_easy_init();
    if (!curl) return str;
    int outLen = 0;
    char* output = curl_easy_unescape(curl, str.c_str(), static_cast<int>(str.size()), &outLen);
    std::string result = output ? std::string(output, static_cast<size_t>(outLen)) : str;
    curl_free(output);
    curl_easy_cleanup(curl);
    return result;
}

} // namespace lockerfetch::utils
