#pragma once

#include <ferry/proxy.hpp>
#include <ferry/result.hpp>

#include <atomic>
#include <string>

namespace ferry {

struct HttpResponse {
    long status = 0;
    std::string body;
    std::string content_type;
    std::string final_url;   // after redirects
};

// Transport seam. Implementations return any completed HTTP exchange as a
// response; only transport failures are errors (Network, FetchTimeout,
// Cancelled).
class HttpClient {
public:
    virtual ~HttpClient() = default;
    virtual Result<HttpResponse> get(const std::string& url) = 0;
};

// Turns a non-2xx response into an error naming the URL: 404/410 ->
// NotFound, 408/429/5xx -> Network (retryable), other 4xx -> NotFound.
Status check_http_status(const HttpResponse& response, const std::string& url);

struct HttpOptions {
    int timeout_secs = 30;
    int connect_timeout_secs = 10;
    std::string user_agent = "ferry/0.1";
};

// libcurl easy-interface client. Safe to call from several threads; each
// request uses its own handle.
class CurlHttpClient : public HttpClient {
public:
    explicit CurlHttpClient(const ProxyConfig& proxy, HttpOptions options = {});

    Result<HttpResponse> get(const std::string& url) override;

    // Aborts transfers in progress and fails later requests with Cancelled
    void cancel() { cancelled_.store(true); }

private:
    const ProxyConfig& proxy_;
    HttpOptions options_;
    std::atomic<bool> cancelled_{false};
};

} // namespace ferry
