#include <ferry/http.hpp>
#include <ferry/log.hpp>

#include <curl/curl.h>

#include <memory>
#include <mutex>

namespace ferry {

namespace {

void curl_ensure_initialized() {
    static std::once_flag once;
    std::call_once(once, [] {
        CURLcode rc = curl_global_init(CURL_GLOBAL_DEFAULT);
        if (rc != CURLE_OK) {
            log::error("curl_global_init failed: %s", curl_easy_strerror(rc));
        }
    });
}

size_t write_body(char* ptr, size_t size, size_t nmemb, void* userdata) {
    auto* body = static_cast<std::string*>(userdata);
    size_t total = size * nmemb;
    body->append(ptr, total);
    return total;
}

int check_cancel(void* clientp, curl_off_t, curl_off_t, curl_off_t, curl_off_t) {
    auto* flag = static_cast<const std::atomic<bool>*>(clientp);
    return flag->load() ? 1 : 0;
}

} // namespace

// ---- Status mapping ----

Status check_http_status(const HttpResponse& response, const std::string& url) {
    long s = response.status;
    if (s >= 200 && s < 300) return ok_status();

    std::string msg = "HTTP " + std::to_string(s) + " fetching " + url;
    if (s == 404 || s == 410) {
        return FerryError{FerryError::NotFound, msg,
                          "check that the module path and version exist"};
    }
    if (s == 408 || s == 429 || s >= 500) {
        return FerryError{FerryError::Network, msg};
    }
    return FerryError{FerryError::NotFound, msg};
}

// ---- CurlHttpClient ----

CurlHttpClient::CurlHttpClient(const ProxyConfig& proxy, HttpOptions options)
    : proxy_(proxy), options_(std::move(options)) {}

Result<HttpResponse> CurlHttpClient::get(const std::string& url) {
    if (cancelled_.load()) {
        return FerryError{FerryError::Cancelled, "request cancelled: " + url};
    }
    curl_ensure_initialized();

    std::unique_ptr<CURL, decltype(&curl_easy_cleanup)> handle{curl_easy_init(),
                                                               &curl_easy_cleanup};
    if (!handle) {
        return FerryError{FerryError::Network, "curl_easy_init failed"};
    }

    HttpResponse response;
    std::string proxy = proxy_.proxy_for(url).value_or("");

    CURLcode setopt_rc = CURLE_OK;
    auto setopt = [&setopt_rc, h = handle.get()](auto option, auto value) {
        if (setopt_rc != CURLE_OK) return;
        setopt_rc = curl_easy_setopt(h, option, value);
    };

    setopt(CURLOPT_URL, url.c_str());
    setopt(CURLOPT_FOLLOWLOCATION, 1L);
    setopt(CURLOPT_MAXREDIRS, 10L);
    setopt(CURLOPT_NOSIGNAL, 1L);
    setopt(CURLOPT_USERAGENT, options_.user_agent.c_str());
    setopt(CURLOPT_TIMEOUT, static_cast<long>(options_.timeout_secs));
    setopt(CURLOPT_CONNECTTIMEOUT, static_cast<long>(options_.connect_timeout_secs));
    // An empty string disables curl's own environment lookup
    setopt(CURLOPT_PROXY, proxy.c_str());
    setopt(CURLOPT_WRITEFUNCTION, write_body);
    setopt(CURLOPT_WRITEDATA, &response.body);
    setopt(CURLOPT_NOPROGRESS, 0L);
    setopt(CURLOPT_XFERINFOFUNCTION, check_cancel);
    setopt(CURLOPT_XFERINFODATA, &cancelled_);
    if (setopt_rc != CURLE_OK) {
        return FerryError{FerryError::Network,
                          std::string("curl_easy_setopt failed: ") +
                              curl_easy_strerror(setopt_rc)};
    }

    log::debug("GET %s%s", url.c_str(), proxy.empty() ? "" : " (via proxy)");

    CURLcode rc = curl_easy_perform(handle.get());
    if (rc == CURLE_ABORTED_BY_CALLBACK) {
        return FerryError{FerryError::Cancelled, "request cancelled: " + url};
    }
    if (rc == CURLE_OPERATION_TIMEDOUT) {
        return FerryError{FerryError::FetchTimeout,
                          "timed out after " + std::to_string(options_.timeout_secs) +
                              "s fetching " + url,
                          "raise [fetch] timeout in ferry.toml"};
    }
    if (rc != CURLE_OK) {
        return FerryError{FerryError::Network,
                          "fetching " + url + ": " + curl_easy_strerror(rc)};
    }

    curl_easy_getinfo(handle.get(), CURLINFO_RESPONSE_CODE, &response.status);

    char* content_type = nullptr;
    if (curl_easy_getinfo(handle.get(), CURLINFO_CONTENT_TYPE, &content_type) == CURLE_OK &&
        content_type) {
        response.content_type = content_type;
    }
    char* effective = nullptr;
    if (curl_easy_getinfo(handle.get(), CURLINFO_EFFECTIVE_URL, &effective) == CURLE_OK &&
        effective) {
        response.final_url = effective;
    } else {
        response.final_url = url;
    }

    log::trace("GET %s -> %ld (%zu bytes)", url.c_str(), response.status,
               response.body.size());
    return Result<HttpResponse>::ok(std::move(response));
}

} // namespace ferry
