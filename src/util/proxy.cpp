#include <ferry/proxy.hpp>
#include <ferry/url.hpp>

#include <algorithm>
#include <cctype>
#include <cstdlib>

namespace ferry {

namespace {

std::string env(const char* upper, const char* lower) {
    if (const char* v = std::getenv(upper)) {
        if (*v) return v;
    }
    if (const char* v = std::getenv(lower)) {
        if (*v) return v;
    }
    return "";
}

std::string trim_lower(const std::string& s) {
    size_t b = s.find_first_not_of(" \t");
    if (b == std::string::npos) return "";
    size_t e = s.find_last_not_of(" \t");
    std::string out = s.substr(b, e - b + 1);
    std::transform(out.begin(), out.end(), out.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return out;
}

bool ends_with(const std::string& s, const std::string& suffix) {
    return s.size() >= suffix.size() &&
           s.compare(s.size() - suffix.size(), suffix.size(), suffix) == 0;
}

} // namespace

EnvProxyConfig::EnvProxyConfig(std::string http_proxy, std::string https_proxy,
                               std::string no_proxy)
    : http_proxy_(std::move(http_proxy)), https_proxy_(std::move(https_proxy)) {
    size_t start = 0;
    while (start <= no_proxy.size()) {
        size_t comma = no_proxy.find(',', start);
        std::string entry = trim_lower(no_proxy.substr(
            start, comma == std::string::npos ? std::string::npos : comma - start));
        if (!entry.empty()) no_proxy_.push_back(entry);
        if (comma == std::string::npos) break;
        start = comma + 1;
    }
}

EnvProxyConfig EnvProxyConfig::from_environment() {
    return EnvProxyConfig(env("HTTP_PROXY", "http_proxy"),
                          env("HTTPS_PROXY", "https_proxy"),
                          env("NO_PROXY", "no_proxy"));
}

bool EnvProxyConfig::bypasses(const std::string& host, int port) const {
    for (const auto& raw : no_proxy_) {
        if (raw == "*") return true;

        std::string entry = raw;
        size_t colon = entry.rfind(':');
        if (colon != std::string::npos && entry.find(']') == std::string::npos) {
            std::string entry_port = entry.substr(colon + 1);
            entry = entry.substr(0, colon);
            if (port < 0 || entry_port != std::to_string(port)) continue;
        }
        if (!entry.empty() && entry[0] == '.') entry = entry.substr(1);
        if (entry.empty()) continue;

        if (host == entry || ends_with(host, "." + entry)) return true;
    }
    return false;
}

std::optional<std::string> EnvProxyConfig::proxy_for(const std::string& url) const {
    auto parsed = Url::parse(url);
    if (parsed.is_err()) return std::nullopt;

    const Url& u = parsed.value();
    const std::string& proxy = u.scheme == "https" ? https_proxy_ : http_proxy_;
    if (proxy.empty()) return std::nullopt;
    int port = u.port >= 0 ? u.port : (u.scheme == "https" ? 443 : 80);
    if (bypasses(u.host, port)) return std::nullopt;
    return proxy;
}

} // namespace ferry
