#pragma once

#include <optional>
#include <string>
#include <vector>

namespace ferry {

// Source of outbound proxy settings. Resolution code asks only this
// interface; platform proxy registries would be another implementation.
class ProxyConfig {
public:
    virtual ~ProxyConfig() = default;

    // Proxy URL for `url`, or nullopt to connect directly
    virtual std::optional<std::string> proxy_for(const std::string& url) const = 0;
};

// HTTP_PROXY / HTTPS_PROXY / NO_PROXY, upper- or lowercase
class EnvProxyConfig : public ProxyConfig {
public:
    EnvProxyConfig(std::string http_proxy, std::string https_proxy, std::string no_proxy);

    static EnvProxyConfig from_environment();

    std::optional<std::string> proxy_for(const std::string& url) const override;

    // NO_PROXY match: "*", exact host, domain suffix (".example.com" or
    // "example.com"), optionally with ":port"
    bool bypasses(const std::string& host, int port) const;

private:
    std::string http_proxy_;
    std::string https_proxy_;
    std::vector<std::string> no_proxy_;
};

} // namespace ferry
