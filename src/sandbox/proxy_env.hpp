#pragma once

#include <optional>
#include <string>

namespace pyrunner::sandbox {

// Host proxy variables captured once, so command building never reads the
// process environment itself. Each field holds the first non-blank of the
// upper- and lower-case spellings.
struct EnvSnapshot {
    std::string http_proxy;
    std::string https_proxy;
    std::string no_proxy;

    static EnvSnapshot FromProcess();
};

struct ProxyUrl {
    std::string scheme;
    std::string user_info;
    std::string host;
    std::string port;
    std::string path;
    std::optional<std::string> query;
    std::optional<std::string> fragment;
};

// scheme://[user_info@]host[:port][path][?query][#fragment]
std::optional<ProxyUrl> ParseProxyUrl(const std::string& url);

std::string FormatProxyUrl(const ProxyUrl& url);

bool IsLoopbackHost(const std::string& host);

// Points a proxy bound to host loopback at the container's host-gateway alias.
// Anything else is returned untouched.
std::string AdaptProxyForContainer(const std::string& proxy, const std::string& host_alias);

}  // namespace pyrunner::sandbox
