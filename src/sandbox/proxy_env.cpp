#include "sandbox/proxy_env.hpp"

#include <algorithm>
#include <cctype>
#include <cstdlib>

#include "utils/common.hpp"
#include "utils/logging.hpp"

namespace pyrunner::sandbox {
namespace {

constexpr const char* kSynthesizedScheme = "http://";

std::string GetEnv(const char* name) {
    const char* value = std::getenv(name);
    return value ? std::string(value) : std::string();
}

std::string FirstNonBlank(const std::string& primary, const std::string& secondary) {
    if (!utils::IsBlank(primary)) {
        return primary;
    }
    if (!utils::IsBlank(secondary)) {
        return secondary;
    }
    return {};
}

std::string ToLower(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(), [](unsigned char c) {
        return static_cast<char>(std::tolower(c));
    });
    return value;
}

bool HasIllegalChar(const std::string& url) {
    static const std::string kIllegal = "\"<>\\^`{|}";
    for (unsigned char c : url) {
        if (std::iscntrl(c) || std::isspace(c) || kIllegal.find(static_cast<char>(c)) != std::string::npos) {
            return true;
        }
    }
    return false;
}

bool IsValidScheme(const std::string& scheme) {
    if (scheme.empty() || !std::isalpha(static_cast<unsigned char>(scheme.front()))) {
        return false;
    }
    return std::all_of(scheme.begin(), scheme.end(), [](unsigned char c) {
        return std::isalnum(c) || c == '+' || c == '-' || c == '.';
    });
}

bool IsDigits(const std::string& value) {
    return !value.empty() && std::all_of(value.begin(), value.end(), [](unsigned char c) {
        return std::isdigit(c);
    });
}

void ReplaceAll(std::string& value, const std::string& from, const std::string& to) {
    std::size_t pos = 0;
    while ((pos = value.find(from, pos)) != std::string::npos) {
        value.replace(pos, from.size(), to);
        pos += to.size();
    }
}

}  // namespace

EnvSnapshot EnvSnapshot::FromProcess() {
    EnvSnapshot snapshot{};
    snapshot.http_proxy = FirstNonBlank(GetEnv("HTTP_PROXY"), GetEnv("http_proxy"));
    snapshot.https_proxy = FirstNonBlank(GetEnv("HTTPS_PROXY"), GetEnv("https_proxy"));
    snapshot.no_proxy = FirstNonBlank(GetEnv("NO_PROXY"), GetEnv("no_proxy"));
    return snapshot;
}

std::optional<ProxyUrl> ParseProxyUrl(const std::string& url) {
    if (url.empty() || HasIllegalChar(url)) {
        return std::nullopt;
    }
    const auto scheme_pos = url.find("://");
    if (scheme_pos == std::string::npos) {
        return std::nullopt;
    }

    ProxyUrl parsed{};
    parsed.scheme = url.substr(0, scheme_pos);
    if (!IsValidScheme(parsed.scheme)) {
        return std::nullopt;
    }

    std::string rest = url.substr(scheme_pos + 3);
    const auto fragment_pos = rest.find('#');
    if (fragment_pos != std::string::npos) {
        parsed.fragment = rest.substr(fragment_pos + 1);
        rest.erase(fragment_pos);
    }
    const auto query_pos = rest.find('?');
    if (query_pos != std::string::npos) {
        parsed.query = rest.substr(query_pos + 1);
        rest.erase(query_pos);
    }
    const auto path_pos = rest.find('/');
    std::string authority = rest;
    if (path_pos != std::string::npos) {
        parsed.path = rest.substr(path_pos);
        authority = rest.substr(0, path_pos);
    }

    const auto at_pos = authority.rfind('@');
    if (at_pos != std::string::npos) {
        parsed.user_info = authority.substr(0, at_pos);
        authority = authority.substr(at_pos + 1);
    }

    std::string port_part;
    if (!authority.empty() && authority.front() == '[') {
        const auto close_pos = authority.find(']');
        if (close_pos == std::string::npos) {
            return std::nullopt;
        }
        parsed.host = authority.substr(0, close_pos + 1);
        port_part = authority.substr(close_pos + 1);
        if (!port_part.empty() && port_part.front() != ':') {
            return std::nullopt;
        }
    } else {
        const auto colon_pos = authority.rfind(':');
        parsed.host = authority.substr(0, colon_pos);
        if (colon_pos != std::string::npos) {
            port_part = authority.substr(colon_pos);
        }
    }
    if (!port_part.empty()) {
        parsed.port = port_part.substr(1);
        if (!IsDigits(parsed.port)) {
            return std::nullopt;
        }
    }
    if (!parsed.host.empty() && parsed.host.front() != '[' &&
        parsed.host.find_first_of("[]@:") != std::string::npos) {
        return std::nullopt;
    }
    return parsed;
}

std::string FormatProxyUrl(const ProxyUrl& url) {
    std::string formatted = url.scheme + "://";
    if (!url.user_info.empty()) {
        formatted += url.user_info + "@";
    }
    formatted += url.host;
    if (!url.port.empty()) {
        formatted += ":" + url.port;
    }
    formatted += url.path;
    if (url.query) {
        formatted += "?" + *url.query;
    }
    if (url.fragment) {
        formatted += "#" + *url.fragment;
    }
    return formatted;
}

bool IsLoopbackHost(const std::string& host) {
    return host == "127.0.0.1" || ToLower(host) == "localhost";
}

std::string AdaptProxyForContainer(const std::string& proxy, const std::string& host_alias) {
    if (utils::IsBlank(proxy)) {
        return proxy;
    }
    const bool had_scheme = proxy.find("://") != std::string::npos;
    const std::string with_scheme = had_scheme ? proxy : kSynthesizedScheme + proxy;

    auto parsed = ParseProxyUrl(with_scheme);
    if (!parsed) {
        utils::Log(utils::LogLevel::kDebug, "proxy", "unparsable proxy url, substituting loopback literally");
        std::string replaced = proxy;
        ReplaceAll(replaced, "127.0.0.1", host_alias);
        ReplaceAll(replaced, "localhost", host_alias);
        return replaced;
    }
    if (parsed->host.empty() || !IsLoopbackHost(parsed->host)) {
        return proxy;
    }

    parsed->host = host_alias;
    auto rewritten = FormatProxyUrl(*parsed);
    if (!had_scheme && rewritten.rfind(kSynthesizedScheme, 0) == 0) {
        rewritten.erase(0, std::string(kSynthesizedScheme).size());
    }
    return rewritten;
}

}  // namespace pyrunner::sandbox
