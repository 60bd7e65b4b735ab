#include "host/http_support.hpp"

#include <cctype>

#include "httplib.h"
#include "utils/common.hpp"

namespace hoya::host {
namespace {

bool ParsePort(const std::string& text, int& port) {
    if (text.empty() || text.size() > 5) {
        return false;
    }
    for (char ch : text) {
        if (!std::isdigit(static_cast<unsigned char>(ch))) {
            return false;
        }
    }
    port = std::stoi(text);
    return port > 0 && port <= 65535;
}

bool ParseProxyHostPort(const std::string& proxy, std::string& host, int& port) {
    if (proxy.empty()) {
        return false;
    }
    std::string working = proxy;
    const auto scheme_pos = working.find("://");
    if (scheme_pos != std::string::npos) {
        working = working.substr(scheme_pos + 3);
    }
    const auto slash_pos = working.find('/');
    if (slash_pos != std::string::npos) {
        working = working.substr(0, slash_pos);
    }
    const auto colon_pos = working.rfind(':');
    if (colon_pos == std::string::npos) {
        return false;
    }
    host = working.substr(0, colon_pos);
    if (!ParsePort(working.substr(colon_pos + 1), port)) {
        return false;
    }
    return !host.empty();
}

}  // namespace

std::string ParsedUrl::Origin() const {
    std::string origin = https ? "https://" : "http://";
    if (host.find(':') != std::string::npos) {
        origin += "[" + host + "]";
    } else {
        origin += host;
    }
    return origin + ":" + std::to_string(port);
}

std::optional<ParsedUrl> ParseUrl(const std::string& url) {
    ParsedUrl parsed{};
    std::string working = url;
    const auto lowered = utils::ToLower(url.substr(0, 8));
    if (lowered.rfind("https://", 0) == 0) {
        parsed.https = true;
        working = working.substr(8);
    } else if (lowered.rfind("http://", 0) == 0) {
        parsed.https = false;
        parsed.port = 80;
        working = working.substr(7);
    } else {
        return std::nullopt;
    }

    const auto fragment_pos = working.find('#');
    if (fragment_pos != std::string::npos) {
        working = working.substr(0, fragment_pos);
    }

    const auto path_pos = working.find_first_of("/?");
    std::string host_port = working;
    if (path_pos != std::string::npos) {
        host_port = working.substr(0, path_pos);
        parsed.path = working.substr(path_pos);
        if (parsed.path.front() == '?') {
            parsed.path.insert(parsed.path.begin(), '/');
        }
    }

    const auto at_pos = host_port.rfind('@');
    if (at_pos != std::string::npos) {
        return std::nullopt;
    }

    std::string port_text;
    bool has_port = false;
    if (!host_port.empty() && host_port.front() == '[') {
        const auto close_pos = host_port.find(']');
        if (close_pos == std::string::npos) {
            return std::nullopt;
        }
        parsed.host = host_port.substr(1, close_pos - 1);
        const auto rest = host_port.substr(close_pos + 1);
        if (!rest.empty()) {
            if (rest.front() != ':') {
                return std::nullopt;
            }
            port_text = rest.substr(1);
            has_port = true;
        }
    } else {
        const auto colon_pos = host_port.find(':');
        if (colon_pos != std::string::npos) {
            parsed.host = host_port.substr(0, colon_pos);
            port_text = host_port.substr(colon_pos + 1);
            has_port = true;
        } else {
            parsed.host = host_port;
        }
    }

    if (parsed.host.empty()) {
        return std::nullopt;
    }
    for (char ch : parsed.host) {
        const auto c = static_cast<unsigned char>(ch);
        if (c <= 0x20 || c == 0x7F || ch == '/' || ch == '\\') {
            return std::nullopt;
        }
    }
    if (has_port && !ParsePort(port_text, parsed.port)) {
        return std::nullopt;
    }
    for (char ch : parsed.path) {
        const auto c = static_cast<unsigned char>(ch);
        if (c < 0x20 || c == 0x7F || ch == ' ') {
            return std::nullopt;
        }
    }
    return parsed;
}

std::string UrlPath(const std::string& url) {
    std::string working = url;
    const auto cut = working.find_first_of("?#");
    if (cut != std::string::npos) {
        working = working.substr(0, cut);
    }
    const auto scheme_pos = working.find("://");
    if (scheme_pos != std::string::npos) {
        const auto path_pos = working.find('/', scheme_pos + 3);
        return path_pos == std::string::npos ? std::string("/") : working.substr(path_pos);
    }
    return working;
}

void ApplyProxy(httplib::Client& client) {
    const char* kProxyVars[] = {"HTTPS_PROXY", "HTTP_PROXY", "https_proxy", "http_proxy"};
    for (const auto* key : kProxyVars) {
        std::string host;
        int port = 0;
        if (ParseProxyHostPort(utils::GetEnv(key), host, port)) {
            client.set_proxy(host, port);
            return;
        }
    }
}

}  // namespace hoya::host
