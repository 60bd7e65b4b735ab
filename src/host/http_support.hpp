#pragma once

#include <optional>
#include <string>

namespace httplib {
class Client;
}

namespace hoya::host {

struct ParsedUrl {
    bool https = true;
    std::string host;
    int port = 443;
    std::string path = "/";

    // "https://host:port", the form httplib::Client is constructed from.
    std::string Origin() const;
};

// Accepts absolute http(s) URLs only. The fragment is dropped; the query stays in path.
std::optional<ParsedUrl> ParseUrl(const std::string& url);

// Path component of a URL with query and fragment removed.
std::string UrlPath(const std::string& url);

void ApplyProxy(httplib::Client& client);

}  // namespace hoya::host
