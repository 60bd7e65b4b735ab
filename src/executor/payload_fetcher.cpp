#include "executor/payload_fetcher.hpp"

#include "executor/app_error.hpp"
#include "host/http_support.hpp"
#include "httplib.h"
#include "utils/logging.hpp"

namespace hoya::executor {

HttpPayloadFetcher::HttpPayloadFetcher(DownloadOptions options)
    : options_(options) {}

std::string HttpPayloadFetcher::Download(const std::string& url) {
    const auto parsed = host::ParseUrl(url);
    if (!parsed) {
        throw AppError::Fetch(url, "invalid URL " + url);
    }

    httplib::Client client(parsed->Origin());
    client.set_connection_timeout(options_.timeout_s);
    client.set_read_timeout(options_.timeout_s);
    client.set_follow_location(options_.follow_redirects);
    if (options_.use_proxy) {
        host::ApplyProxy(client);
    }

    httplib::Headers headers{{"User-Agent", "hoya/1.0"}};
    auto response = client.Get(parsed->path, headers);
    if (!response) {
        throw AppError::Fetch(url, httplib::to_string(response.error()));
    }
    if (response->status < 200 || response->status >= 300) {
        throw AppError::Fetch(url, "HTTP status " + std::to_string(response->status) + " for " + url,
                              response->status);
    }
    utils::Log(utils::LogLevel::kDebug, "download",
               "url=" + url + " bytes=" + std::to_string(response->body.size()));
    return std::move(response->body);
}

}  // namespace hoya::executor
