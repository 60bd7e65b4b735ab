#include "host/fetch_client.hpp"

#include <exception>
#include <future>

#include <boost/asio/post.hpp>

#include "host/http_support.hpp"
#include "httplib.h"
#include "utils/common.hpp"
#include "utils/logging.hpp"

namespace hoya::host {

FetchClient::FetchClient(FetchClientOptions options)
    : options_(options) {}

FetchClient::~FetchClient() {
    if (io_thread_) {
        io_thread_->join();
    }
}

boost::asio::thread_pool& FetchClient::IoThread() {
    if (!io_thread_) {
        io_thread_ = std::make_unique<boost::asio::thread_pool>(1);
    }
    return *io_thread_;
}

FetchResult FetchClient::Send(const FetchRequest& request) {
    auto task = std::make_shared<std::packaged_task<FetchResult()>>(
        [this, request]() { return Perform(request); });
    auto future = task->get_future();
    boost::asio::post(IoThread(), [task]() { (*task)(); });
    try {
        return future.get();
    } catch (const std::exception& ex) {
        return MakeFetchFailure(kFetchFailed, ex.what());
    }
}

std::size_t FetchClient::CachedOrigins() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return clients_.size();
}

httplib::Client& FetchClient::ClientFor(const std::string& origin) {
    auto it = clients_.find(origin);
    if (it != clients_.end()) {
        return *it->second;
    }
    auto client = std::make_unique<httplib::Client>(origin);
    client->set_connection_timeout(options_.connect_timeout_s);
    client->set_read_timeout(options_.read_timeout_s);
    client->set_keep_alive(true);
    client->set_follow_location(options_.follow_redirects);
    if (options_.use_proxy) {
        ApplyProxy(*client);
    }
    auto& ref = *client;
    clients_.emplace(origin, std::move(client));
    return ref;
}

FetchResult FetchClient::Perform(const FetchRequest& request) {
    const auto parsed = ParseUrl(request.url);
    if (!parsed) {
        return MakeFetchFailure(kFetchInvalidRequest, "invalid URL: " + request.url);
    }

    httplib::Request outbound;
    outbound.method = utils::ToUpper(request.method);
    outbound.path = parsed->path;
    for (const auto& [name, value] : request.headers) {
        outbound.headers.emplace(name, value);
    }
    if (request.body) {
        outbound.body = *request.body;
    }

    // The guest thread is parked on the future, so calls never overlap; the lock keeps
    // CachedOrigins() consistent for other readers.
    std::lock_guard<std::mutex> lock(mutex_);
    try {
        auto& client = ClientFor(parsed->Origin());
        auto response = client.send(outbound);
        if (!response) {
            const auto reason = httplib::to_string(response.error());
            utils::Log(utils::LogLevel::kDebug, "fetch",
                       "failed method=" + outbound.method + " url=" + request.url + " error=" + reason);
            return MakeFetchFailure(kFetchFailed, reason);
        }
        FetchResult result{};
        result.status = response->status;
        for (const auto& [name, value] : response->headers) {
            result.headers[utils::ToLower(name)] = value;
        }
        result.body = response->body;
        utils::Log(utils::LogLevel::kDebug, "fetch",
                   "done method=" + outbound.method + " url=" + request.url +
                       " status=" + std::to_string(result.status));
        return result;
    } catch (const std::exception& ex) {
        return MakeFetchFailure(kFetchFailed, ex.what());
    }
}

}  // namespace hoya::host
