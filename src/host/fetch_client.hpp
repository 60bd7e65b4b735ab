#pragma once

#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>

#include <boost/asio/thread_pool.hpp>

#include "host/fetch_types.hpp"

namespace httplib {
class Client;
}

namespace hoya::host {

struct FetchClientOptions {
    int connect_timeout_s = 10;
    int read_timeout_s = 30;
    bool follow_redirects = true;
    bool use_proxy = true;
};

// Session-owned outbound HTTP client. One httplib::Client is kept per origin and reused
// for every later call to that origin. The client owns its own I/O thread, started on the
// first Send, so a slow exchange never holds up another session.
class FetchClient {
public:
    explicit FetchClient(FetchClientOptions options);
    ~FetchClient();

    FetchClient(const FetchClient&) = delete;
    FetchClient& operator=(const FetchClient&) = delete;

    // Blocks the calling guest thread until the I/O thread has finished the exchange.
    // Never throws; transport problems come back as FETCH_FAILED.
    FetchResult Send(const FetchRequest& request);

    std::size_t CachedOrigins() const;

private:
    FetchResult Perform(const FetchRequest& request);
    httplib::Client& ClientFor(const std::string& origin);

    boost::asio::thread_pool& IoThread();

    FetchClientOptions options_;
    std::unique_ptr<boost::asio::thread_pool> io_thread_;
    mutable std::mutex mutex_;
    std::unordered_map<std::string, std::unique_ptr<httplib::Client>> clients_;
};

}  // namespace hoya::host
