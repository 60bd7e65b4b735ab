#pragma once

#include <string>

namespace hoya::executor {

// Downloads guest code. Failures are raised as AppError of kind kFetch.
class PayloadFetcher {
public:
    virtual ~PayloadFetcher() = default;
    virtual std::string Download(const std::string& url) = 0;
};

struct DownloadOptions {
    int timeout_s = 30;
    bool follow_redirects = true;
    bool use_proxy = true;
};

class HttpPayloadFetcher : public PayloadFetcher {
public:
    explicit HttpPayloadFetcher(DownloadOptions options = {});

    std::string Download(const std::string& url) override;

private:
    DownloadOptions options_;
};

}  // namespace hoya::executor
