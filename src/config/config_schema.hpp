#pragma once

#include <string>

namespace hoya::config {

struct ServerConfig {
    std::string host = "127.0.0.1";
    int port = 3000;
    int worker_threads = 8;
};

struct FetchConfig {
    int connect_timeout_s = 10;
    int read_timeout_s = 30;
    bool follow_redirects = true;
    bool use_proxy = true;
};

struct DownloadConfig {
    int timeout_s = 30;
};

struct EngineConfig {
    int wasm_stack_bytes = 64 * 1024;
    std::string entry_point = "_start";
};

struct LogConfig {
    std::string level = "INFO";
};

struct Config {
    ServerConfig server;
    FetchConfig fetch;
    DownloadConfig download;
    EngineConfig engine;
    LogConfig log;
};

}  // namespace hoya::config
