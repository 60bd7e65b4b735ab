#pragma once

#include <cstddef>
#include <memory>
#include <string>

#include "executor/orchestrator.hpp"

namespace httplib {
class Server;
}

namespace hoya::server {

struct ServerOptions {
    std::string host = "127.0.0.1";
    int port = 3000;
    std::size_t worker_threads = 8;
};

struct RouteResponse {
    int status = 200;
    std::string body;
};

// POST /execute {"url": "..."} and GET /health. Each request runs on one of the listener's
// worker threads with its own execution session.
class HttpServer {
public:
    HttpServer(executor::Orchestrator& orchestrator, ServerOptions options);
    ~HttpServer();

    HttpServer(const HttpServer&) = delete;
    HttpServer& operator=(const HttpServer&) = delete;

    // Blocks until Stop() is called or binding fails.
    bool Listen();
    void Stop();
    bool IsRunning() const;

    RouteResponse HandleExecute(const std::string& body);
    RouteResponse HandleHealth() const;

private:
    void RegisterRoutes();

    executor::Orchestrator& orchestrator_;
    ServerOptions options_;
    std::unique_ptr<httplib::Server> server_;
};

}  // namespace hoya::server
