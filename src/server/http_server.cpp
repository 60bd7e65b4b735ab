#include "server/http_server.hpp"

#include <exception>

#include "httplib.h"
#include "nlohmann/json.hpp"
#include "utils/logging.hpp"

namespace hoya::server {
namespace {

constexpr const char* kJsonContentType = "application/json";

RouteResponse RenderError(const executor::AppError& error) {
    return {error.HttpStatus(), executor::SerializeResult(executor::FromError(error))};
}

}  // namespace

HttpServer::HttpServer(executor::Orchestrator& orchestrator, ServerOptions options)
    : orchestrator_(orchestrator)
    , options_(std::move(options))
    , server_(std::make_unique<httplib::Server>()) {
    const auto workers = options_.worker_threads == 0 ? std::size_t{1} : options_.worker_threads;
    server_->new_task_queue = [workers] { return new httplib::ThreadPool(workers); };
    RegisterRoutes();
}

HttpServer::~HttpServer() = default;

void HttpServer::RegisterRoutes() {
    server_->Post("/execute", [this](const httplib::Request& req, httplib::Response& res) {
        const auto response = HandleExecute(req.body);
        res.status = response.status;
        res.set_content(response.body, kJsonContentType);
    });
    server_->Get("/health", [this](const httplib::Request&, httplib::Response& res) {
        const auto response = HandleHealth();
        res.status = response.status;
        res.set_content(response.body, kJsonContentType);
    });
}

bool HttpServer::Listen() {
    utils::Log(utils::LogLevel::kInfo, "server",
               "listening host=" + options_.host + " port=" + std::to_string(options_.port) +
                   " workers=" + std::to_string(options_.worker_threads));
    const bool ok = server_->listen(options_.host, options_.port);
    if (!ok) {
        utils::Log(utils::LogLevel::kError, "server",
                   "failed to listen on " + options_.host + ":" + std::to_string(options_.port));
    }
    return ok;
}

void HttpServer::Stop() {
    server_->stop();
}

bool HttpServer::IsRunning() const {
    return server_->is_running();
}

RouteResponse HttpServer::HandleExecute(const std::string& body) {
    const auto json = nlohmann::json::parse(body, nullptr, false);
    if (json.is_discarded() || !json.is_object() || !json.contains("url") || !json["url"].is_string()) {
        utils::Log(utils::LogLevel::kWarn, "server", "rejected malformed /execute body");
        return RenderError(executor::AppError::InvalidRequest(
            "Request body must be a JSON object with a string 'url'"));
    }
    const auto url = json["url"].get<std::string>();
    try {
        const auto result = orchestrator_.Execute(url);
        return {200, executor::SerializeResult(result)};
    } catch (const executor::AppError& ex) {
        utils::Log(utils::LogLevel::kWarn, "server",
                   std::string("execute failed code=") + ex.Code() + " url=" + url);
        return RenderError(ex);
    } catch (const std::exception& ex) {
        utils::Log(utils::LogLevel::kError, "server", std::string("unexpected failure: ") + ex.what());
        return RenderError(executor::AppError::Internal(ex.what()));
    }
}

RouteResponse HttpServer::HandleHealth() const {
    return {200, nlohmann::json{{"status", "ok"}}.dump()};
}

}  // namespace hoya::server
