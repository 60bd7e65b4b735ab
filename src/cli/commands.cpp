#include <atomic>
#include <chrono>
#include <csignal>
#include <cstddef>
#include <cstdint>
#include <iostream>
#include <memory>
#include <string>
#include <thread>

#include "config/config_loader.hpp"
#include "executor/orchestrator.hpp"
#include "executor/payload_fetcher.hpp"
#include "nlohmann/json.hpp"
#include "server/http_server.hpp"
#include "utils/logging.hpp"

namespace {

volatile std::sig_atomic_t g_signal = 0;

void HandleSignal(int signal) {
    g_signal = signal;
}

void ApplyLogLevel(const hoya::config::Config& config) {
    hoya::utils::LogConfig log_config{};
    if (auto level = hoya::utils::ParseLogLevel(config.log.level)) {
        log_config.min_level = *level;
    } else {
        std::cerr << "[config] unknown log level '" << config.log.level << "', using INFO" << std::endl;
    }
    hoya::utils::ApplyLogConfig(log_config);
}

hoya::executor::OrchestratorOptions BuildOrchestratorOptions(const hoya::config::Config& config,
                                                             bool mirror_guest_output) {
    hoya::executor::OrchestratorOptions options{};
    options.fetch.connect_timeout_s = config.fetch.connect_timeout_s;
    options.fetch.read_timeout_s = config.fetch.read_timeout_s;
    options.fetch.follow_redirects = config.fetch.follow_redirects;
    options.fetch.use_proxy = config.fetch.use_proxy;
    options.wasm.stack_bytes = config.engine.wasm_stack_bytes > 0
        ? static_cast<std::uint32_t>(config.engine.wasm_stack_bytes)
        : 64 * 1024;
    options.wasm.entry_point = config.engine.entry_point;
    options.mirror_guest_output = mirror_guest_output;
    return options;
}

std::shared_ptr<hoya::executor::PayloadFetcher> BuildFetcher(const hoya::config::Config& config) {
    hoya::executor::DownloadOptions options{};
    options.timeout_s = config.download.timeout_s;
    options.follow_redirects = config.fetch.follow_redirects;
    options.use_proxy = config.fetch.use_proxy;
    return std::make_shared<hoya::executor::HttpPayloadFetcher>(options);
}

int RunServer() {
    const auto config = hoya::config::LoadConfig();
    ApplyLogLevel(config);

    hoya::executor::Orchestrator orchestrator(BuildFetcher(config), BuildOrchestratorOptions(config, true));

    hoya::server::ServerOptions server_options{};
    server_options.host = config.server.host;
    server_options.port = config.server.port;
    server_options.worker_threads = config.server.worker_threads > 0
        ? static_cast<std::size_t>(config.server.worker_threads)
        : 1;
    hoya::server::HttpServer http_server(orchestrator, server_options);

    hoya::utils::Log(hoya::utils::LogLevel::kWarn, "server",
                     "guest execution has no time limit; a runaway guest holds its worker thread");

    struct sigaction action {};
    action.sa_handler = HandleSignal;
    sigemptyset(&action.sa_mask);
    action.sa_flags = 0;
    sigaction(SIGINT, &action, nullptr);
    sigaction(SIGTERM, &action, nullptr);

    std::atomic<bool> listen_failed{false};
    std::thread http_thread([&http_server, &listen_failed]() {
        if (!http_server.Listen()) {
            listen_failed.store(true);
        }
    });

    std::cout << "hoya server started on " << config.server.host << ":" << config.server.port
              << ". Press Ctrl+C to stop." << std::endl;
    while (g_signal == 0 && !listen_failed.load()) {
        std::this_thread::sleep_for(std::chrono::milliseconds(200));
    }

    http_server.Stop();
    if (http_thread.joinable()) {
        http_thread.join();
    }
    return listen_failed.load() ? 1 : 0;
}

int RunOnce(const std::string& url) {
    const auto config = hoya::config::LoadConfig();
    ApplyLogLevel(config);

    hoya::executor::Orchestrator orchestrator(BuildFetcher(config), BuildOrchestratorOptions(config, false));
    try {
        const auto result = orchestrator.Execute(url);
        std::cout << hoya::executor::ToJson(result).dump(2, ' ', false,
                                                        nlohmann::json::error_handler_t::replace)
                  << std::endl;
        return 0;
    } catch (const hoya::executor::AppError& ex) {
        std::cout << hoya::executor::ToJson(hoya::executor::FromError(ex))
                         .dump(2, ' ', false, nlohmann::json::error_handler_t::replace)
                  << std::endl;
        return 1;
    }
}

void PrintUsage() {
    std::cout << "Usage: hoya serve | hoya run <url>" << std::endl;
}

}  // namespace

int main(int argc, char** argv) {
    if (argc >= 2 && std::string(argv[1]) == "serve") {
        return RunServer();
    }
    if (argc >= 3 && std::string(argv[1]) == "run") {
        return RunOnce(argv[2]);
    }
    PrintUsage();
    return argc < 2 ? 0 : 1;
}
