#pragma once

#include <cstddef>
#include <memory>
#include <optional>
#include <string>

#include "executor/execution_result.hpp"
#include "executor/payload_fetcher.hpp"
#include "host/fetch_client.hpp"
#include "sandbox/sandbox_adapter.hpp"
#include "sandbox/wasm3_sandbox.hpp"

namespace hoya::executor {

struct OrchestratorOptions {
    host::FetchClientOptions fetch;
    sandbox::Wasm3Options wasm;
    bool mirror_guest_output = true;
};

class Orchestrator {
public:
    Orchestrator(std::shared_ptr<PayloadFetcher> fetcher, OrchestratorOptions options);
    // Engines are injectable so the flow can be driven with other adapters.
    Orchestrator(std::shared_ptr<PayloadFetcher> fetcher,
                 OrchestratorOptions options,
                 std::unique_ptr<sandbox::SandboxAdapter> script_adapter,
                 std::unique_ptr<sandbox::SandboxAdapter> module_adapter);
    ~Orchestrator();

    Orchestrator(const Orchestrator&) = delete;
    Orchestrator& operator=(const Orchestrator&) = delete;

    // Guest kind from the URL path suffix; query and fragment are ignored.
    static std::optional<sandbox::GuestKind> Classify(const std::string& url);

    // Downloads, instantiates and runs one guest. Every failure is thrown as AppError.
    ExecutionResult Execute(const std::string& url);

private:
    ExecutionResult RunGuest(const sandbox::GuestPayload& payload);
    sandbox::SandboxAdapter& AdapterFor(sandbox::GuestKind kind);

    std::shared_ptr<PayloadFetcher> fetcher_;
    OrchestratorOptions options_;
    std::unique_ptr<sandbox::SandboxAdapter> script_adapter_;
    std::unique_ptr<sandbox::SandboxAdapter> module_adapter_;
};

}  // namespace hoya::executor
