#include "executor/orchestrator.hpp"

#include <exception>

#include "executor/execution_session.hpp"
#include "host/http_support.hpp"
#include "sandbox/quickjs_sandbox.hpp"
#include "utils/common.hpp"
#include "utils/logging.hpp"

namespace hoya::executor {
namespace {

bool EndsWith(const std::string& value, const std::string& suffix) {
    return value.size() >= suffix.size() &&
           value.compare(value.size() - suffix.size(), suffix.size(), suffix) == 0;
}

ErrorContext ContextOf(const sandbox::GuestPayload& payload, const ExecutionSession& session) {
    ErrorContext context{};
    context.kind = payload.kind;
    context.stdout_text = session.Capture().Snapshot(host::CaptureStream::kStdout);
    context.stderr_text = session.Capture().Snapshot(host::CaptureStream::kStderr);
    context.resource_size = payload.bytes.size();
    context.execution_time_ms = session.ElapsedMs();
    return context;
}

}  // namespace

Orchestrator::Orchestrator(std::shared_ptr<PayloadFetcher> fetcher, OrchestratorOptions options)
    : Orchestrator(std::move(fetcher), options,
                   std::make_unique<sandbox::QuickJsSandbox>(),
                   std::make_unique<sandbox::Wasm3Sandbox>(options.wasm)) {}

Orchestrator::Orchestrator(std::shared_ptr<PayloadFetcher> fetcher,
                           OrchestratorOptions options,
                           std::unique_ptr<sandbox::SandboxAdapter> script_adapter,
                           std::unique_ptr<sandbox::SandboxAdapter> module_adapter)
    : fetcher_(std::move(fetcher))
    , options_(std::move(options))
    , script_adapter_(std::move(script_adapter))
    , module_adapter_(std::move(module_adapter)) {}

Orchestrator::~Orchestrator() = default;

std::optional<sandbox::GuestKind> Orchestrator::Classify(const std::string& url) {
    const auto path = utils::ToLower(host::UrlPath(url));
    if (EndsWith(path, ".js")) {
        return sandbox::GuestKind::kScript;
    }
    if (EndsWith(path, ".wasm")) {
        return sandbox::GuestKind::kModule;
    }
    return std::nullopt;
}

sandbox::SandboxAdapter& Orchestrator::AdapterFor(sandbox::GuestKind kind) {
    return kind == sandbox::GuestKind::kScript ? *script_adapter_ : *module_adapter_;
}

ExecutionResult Orchestrator::Execute(const std::string& url) {
    utils::Log(utils::LogLevel::kInfo, "execute", "received url=" + url);
    const auto kind = Classify(url);
    if (!kind) {
        throw AppError::Internal("Unsupported file extension. Only .js and .wasm are supported.");
    }

    sandbox::GuestPayload payload{};
    payload.kind = *kind;
    payload.url = url;
    try {
        payload.bytes = fetcher_->Download(url);
    } catch (AppError& ex) {
        ErrorContext context{};
        context.kind = *kind;
        ex.WithContext(context);
        throw;
    } catch (const std::exception& ex) {
        ErrorContext context{};
        context.kind = *kind;
        throw AppError::Fetch(url, ex.what()).WithContext(context);
    }
    utils::Log(utils::LogLevel::kInfo, "execute",
               std::string("downloaded code_type=") + sandbox::ToString(*kind) +
                   " bytes=" + std::to_string(payload.bytes.size()));

    return RunGuest(payload);
}

ExecutionResult Orchestrator::RunGuest(const sandbox::GuestPayload& payload) {
    ExecutionSession session(options_.fetch, options_.mirror_guest_output);
    session.Advance(sandbox::ExecutionStage::kDownloaded);
    session.StartTimer();

    std::string output;
    try {
        session.Advance(sandbox::ExecutionStage::kInstantiating);
        auto instance = AdapterFor(payload.kind).Instantiate(payload, session.Bridge());
        session.Advance(sandbox::ExecutionStage::kRunning);
        output = instance->Run();
        session.Advance(sandbox::ExecutionStage::kCompleted);
    } catch (const sandbox::GuestFault& fault) {
        session.Advance(sandbox::ExecutionStage::kFaulted);
        utils::Log(utils::LogLevel::kWarn, "execute",
                   std::string("guest faulted stage=") + sandbox::ToString(fault.Stage()) +
                       " error=" + fault.what());
        if (fault.Internal()) {
            throw AppError::Internal(fault.what()).WithContext(ContextOf(payload, session));
        }
        auto error = payload.kind == sandbox::GuestKind::kScript
            ? AppError::ScriptEngine(fault.what(), fault.Stage())
            : AppError::ModuleEngine(fault.what(), fault.Stage());
        throw error.WithContext(ContextOf(payload, session));
    } catch (const std::exception& ex) {
        session.Advance(sandbox::ExecutionStage::kFaulted);
        utils::Log(utils::LogLevel::kError, "execute", std::string("host failure error=") + ex.what());
        throw AppError::Internal(ex.what()).WithContext(ContextOf(payload, session));
    }

    ExecutionResult result{};
    result.status = "success";
    result.output = std::move(output);
    result.metadata.execution_time_ms = session.ElapsedMs();
    result.stdout_text = session.Capture().Snapshot(host::CaptureStream::kStdout);
    result.stderr_text = session.Capture().Snapshot(host::CaptureStream::kStderr);
    result.metadata.code_type = sandbox::ToString(payload.kind);
    result.metadata.timestamp = utils::FormatIso8601(utils::Now());
    result.metadata.resource_size = payload.bytes.size();
    utils::Log(utils::LogLevel::kInfo, "execute",
               "completed code_type=" + result.metadata.code_type +
                   " ms=" + std::to_string(result.metadata.execution_time_ms) +
                   " fetches=" + std::to_string(session.Bridge().FetchCount()));
    return result;
}

}  // namespace hoya::executor
